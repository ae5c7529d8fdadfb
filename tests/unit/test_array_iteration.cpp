#include "pull_json/stream.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using pj::Errc;
using pj::Kind;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

template <class Fn>
static void expect_error(Errc code, Fn fn, const std::string& what) {
  try {
    fn();
  } catch (const pj::Error& e) {
    if (e.code() != code) { std::cerr << "[FAIL] " << what << ": " << e.what() << "\n"; ++failures; }
    return;
  }
  std::cerr << "[FAIL] " << what << ": no error\n";
  ++failures;
}

static std::unique_ptr<pj::ByteSource> mem(std::string_view text) {
  return std::make_unique<pj::MemorySource>(text);
}

// Renders nested integer arrays back as text: "[[1],[2,3]]".
static std::string render(const pj::Element& e) {
  if (e.kind() != Kind::Array) return std::to_string(e.number<std::int64_t>());
  std::string out = "[";
  bool first = true;
  while (auto child = e.array_next()) {
    if (!first) out += ",";
    first = false;
    out += render(*child);
  }
  // Exhausted arrays keep reporting the end.
  if (e.array_next()) out += "<again>";
  return out + "]";
}

static void expect_render(std::string_view doc, const std::string& want) {
  try {
    pj::Stream s(mem(doc));
    std::string got = render(s.root());
    expect(got == want, std::string(doc) + " rendered as " + got);
    expect(s.tokenizer().depth() == 0, std::string(doc) + " consumed to the last bracket");
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << doc << ": " << e.what() << "\n";
    ++failures;
  }
}

int main() {
  expect_render("[]", "[]");
  expect_render("[ ]", "[]");
  expect_render("[1]", "[1]");
  expect_render("[[1]]", "[[1]]");
  expect_render("[[[]]]", "[[[]]]");
  expect_render("[[[1]]]", "[[[1]]]");
  expect_render("[[],[]]", "[[],[]]");
  expect_render("[[1],[2,3]]", "[[1],[2,3]]");
  expect_render("[ [ 1 ] , [ 2 , 3 ] ]", "[[1],[2,3]]");
  expect_render("[1,[2,[3,[4]]],5]", "[1,[2,[3,[4]]],5]");
  expect_render("[[1,2],[]]", "[[1,2],[]]");
  expect_render("[[-1]\n,\n[0]]", "[[-1],[0]]");

  {
    std::string doc = "[";
    for (int i = 0; i < 1000; ++i) { if (i) doc += ","; doc += std::to_string(i); }
    doc += "]";
    pj::Stream s(mem(doc));
    auto root = s.root();
    std::int64_t n = 0, sum = 0;
    bool ordered = true;
    while (auto e = root.array_next()) {
      auto v = e->number<std::int32_t>();
      ordered &= (v == n);
      sum += v;
      ++n;
    }
    expect(n == 1000 && sum == 499500 && ordered, "1000 children in order");
    expect(!root.array_next() && !root.array_next(), "end repeats");
    expect(s.bytes_consumed() == doc.size(), "whole document consumed");
  }
  {
    // Values this layer cannot decode are skipped.
    pj::Stream s(mem("[\"a\\\"b\", {\"k\": [1, {\"x\": null}], \"s\": \"]\"}, [true, [2]], 5, 6]"));
    auto root = s.root();
    auto str = root.array_next();
    expect(str && str->kind() == Kind::String, "string child");
    str->skip();
    auto obj = root.array_next();
    expect(obj && obj->kind() == Kind::Object, "object child");
    obj->skip();
    auto arr = root.array_next();
    expect(arr && arr->kind() == Kind::Array, "array child");
    auto t = arr->array_next();
    expect(t && t->boolean(), "first of partially read array");
    arr->skip();
    auto five = root.array_next();
    expect(five && five->kind() == Kind::Number, "number after skipped values");
    five->skip();
    auto six = root.array_next();
    expect(six && six->number<int>() == 6, "decode after skipped number");
    expect(!root.array_next(), "skip array ends");
  }
  {
    pj::Stream s(mem("[[1,2,3],4]"));
    auto root = s.root();
    root.array_next()->skip();
    expect(root.array_next()->number<int>() == 4, "skip whole unread child array");
    expect(!root.array_next(), "skip child array ends");
  }
  {
    pj::Stream s(mem("[[1, 2]]"));
    auto root = s.root();
    auto inner = root.array_next();
    expect(inner->depth() == 2 && root.depth() == 1, "content depths");
    expect(inner->array_next()->number<int>() == 1, "inner first");
    expect(inner->array_next()->number<int>() == 2, "inner second");
    expect(!inner->array_next(), "inner closed by numeral terminator");
    expect(!root.array_next(), "outer closes after inner");
    expect(s.tokenizer().complete(), "document complete");
  }

  {
    // A closed array keeps reporting its end while its parent moves on,
    // as long as no sibling container has been opened.
    pj::Stream s(mem("[[1], 2, [3]]"));
    auto root = s.root();
    auto first = root.array_next();
    expect(first->array_next()->number<int>() == 1, "first inner value");
    expect(!first->array_next(), "first inner ends");
    expect(root.array_next()->number<int>() == 2, "scalar sibling");
    expect(!first->array_next(), "closed array still ends after a scalar sibling");
    auto third = root.array_next();
    expect(third->array_next()->number<int>() == 3, "sibling array read");
    expect(!third->array_next() && !root.array_next(), "sibling and root end");
  }

  expect_error(Errc::WrongElementType, []{
    pj::Stream s(mem("true"));
    (void)s.root().array_next();
  }, "array_next on Boolean root");
  expect_error(Errc::WrongElementType, []{
    pj::Stream s(mem("{}"));
    (void)s.root().array_next();
  }, "array_next on Object root");
  expect_error(Errc::MalformedInput, []{
    pj::Stream s(mem("[1,]"));
    auto root = s.root();
    (void)root.array_next()->number<int>();
    (void)root.array_next();
  }, "trailing comma");
  expect_error(Errc::MalformedInput, []{
    pj::Stream s(mem("[true"));
    auto root = s.root();
    (void)root.array_next()->boolean();
    (void)root.array_next();
  }, "unterminated array");
  expect_error(Errc::MalformedInput, []{
    pj::Stream s(mem("[true}"));
    auto root = s.root();
    (void)root.array_next()->boolean();
    (void)root.array_next();
  }, "mismatched close");
  expect_error(Errc::MalformedInput, []{
    pj::TokenizerConfig cfg;
    cfg.max_depth = 4;
    pj::Stream s(mem("[[[[[1]]]]]"), cfg);
    auto e = s.root();
    while (e.kind() == Kind::Array) e = *e.array_next();
  }, "nesting limit");

  if (failures) return 1;
  std::cout << "[PASS] array iteration\n";
  return 0;
}
