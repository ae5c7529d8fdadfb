#include "pull_json/byte_source.hpp"
#include "pull_json/stream.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <simdjson.h>

namespace fs = std::filesystem;

// Event trace shared by both parsers: "[", "]", "i:<v>", "b:<0|1>", "n", "s", "o".
using Trace = std::vector<std::string>;

static void trace_stream(const pj::Element& e, Trace& out) {
  switch (e.kind()) {
    case pj::Kind::Array:
      out.push_back("[");
      while (auto child = e.array_next()) trace_stream(*child, out);
      out.push_back("]");
      break;
    case pj::Kind::Number:  out.push_back("i:" + std::to_string(e.number<std::int64_t>())); break;
    case pj::Kind::Boolean: out.push_back(e.boolean() ? "b:1" : "b:0"); break;
    case pj::Kind::Null:    (void)e.check_optional(); out.push_back("n"); break;
    case pj::Kind::String:  e.skip(); out.push_back("s"); break;
    case pj::Kind::Object:  e.skip(); out.push_back("o"); break;
  }
}

static void trace_simdjson(simdjson::ondemand::value v, Trace& out) {
  switch (v.type().value()) {
    case simdjson::ondemand::json_type::array:
      out.push_back("[");
      for (auto child : v.get_array()) trace_simdjson(child.value(), out);
      out.push_back("]");
      break;
    case simdjson::ondemand::json_type::number:
      out.push_back("i:" + std::to_string(v.get_int64().value()));
      break;
    case simdjson::ondemand::json_type::boolean:
      out.push_back(v.get_bool().value() ? "b:1" : "b:0");
      break;
    case simdjson::ondemand::json_type::null:
      (void)v.is_null();
      out.push_back("n");
      break;
    // Left unread; the array iterator skips them.
    case simdjson::ondemand::json_type::string: out.push_back("s"); break;
    case simdjson::ondemand::json_type::object: out.push_back("o"); break;
    default:
      out.push_back("?");
      break;
  }
}

// Deterministic nested document: integers of every magnitude, literals,
// strings and objects, with irregular whitespace.
static fs::path make_synth(std::size_t values) {
  fs::path p = fs::temp_directory_path() / "pj_crosscheck_synth.json";
  std::ofstream out(p, std::ios::binary);
  std::uint64_t x = 0x9E3779B97F4A7C15ull;
  auto next = [&]{ x ^= x << 13; x ^= x >> 7; x ^= x << 17; return x; };

  out << "[";
  for (std::size_t i = 0; i < values; ++i) {
    if (i) out << ((i % 7) ? "," : " ,\n ");
    const std::uint64_t r = next();
    switch (r % 9) {
      case 0: out << "true"; break;
      case 1: out << "null"; break;
      case 2: out << "[" << static_cast<std::int64_t>(r) << ",[false]," << (r % 1000) << "]"; break;
      case 3: out << "\"s" << i << "\\n\""; break;
      case 4: out << "{\"k\":[" << (r % 10) << "]}"; break;
      case 5: out << "[[]]"; break;
      default: {
        const int shift = static_cast<int>(r % 63);
        std::int64_t v = static_cast<std::int64_t>(next() >> (shift + 1));
        if (r & 1) v = -v;
        out << v;
        break;
      }
    }
  }
  out << "]\n";
  out.flush();
  return p;
}

int main() {
  const fs::path in = make_synth(5000);
  if (!fs::exists(in)) { std::cerr << "[ERR] synth file not written: " << in << "\n"; return 2; }

  Trace ours;
  try {
    pj::FileSource::Config cfg;
    cfg.chunk_bytes = 4096;
    pj::Stream stream(std::make_unique<pj::FileSource>(in.string(), cfg));
    trace_stream(stream.root(), ours);
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] pull_json: " << e.what() << "\n";
    return 1;
  }

  Trace theirs;
  try {
    simdjson::ondemand::parser p;
    auto json = simdjson::padded_string::load(in.string());
    auto doc = p.iterate(json);
    trace_simdjson(doc.get_value().value(), theirs);
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] simdjson: " << e.what() << "\n";
    return 1;
  }

  if (ours.size() != theirs.size()) {
    std::cerr << "[FAIL] event counts differ: " << ours.size() << " vs " << theirs.size() << "\n";
    return 1;
  }
  for (std::size_t i = 0; i < ours.size(); ++i) {
    if (ours[i] != theirs[i]) {
      std::cerr << "[FAIL] event " << i << ": " << ours[i] << " vs " << theirs[i] << "\n";
      return 1;
    }
  }

  std::error_code ec;
  fs::remove(in, ec);
  std::cout << "[PASS] crosscheck with simdjson: events=" << ours.size() << "\n";
  return 0;
}
