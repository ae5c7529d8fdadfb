#include "pull_json/element.hpp"
#include "pull_json/stream.hpp"

#include <fast_float/fast_float.h>
#include <string>

namespace pj {

const char* to_string(Kind k) noexcept {
  switch (k) {
    case Kind::Object:  return "Object";
    case Kind::Array:   return "Array";
    case Kind::String:  return "String";
    case Kind::Number:  return "Number";
    case Kind::Boolean: return "Boolean";
    case Kind::Null:    return "Null";
  }
  return "?";
}

Element::Element(Stream& ctx, Kind kind, char first_char)
  : ctx_(&ctx), kind_(kind), first_char_(first_char),
    depth_(ctx.tokenizer_.depth()), mark_(ctx.consumed_), seq_(ctx.opened_) {}

// Reads until the tokenizer either emits a container token or leaves the
// entry state; the bytes consumed are exactly those that decide the kind.
std::optional<Element> Element::classify(Stream& ctx) {
  ctx.assert_state({State::ValueBegin, State::ValueBeginNoClosing, State::TopLevelBegin}, "classify");

  const State start = ctx.tokenizer_.state();
  while (true) {
    const std::uint8_t byte = ctx.read_byte();

    if (auto token = ctx.feed(byte)) {
      switch (token->kind) {
        case TokenKind::ArrayBegin:  return Element(ctx, Kind::Array);
        case TokenKind::ObjectBegin: return Element(ctx, Kind::Object);
        case TokenKind::ArrayEnd:
          if (start == State::ValueBegin) return std::nullopt; // `[]`
          break;
        default:
          break;
      }
      panic("Element unrecognized: token %s", to_string(token->kind));
    }

    const State now = ctx.tokenizer_.state();
    if (now == start) continue;

    switch (now) {
      case State::String:
        return Element(ctx, Kind::String);
      case State::Number:
      case State::NumberMaybeDotOrExponent:
      case State::NumberMaybeDigitOrDotOrExponent:
        return Element(ctx, Kind::Number, static_cast<char>(byte));
      case State::TrueLiteral1:
      case State::FalseLiteral1:
        return Element(ctx, Kind::Boolean);
      case State::NullLiteral1:
        return Element(ctx, Kind::Null);
      default:
        panic("Element unrecognized: state %s", to_string(now));
    }
  }
}

void Element::require_kind(Kind want, const char* op) const {
  if (kind_ != want) {
    throw Error(Errc::WrongElementType,
                std::string(op) + "() on a " + to_string(kind_) + " element");
  }
}

void Element::require_fresh(const char* op) const {
  if (ctx_->consumed_ != mark_) {
    panic("%s: stale %s element (classified at offset %llu, stream at %llu)", op,
          to_string(kind_), static_cast<unsigned long long>(mark_),
          static_cast<unsigned long long>(ctx_->consumed_));
  }
}

// A sibling container opened since classification now owns this depth.
void Element::require_open(const char* op) const {
  if (ctx_->open_seq_[depth_] != seq_) {
    panic("%s: stale %s element (opening #%llu, depth %zu now holds #%llu)", op,
          to_string(kind_), static_cast<unsigned long long>(seq_), depth_,
          static_cast<unsigned long long>(ctx_->open_seq_[depth_]));
  }
}

Token Element::finalize_token() const {
  while (true) {
    if (auto token = ctx_->feed(ctx_->read_byte())) return *token;
  }
}

bool Element::boolean() const {
  require_kind(Kind::Boolean, "boolean");
  require_fresh("boolean");
  ctx_->assert_state({State::TrueLiteral1, State::FalseLiteral1}, "boolean");

  const Token token = finalize_token();
  switch (token.kind) {
    case TokenKind::True:  return true;
    case TokenKind::False: return false;
    default: panic("boolean: token unrecognized: %s", to_string(token.kind));
  }
}

std::optional<bool> Element::optional_boolean() const {
  if (check_optional()) return std::nullopt;
  return boolean();
}

// buffer[0] is the byte classification already consumed. Bytes are appended
// until the tokenizer reports the numeral; the terminating byte is not stored.
std::size_t Element::read_numeral(char* buffer, std::size_t capacity) const {
  require_fresh("number");
  ctx_->assert_state({State::Number, State::NumberMaybeDotOrExponent,
                      State::NumberMaybeDigitOrDotOrExponent}, "number");

  buffer[0] = first_char_;
  for (std::size_t len = 1; len < capacity; ++len) {
    const std::uint8_t byte = ctx_->read_byte();

    if (auto token = ctx_->feed(byte)) {
      if (token->kind != TokenKind::Number) {
        panic("number: token unrecognized: %s", to_string(token->kind));
      }
      if (token->count != len) {
        panic("number: tokenizer counted %zu characters, buffered %zu", token->count, len);
      }
      return len;
    }
    buffer[len] = static_cast<char>(byte);
  }

  throw Error(Errc::Overflow, "numeral longer than " + std::to_string(capacity - 1) +
                              " characters at offset " + std::to_string(mark_ - 1));
}

double Element::real() const {
  require_kind(Kind::Number, "real");

  char buffer[kMaxRealChars];
  const std::size_t len = read_numeral(buffer, kMaxRealChars);

  double value = 0.0;
  auto answer = fast_float::from_chars(buffer, buffer + len, value);
  if (answer.ec == std::errc::result_out_of_range) {
    throw Error(Errc::Overflow, "'" + std::string(buffer, len) + "' is out of range");
  }
  if (answer.ec != std::errc() || answer.ptr != buffer + len) {
    throw Error(Errc::InvalidNumber, "'" + std::string(buffer, len) + "' is not a number");
  }
  return value;
}

std::optional<double> Element::optional_real() const {
  if (check_optional()) return std::nullopt;
  return real();
}

bool Element::check_optional() const {
  if (kind_ != Kind::Null) return false;
  require_fresh("check_optional");
  ctx_->assert_state({State::NullLiteral1}, "check_optional");

  const Token token = finalize_token();
  if (token.kind != TokenKind::Null) {
    panic("check_optional: token unrecognized: %s", to_string(token.kind));
  }
  return true;
}

std::optional<Element> Element::array_next() const {
  require_kind(Kind::Array, "array_next");

  Stream& ctx = *ctx_;
  const Tokenizer& tok = ctx.tokenizer_;

  // Closed already, possibly by the byte that terminated a numeral child.
  // Covers TopLevelEnd for a root array.
  if (tok.depth() < depth_) return std::nullopt;
  require_open("array_next");
  if (tok.depth() > depth_) {
    panic("array_next: child value not finished (depth %zu, array at %zu, state %s)",
          tok.depth(), depth_, to_string(tok.state()));
  }

  switch (tok.state()) {
    case State::ValueBegin:
    case State::ValueBeginNoClosing:
      return classify(ctx);

    case State::ValueEnd:
      while (true) {
        if (auto token = ctx.feed(ctx.read_byte())) {
          if (token->kind == TokenKind::ArrayEnd) return std::nullopt;
          panic("array_next: token unrecognized: %s", to_string(token->kind));
        }
        if (tok.state() == State::ValueBeginNoClosing) return classify(ctx);
      }

    default:
      panic("array_next: state unrecognized: %s", to_string(tok.state()));
  }
}

void Element::skip() const {
  Stream& ctx = *ctx_;

  if (kind_ == Kind::Array || kind_ == Kind::Object) {
    // The closing byte takes the tokenizer below the contents' depth.
    if (ctx.tokenizer_.depth() >= depth_) require_open("skip");
    while (ctx.tokenizer_.depth() >= depth_) ctx.feed(ctx.read_byte());
    return;
  }

  require_fresh("skip");
  const Token token = finalize_token();
  bool matches = false;
  switch (kind_) {
    case Kind::String:  matches = token.kind == TokenKind::String; break;
    case Kind::Number:  matches = token.kind == TokenKind::Number; break;
    case Kind::Boolean: matches = token.kind == TokenKind::True || token.kind == TokenKind::False; break;
    case Kind::Null:    matches = token.kind == TokenKind::Null; break;
    default: break;
  }
  if (!matches) panic("skip: token %s ends a %s element", to_string(token.kind), to_string(kind_));
}

}
