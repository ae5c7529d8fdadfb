#include "pull_json/tokenizer.hpp"
#include <algorithm>
#include <cstdio>

namespace pj {

static bool is_ws(std::uint8_t c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
static bool is_digit(std::uint8_t c) { return c >= '0' && c <= '9'; }
static bool is_hex(std::uint8_t c) {
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

Tokenizer::Tokenizer() : Tokenizer(TokenizerConfig{}) {}

Tokenizer::Tokenizer(const TokenizerConfig& cfg) : cfg_(cfg) {
  cfg_.max_depth = std::min(cfg_.max_depth, kMaxDepth);
}

void Tokenizer::reset() {
  state_ = State::TopLevelBegin;
  stack_.reset();
  depth_ = count_ = 0;
  is_integer_ = true;
  has_escapes_ = expect_key_ = string_is_key_ = failed_ = false;
  cont_lo_ = 0x80;
  cont_hi_ = 0xBF;
  err_.clear();
}

bool Tokenizer::feed(std::uint8_t c, std::optional<Token>& t1, std::optional<Token>& t2) {
  t1.reset();
  t2.reset();
  if (failed_) return false;

  bool reprocess = false;
  if (!transition(c, t1, reprocess)) return false;
  if (reprocess) {
    bool again = false;
    if (!transition(c, t2, again)) return false;
  }
  return true;
}

bool Tokenizer::fail(std::uint8_t c, const char* what) {
  char msg[160];
  if (c >= 0x20 && c < 0x7f) {
    std::snprintf(msg, sizeof(msg), "%s: unexpected '%c' in state %s", what, c, to_string(state_));
  } else {
    std::snprintf(msg, sizeof(msg), "%s: unexpected byte 0x%02x in state %s", what, c, to_string(state_));
  }
  err_ = msg;
  failed_ = true;
  return false;
}

bool Tokenizer::push(bool object) {
  if (depth_ >= cfg_.max_depth) {
    err_ = "nesting deeper than " + std::to_string(cfg_.max_depth) + " levels";
    failed_ = true;
    return false;
  }
  stack_[depth_++] = object;
  return true;
}

void Tokenizer::after_value() noexcept {
  state_ = depth_ == 0 ? State::TopLevelEnd : State::ValueEnd;
}

void Tokenizer::end_number(std::optional<Token>& token, bool& reprocess) {
  token = Token{TokenKind::Number, count_, is_integer_};
  after_value();
  reprocess = true;
}

bool Tokenizer::close(std::uint8_t c, std::optional<Token>& token) {
  if (c == ']' && depth_ > 0 && !in_object()) {
    --depth_;
    token = Token{TokenKind::ArrayEnd};
  } else if (c == '}' && in_object()) {
    --depth_;
    token = Token{TokenKind::ObjectEnd};
  } else {
    return fail(c, "mismatched closing bracket");
  }
  after_value();
  return true;
}

bool Tokenizer::begin_value(std::uint8_t c, std::optional<Token>& token) {
  if (in_object() && expect_key_ && c != '"') return fail(c, "expected object key");

  switch (c) {
    case '{':
      if (!push(true)) return false;
      expect_key_ = true;
      state_ = State::ValueBegin;
      token = Token{TokenKind::ObjectBegin};
      return true;
    case '[':
      if (!push(false)) return false;
      expect_key_ = false;
      state_ = State::ValueBegin;
      token = Token{TokenKind::ArrayBegin};
      return true;
    case '"':
      string_is_key_ = in_object() && expect_key_;
      count_ = 0;
      has_escapes_ = false;
      state_ = State::String;
      return true;
    case '-':
      count_ = 1;
      is_integer_ = true;
      state_ = State::Number;
      return true;
    case '0':
      count_ = 1;
      is_integer_ = true;
      state_ = State::NumberMaybeDotOrExponent;
      return true;
    case 't': state_ = State::TrueLiteral1; return true;
    case 'f': state_ = State::FalseLiteral1; return true;
    case 'n': state_ = State::NullLiteral1; return true;
    default:
      if (c >= '1' && c <= '9') {
        count_ = 1;
        is_integer_ = true;
        state_ = State::NumberMaybeDigitOrDotOrExponent;
        return true;
      }
      return fail(c, "expected a value");
  }
}

bool Tokenizer::transition(std::uint8_t c, std::optional<Token>& token, bool& reprocess) {
  reprocess = false;

  switch (state_) {
    case State::TopLevelBegin:
      if (is_ws(c)) return true;
      return begin_value(c, token);

    case State::TopLevelEnd:
      if (is_ws(c)) return true;
      return fail(c, "trailing characters after document");

    case State::ValueBegin:
      if (is_ws(c)) return true;
      if (c == ']' || c == '}') return close(c, token);
      return begin_value(c, token);

    case State::ValueBeginNoClosing:
      if (is_ws(c)) return true;
      return begin_value(c, token);

    case State::ValueEnd:
      if (is_ws(c)) return true;
      if (c == ',') {
        expect_key_ = in_object();
        state_ = State::ValueBeginNoClosing;
        return true;
      }
      if (c == ']' || c == '}') return close(c, token);
      return fail(c, "expected ',' or a closing bracket");

    case State::ObjectSeparator:
      if (is_ws(c)) return true;
      if (c == ':') {
        expect_key_ = false;
        state_ = State::ValueBeginNoClosing;
        return true;
      }
      return fail(c, "expected ':'");

    case State::String:
      if (c == '"') {
        token = Token{TokenKind::String, count_, has_escapes_};
        if (string_is_key_) {
          string_is_key_ = false;
          expect_key_ = false;
          state_ = State::ObjectSeparator;
        } else {
          after_value();
        }
        return true;
      }
      if (c == '\\') {
        ++count_;
        has_escapes_ = true;
        state_ = State::StringEscapeCharacter;
        return true;
      }
      if (c < 0x20) return fail(c, "control character in string");
      ++count_;
      if (c < 0x80) return true;
      // Second-byte bounds per RFC 3629 section 4: no overlongs, surrogates
      // or code points above U+10FFFF.
      cont_lo_ = 0x80;
      cont_hi_ = 0xBF;
      if (c >= 0xC2 && c <= 0xDF) { state_ = State::StringUtf8Byte2Of2; return true; }
      if (c >= 0xE0 && c <= 0xEF) {
        if (c == 0xE0) cont_lo_ = 0xA0;
        if (c == 0xED) cont_hi_ = 0x9F;
        state_ = State::StringUtf8Byte2Of3;
        return true;
      }
      if (c >= 0xF0 && c <= 0xF4) {
        if (c == 0xF0) cont_lo_ = 0x90;
        if (c == 0xF4) cont_hi_ = 0x8F;
        state_ = State::StringUtf8Byte2Of4;
        return true;
      }
      return fail(c, "invalid UTF-8 lead byte");

    case State::StringUtf8Byte2Of2:
    case State::StringUtf8Byte3Of3:
    case State::StringUtf8Byte4Of4:
    case State::StringUtf8Byte2Of3:
    case State::StringUtf8Byte2Of4:
    case State::StringUtf8Byte3Of4:
      if (c < cont_lo_ || c > cont_hi_) return fail(c, "invalid UTF-8 continuation byte");
      cont_lo_ = 0x80;
      cont_hi_ = 0xBF;
      ++count_;
      switch (state_) {
        case State::StringUtf8Byte2Of3: state_ = State::StringUtf8Byte3Of3; break;
        case State::StringUtf8Byte2Of4: state_ = State::StringUtf8Byte3Of4; break;
        case State::StringUtf8Byte3Of4: state_ = State::StringUtf8Byte4Of4; break;
        default: state_ = State::String; break;
      }
      return true;

    case State::StringEscapeCharacter:
      ++count_;
      switch (c) {
        case '"': case '\\': case '/': case 'b': case 'f': case 'n': case 'r': case 't':
          state_ = State::String;
          return true;
        case 'u':
          state_ = State::StringEscapeHexUnicode4;
          return true;
        default:
          return fail(c, "invalid escape");
      }

    case State::StringEscapeHexUnicode4:
    case State::StringEscapeHexUnicode3:
    case State::StringEscapeHexUnicode2:
    case State::StringEscapeHexUnicode1:
      if (!is_hex(c)) return fail(c, "invalid \\u escape");
      ++count_;
      switch (state_) {
        case State::StringEscapeHexUnicode4: state_ = State::StringEscapeHexUnicode3; break;
        case State::StringEscapeHexUnicode3: state_ = State::StringEscapeHexUnicode2; break;
        case State::StringEscapeHexUnicode2: state_ = State::StringEscapeHexUnicode1; break;
        default: state_ = State::String; break;
      }
      return true;

    case State::Number:
      if (c == '0') { ++count_; state_ = State::NumberMaybeDotOrExponent; return true; }
      if (c >= '1' && c <= '9') { ++count_; state_ = State::NumberMaybeDigitOrDotOrExponent; return true; }
      return fail(c, "expected a digit after '-'");

    case State::NumberMaybeDigitOrDotOrExponent:
      if (is_digit(c)) { ++count_; return true; }
      [[fallthrough]];
    case State::NumberMaybeDotOrExponent:
      if (c == '.') {
        ++count_;
        is_integer_ = false;
        state_ = State::NumberFractionalRequired;
        return true;
      }
      if (c == 'e' || c == 'E') {
        ++count_;
        is_integer_ = false;
        state_ = State::NumberExponent;
        return true;
      }
      end_number(token, reprocess);
      return true;

    case State::NumberFractionalRequired:
      if (!is_digit(c)) return fail(c, "expected a fraction digit");
      ++count_;
      state_ = State::NumberFractional;
      return true;

    case State::NumberFractional:
      if (is_digit(c)) { ++count_; return true; }
      if (c == 'e' || c == 'E') {
        ++count_;
        state_ = State::NumberExponent;
        return true;
      }
      end_number(token, reprocess);
      return true;

    case State::NumberExponent:
      if (c == '+' || c == '-') { ++count_; state_ = State::NumberExponentDigitsRequired; return true; }
      if (is_digit(c)) { ++count_; state_ = State::NumberExponentDigits; return true; }
      return fail(c, "expected an exponent");

    case State::NumberExponentDigitsRequired:
      if (!is_digit(c)) return fail(c, "expected an exponent digit");
      ++count_;
      state_ = State::NumberExponentDigits;
      return true;

    case State::NumberExponentDigits:
      if (is_digit(c)) { ++count_; return true; }
      end_number(token, reprocess);
      return true;

    case State::TrueLiteral1:
      if (c != 'r') return fail(c, "invalid literal");
      state_ = State::TrueLiteral2;
      return true;
    case State::TrueLiteral2:
      if (c != 'u') return fail(c, "invalid literal");
      state_ = State::TrueLiteral3;
      return true;
    case State::TrueLiteral3:
      if (c != 'e') return fail(c, "invalid literal");
      token = Token{TokenKind::True};
      after_value();
      return true;

    case State::FalseLiteral1:
      if (c != 'a') return fail(c, "invalid literal");
      state_ = State::FalseLiteral2;
      return true;
    case State::FalseLiteral2:
      if (c != 'l') return fail(c, "invalid literal");
      state_ = State::FalseLiteral3;
      return true;
    case State::FalseLiteral3:
      if (c != 's') return fail(c, "invalid literal");
      state_ = State::FalseLiteral4;
      return true;
    case State::FalseLiteral4:
      if (c != 'e') return fail(c, "invalid literal");
      token = Token{TokenKind::False};
      after_value();
      return true;

    case State::NullLiteral1:
      if (c != 'u') return fail(c, "invalid literal");
      state_ = State::NullLiteral2;
      return true;
    case State::NullLiteral2:
      if (c != 'l') return fail(c, "invalid literal");
      state_ = State::NullLiteral3;
      return true;
    case State::NullLiteral3:
      if (c != 'l') return fail(c, "invalid literal");
      token = Token{TokenKind::Null};
      after_value();
      return true;
  }
  return fail(c, "corrupt tokenizer state");
}

const char* to_string(State s) noexcept {
  switch (s) {
    case State::TopLevelBegin: return "TopLevelBegin";
    case State::TopLevelEnd: return "TopLevelEnd";
    case State::ValueBegin: return "ValueBegin";
    case State::ValueBeginNoClosing: return "ValueBeginNoClosing";
    case State::ValueEnd: return "ValueEnd";
    case State::ObjectSeparator: return "ObjectSeparator";
    case State::String: return "String";
    case State::StringUtf8Byte2Of2: return "StringUtf8Byte2Of2";
    case State::StringUtf8Byte2Of3: return "StringUtf8Byte2Of3";
    case State::StringUtf8Byte3Of3: return "StringUtf8Byte3Of3";
    case State::StringUtf8Byte2Of4: return "StringUtf8Byte2Of4";
    case State::StringUtf8Byte3Of4: return "StringUtf8Byte3Of4";
    case State::StringUtf8Byte4Of4: return "StringUtf8Byte4Of4";
    case State::StringEscapeCharacter: return "StringEscapeCharacter";
    case State::StringEscapeHexUnicode4: return "StringEscapeHexUnicode4";
    case State::StringEscapeHexUnicode3: return "StringEscapeHexUnicode3";
    case State::StringEscapeHexUnicode2: return "StringEscapeHexUnicode2";
    case State::StringEscapeHexUnicode1: return "StringEscapeHexUnicode1";
    case State::Number: return "Number";
    case State::NumberMaybeDotOrExponent: return "NumberMaybeDotOrExponent";
    case State::NumberMaybeDigitOrDotOrExponent: return "NumberMaybeDigitOrDotOrExponent";
    case State::NumberFractionalRequired: return "NumberFractionalRequired";
    case State::NumberFractional: return "NumberFractional";
    case State::NumberExponent: return "NumberExponent";
    case State::NumberExponentDigitsRequired: return "NumberExponentDigitsRequired";
    case State::NumberExponentDigits: return "NumberExponentDigits";
    case State::TrueLiteral1: return "TrueLiteral1";
    case State::TrueLiteral2: return "TrueLiteral2";
    case State::TrueLiteral3: return "TrueLiteral3";
    case State::FalseLiteral1: return "FalseLiteral1";
    case State::FalseLiteral2: return "FalseLiteral2";
    case State::FalseLiteral3: return "FalseLiteral3";
    case State::FalseLiteral4: return "FalseLiteral4";
    case State::NullLiteral1: return "NullLiteral1";
    case State::NullLiteral2: return "NullLiteral2";
    case State::NullLiteral3: return "NullLiteral3";
  }
  return "?";
}

const char* to_string(TokenKind k) noexcept {
  switch (k) {
    case TokenKind::ObjectBegin: return "ObjectBegin";
    case TokenKind::ObjectEnd: return "ObjectEnd";
    case TokenKind::ArrayBegin: return "ArrayBegin";
    case TokenKind::ArrayEnd: return "ArrayEnd";
    case TokenKind::String: return "String";
    case TokenKind::Number: return "Number";
    case TokenKind::True: return "True";
    case TokenKind::False: return "False";
    case TokenKind::Null: return "Null";
  }
  return "?";
}

}
