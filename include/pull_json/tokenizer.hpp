#pragma once
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pj {

// Byte-at-a-time JSON state machine. The state is observable between bytes;
// Element classifies values by watching it change.
enum class State : std::uint8_t {
  TopLevelBegin,
  TopLevelEnd,
  ValueBegin,          // right after '[' or '{', closing allowed
  ValueBeginNoClosing, // after ',' or ':'
  ValueEnd,            // after a value inside a container
  ObjectSeparator,     // after an object key, awaiting ':'

  String,
  StringUtf8Byte2Of2,
  StringUtf8Byte2Of3,
  StringUtf8Byte3Of3,
  StringUtf8Byte2Of4,
  StringUtf8Byte3Of4,
  StringUtf8Byte4Of4,
  StringEscapeCharacter,
  StringEscapeHexUnicode4,
  StringEscapeHexUnicode3,
  StringEscapeHexUnicode2,
  StringEscapeHexUnicode1,

  Number,                          // after '-'
  NumberMaybeDotOrExponent,        // after a leading '0'
  NumberMaybeDigitOrDotOrExponent, // inside the integer part
  NumberFractionalRequired,
  NumberFractional,
  NumberExponent,
  NumberExponentDigitsRequired,
  NumberExponentDigits,

  TrueLiteral1,
  TrueLiteral2,
  TrueLiteral3,
  FalseLiteral1,
  FalseLiteral2,
  FalseLiteral3,
  FalseLiteral4,
  NullLiteral1,
  NullLiteral2,
  NullLiteral3,
};

enum class TokenKind : std::uint8_t {
  ObjectBegin,
  ObjectEnd,
  ArrayBegin,
  ArrayEnd,
  String,
  Number,
  True,
  False,
  Null,
};

struct Token {
  TokenKind kind;
  // String: raw byte length between the quotes. Number: numeral length.
  std::size_t count = 0;
  // String: escapes present. Number: integer (no fraction/exponent).
  bool flag = false;
};

struct TokenizerConfig {
  std::size_t max_depth = 256; // clamped to Tokenizer::kMaxDepth
};

class Tokenizer {
public:
  static constexpr std::size_t kMaxDepth = 256;

  Tokenizer();
  explicit Tokenizer(const TokenizerConfig& cfg);

  // Advance by one byte. A numeral is terminated by the byte after it, and
  // that byte is processed again in the after-value state, so one byte can
  // produce two tokens (e.g. `1]` -> Number, ArrayEnd). Returns false on a
  // byte that is not valid JSON here; the tokenizer stays failed afterwards.
  bool feed(std::uint8_t c, std::optional<Token>& t1, std::optional<Token>& t2);

  void reset();

  State state() const noexcept { return state_; }
  std::size_t depth() const noexcept { return depth_; }
  bool failed() const noexcept { return failed_; }
  bool complete() const noexcept { return !failed_ && state_ == State::TopLevelEnd; }
  const std::string& error() const { return err_; }

private:
  bool transition(std::uint8_t c, std::optional<Token>& token, bool& reprocess);
  bool begin_value(std::uint8_t c, std::optional<Token>& token);
  bool close(std::uint8_t c, std::optional<Token>& token);
  bool push(bool object);
  void after_value() noexcept;
  void end_number(std::optional<Token>& token, bool& reprocess);
  bool in_object() const noexcept { return depth_ > 0 && stack_[depth_ - 1]; }
  bool fail(std::uint8_t c, const char* what);

  TokenizerConfig cfg_;
  State state_{State::TopLevelBegin};
  std::bitset<kMaxDepth> stack_; // set bit: object, clear bit: array
  std::size_t depth_{0};
  std::size_t count_{0};
  bool is_integer_{true};
  bool has_escapes_{false};
  bool expect_key_{false};
  bool string_is_key_{false};
  bool failed_{false};
  std::uint8_t cont_lo_{0x80}; // bounds for the next UTF-8 continuation byte
  std::uint8_t cont_hi_{0xBF};
  std::string err_;
};

const char* to_string(State s) noexcept;
const char* to_string(TokenKind k) noexcept;

}
