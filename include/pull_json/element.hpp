#pragma once
#include "pull_json/error.hpp"
#include "pull_json/tokenizer.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace pj {

class Stream;

enum class Kind : std::uint8_t { Object, Array, String, Number, Boolean, Null };

const char* to_string(Kind k) noexcept;

// Cursor over one JSON value. It shares the Stream's tokenizer with every
// other Element of that Stream: navigating anywhere (decoding a value, or
// array_next() on a parent) invalidates previously returned children.
// Using a stale Element is a fatal fault, not an Error.
class Element {
public:
  Kind kind() const noexcept { return kind_; }

  // Tokenizer nesting depth: of the contents for Array/Object, of the
  // enclosing container for scalars.
  std::size_t depth() const noexcept { return depth_; }

  bool boolean() const;
  std::optional<bool> optional_boolean() const;

  // Integer decode. Numerals with more characters than T can hold (plus a
  // sign) are rejected with Errc::Overflow before any value is computed.
  template <class T> T number() const;
  template <class T> std::optional<T> optional_number() const;

  double real() const;
  std::optional<double> optional_real() const;

  // True (and consumes the literal) only for a null element.
  bool check_optional() const;

  // Next child of an array, or nullopt once the array is closed.
  std::optional<Element> array_next() const;

  // Consume the rest of this value, whatever its kind.
  void skip() const;

private:
  friend class Stream;

  static constexpr std::size_t kMaxRealChars = 64;

  Element(Stream& ctx, Kind kind, char first_char = 0);

  static std::optional<Element> classify(Stream& ctx);

  void require_kind(Kind want, const char* op) const;
  void require_fresh(const char* op) const;
  void require_open(const char* op) const;
  std::size_t read_numeral(char* buffer, std::size_t capacity) const;
  Token finalize_token() const;

  template <class T> static T parse_integer(const char* buffer, std::size_t len);

  Stream* ctx_;
  Kind kind_;
  char first_char_; // Number only: consumed during classification
  std::size_t depth_;
  std::uint64_t mark_; // Stream::bytes_consumed() when classified
  std::uint64_t seq_;  // Array/Object only: which opening this element is
};

template <class T>
T Element::number() const {
  static_assert(std::is_integral<T>::value && !std::is_same<T, bool>::value,
                "number<T>() needs an integer type");
  require_kind(Kind::Number, "number");

  // digits10 + 1 digits, + 1 sign, + 1 slot for the terminating byte
  constexpr std::size_t kCapacity = std::numeric_limits<T>::digits10 + 3;
  char buffer[kCapacity];
  const std::size_t len = read_numeral(buffer, kCapacity);
  return parse_integer<T>(buffer, len);
}

template <class T>
std::optional<T> Element::optional_number() const {
  if (check_optional()) return std::nullopt;
  return number<T>();
}

template <class T>
T Element::parse_integer(const char* buffer, std::size_t len) {
  const char* first = buffer;
  const char* last = buffer + len;
  const bool negative_unsigned = std::is_unsigned<T>::value && len > 0 && buffer[0] == '-';
  if (negative_unsigned) ++first;

  T value{};
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec == std::errc::result_out_of_range) {
    throw Error(Errc::Overflow, "'" + std::string(buffer, len) + "' is out of range");
  }
  if (ec != std::errc() || ptr != last) {
    throw Error(Errc::InvalidNumber, "'" + std::string(buffer, len) + "' is not an integer");
  }
  if (negative_unsigned && value != 0) {
    throw Error(Errc::Overflow, "'" + std::string(buffer, len) + "' is negative");
  }
  return value;
}

}
