#pragma once
#include <stdexcept>
#include <string>

namespace pj {

enum class Errc {
  WrongElementType, // accessor does not match the element's kind
  Overflow,         // numeral too long or out of range for the requested type
  InvalidNumber,    // numeral is not an integer (fraction/exponent)
  MalformedInput,   // end of input, or a byte the tokenizer rejects
  Io,               // the byte source failed
};

const char* to_string(Errc e) noexcept;

class Error : public std::runtime_error {
public:
  Error(Errc code, const std::string& what);

  Errc code() const noexcept { return code_; }

private:
  Errc code_;
};

// Internal-consistency fault: writes one line to stderr and aborts.
// Never thrown, so it cannot be caught by callers.
[[noreturn]] void panic(const char* fmt, ...);

}
