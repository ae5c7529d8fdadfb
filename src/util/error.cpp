#include "pull_json/error.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace pj {

const char* to_string(Errc e) noexcept {
  switch (e) {
    case Errc::WrongElementType: return "WrongElementType";
    case Errc::Overflow:         return "Overflow";
    case Errc::InvalidNumber:    return "InvalidNumber";
    case Errc::MalformedInput:   return "MalformedInput";
    case Errc::Io:               return "Io";
  }
  return "Unknown";
}

Error::Error(Errc code, const std::string& what)
  : std::runtime_error(std::string(to_string(code)) + ": " + what), code_(code) {}

void panic(const char* fmt, ...) {
  char msg[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);
  std::cerr << "[pull_json] fatal: " << msg << std::endl;
  std::abort();
}

}
