#include "pull_json/byte_source.hpp"
#include "pull_json/element.hpp"
#include "pull_json/error.hpp"
#include "pull_json/stream.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

struct Cli {
  std::string width = "i64"; // i8|u8|i16|u16|i32|u32|i64|u64|real
  std::size_t chunk_bytes = 64 * 1024;
  std::uint64_t max_items = 0; // per array; 0 = unlimited
  bool quiet = false;
  std::string input;
};

void usage(std::ostream& os) {
  os << "Usage: pull-json-walk [--width=i8|u8|i16|u16|i32|u32|i64|u64|real]\n"
        "                      [--chunk-bytes=N] [--max-items=N] [--quiet] <file|->\n";
}

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_u = [&](const char* pfx, auto* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoull(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    if (eat("--width=", &c.width)) continue;
    if (eat_u("--chunk-bytes=", &c.chunk_bytes)) continue;
    if (eat_u("--max-items=", &c.max_items)) continue;
    if (a == "--quiet") { c.quiet = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "[walk] unknown flag: " << a << "\n"; return false; }
    c.input = a;
  }
  static const char* widths[] = {"i8","u8","i16","u16","i32","u32","i64","u64","real"};
  bool known = false;
  for (auto w : widths) known |= (c.width == w);
  if (!known) { std::cerr << "[walk] unknown width: " << c.width << "\n"; return false; }
  return !c.input.empty();
}

struct Walker {
  const Cli& cli;
  std::uint64_t values = 0;

  void print(const std::string& path, const std::string& text) {
    ++values;
    if (!cli.quiet) std::cout << (path.empty() ? "." : path) << " " << text << "\n";
  }

  std::string number_text(const pj::Element& e) const {
    const std::string& w = cli.width;
    if (w == "real") return std::to_string(e.real());
    if (w == "i8")   return std::to_string(static_cast<int>(e.number<std::int8_t>()));
    if (w == "u8")   return std::to_string(static_cast<unsigned>(e.number<std::uint8_t>()));
    if (w == "i16")  return std::to_string(e.number<std::int16_t>());
    if (w == "u16")  return std::to_string(e.number<std::uint16_t>());
    if (w == "i32")  return std::to_string(e.number<std::int32_t>());
    if (w == "u32")  return std::to_string(e.number<std::uint32_t>());
    if (w == "u64")  return std::to_string(e.number<std::uint64_t>());
    return std::to_string(e.number<std::int64_t>());
  }

  void walk(const pj::Element& e, const std::string& path) {
    switch (e.kind()) {
      case pj::Kind::Array: {
        std::uint64_t i = 0;
        while (auto child = e.array_next()) {
          if (cli.max_items && i == cli.max_items) {
            child->skip();
            e.skip();
            print(path, "<truncated>");
            break;
          }
          walk(*child, path + "[" + std::to_string(i++) + "]");
        }
        break;
      }
      case pj::Kind::Object:
        e.skip();
        print(path, "<object>");
        break;
      case pj::Kind::String:
        e.skip();
        print(path, "<string>");
        break;
      case pj::Kind::Number:
        print(path, number_text(e));
        break;
      case pj::Kind::Boolean:
        print(path, e.boolean() ? "true" : "false");
        break;
      case pj::Kind::Null:
        (void)e.check_optional();
        print(path, "null");
        break;
    }
  }
};

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return 2; }
  } catch (const std::exception& e) {
    std::cerr << "[walk] bad flag value: " << e.what() << "\n";
    return 2;
  }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  pj::FileSource::Config rcfg;
  rcfg.chunk_bytes = cli.chunk_bytes;
  pj::Stream stream(std::make_unique<pj::FileSource>(cli.input, rcfg));

  Walker walker{cli};
  try {
    walker.walk(stream.root(), "");
  } catch (const pj::Error& e) {
    std::cerr << "[walk] error: " << cli.input << ": " << e.what() << "\n";
    return 1;
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  std::cerr << "[walk] ok: " << cli.input
            << " values=" << walker.values
            << " bytes=" << stream.bytes_consumed()
            << " time=" << wall_ms << "ms\n";
  return 0;
}
