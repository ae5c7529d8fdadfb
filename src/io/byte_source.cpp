#include "pull_json/byte_source.hpp"
#include <cerrno>
#include <cstdio>
#include <utility>
#include <vector>
#include <unistd.h>

namespace pj {

struct FileSource::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  bool opened{false};
  bool eof{false};
  int last_errno{0};
  std::uint64_t bytes{0};
  std::vector<char> buf;
  std::size_t head{0};
  std::size_t tail{0};

  ~Impl() { if (f && f != stdin) std::fclose(f); }

  bool open() {
    opened = true;
    if (path == "-") {
      f = stdin;
    } else {
      f = std::fopen(path.c_str(), "rb");
      if (!f) { last_errno = errno; return false; }
    }
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 1;
    buf.resize(cfg.chunk_bytes);
    return true;
  }

  bool refill() {
    if (eof || last_errno) return false;
    if (!opened && !open()) return false;
    if (!f) return false;

    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) last_errno = errno ? errno : EIO;
      else eof = true;
      return false;
    }
    head = 0;
    tail = n;
    return true;
  }

  bool read_byte(std::uint8_t& out) {
    if (head == tail && !refill()) return false;
    out = static_cast<std::uint8_t>(buf[head++]);
    ++bytes;
    return true;
  }
};

FileSource::FileSource(std::string path)
  : FileSource(std::move(path), Config{}) {}

FileSource::FileSource(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

FileSource::~FileSource() { delete p_; }

bool FileSource::read_byte(std::uint8_t& out) { return p_->read_byte(out); }
int  FileSource::last_error() const noexcept { return p_->last_errno; }
std::uint64_t FileSource::bytes_read() const noexcept { return p_->bytes; }

bool FdSource::read_byte(std::uint8_t& out) {
  while (true) {
    ssize_t n = ::read(fd_, &out, 1);
    if (n == 1) { ++bytes_; return true; }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    last_errno_ = errno;
    return false;
  }
}

}
