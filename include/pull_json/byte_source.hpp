#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pj {

// Sequential, forward-only, blocking byte reader.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // False at end of input or on an I/O error; last_error() tells them apart.
  virtual bool read_byte(std::uint8_t& out) = 0;

  // errno of the last failure, 0 for a clean end of input.
  virtual int last_error() const noexcept { return 0; }
  virtual std::uint64_t bytes_read() const noexcept = 0;
};

// Caller keeps the bytes alive.
class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string_view data) : data_(data) {}

  bool read_byte(std::uint8_t& out) override {
    if (pos_ >= data_.size()) return false;
    out = static_cast<std::uint8_t>(data_[pos_++]);
    return true;
  }
  std::uint64_t bytes_read() const noexcept override { return pos_; }

private:
  std::string_view data_;
  std::size_t pos_{0};
};

class FileSource : public ByteSource {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // 64 KiB
  };

  explicit FileSource(std::string path);     // uses default Config{}; "-" is stdin
  FileSource(std::string path, Config cfg);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  bool read_byte(std::uint8_t& out) override;
  int  last_error() const noexcept override;
  std::uint64_t bytes_read() const noexcept override;

private:
  struct Impl; Impl* p_;
};

// Unbuffered: one read(2) per byte. Does not own the descriptor.
class FdSource : public ByteSource {
public:
  explicit FdSource(int fd) : fd_(fd) {}

  bool read_byte(std::uint8_t& out) override;
  int  last_error() const noexcept override { return last_errno_; }
  std::uint64_t bytes_read() const noexcept override { return bytes_; }

private:
  int fd_;
  int last_errno_{0};
  std::uint64_t bytes_{0};
};

}
