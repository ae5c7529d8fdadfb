#pragma once
#include "pull_json/byte_source.hpp"
#include "pull_json/element.hpp"
#include "pull_json/tokenizer.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>

namespace pj {

// Owns the byte source and the tokenizer. Elements point back into it, so a
// Stream neither copies nor moves.
class Stream {
public:
  explicit Stream(std::unique_ptr<ByteSource> source);
  Stream(std::unique_ptr<ByteSource> source, const TokenizerConfig& cfg);

  Stream(const Stream&) = delete;
  Stream& operator=(const Stream&) = delete;

  // Classifies the first value on the first call; cached afterwards.
  Element root();

  const Tokenizer& tokenizer() const noexcept { return tokenizer_; }
  std::uint64_t bytes_consumed() const noexcept { return consumed_; }
  ByteSource& source() noexcept { return *source_; }

private:
  friend class Element;

  std::uint8_t read_byte();
  std::optional<Token> feed(std::uint8_t byte);
  void assert_state(std::initializer_list<State> valids, const char* op) const;

  std::unique_ptr<ByteSource> source_;
  Tokenizer tokenizer_;
  std::optional<Element> root_;
  std::uint64_t consumed_{0};
  std::uint64_t opened_{0}; // containers opened so far
  std::array<std::uint64_t, Tokenizer::kMaxDepth + 1> open_seq_{}; // by content depth
};

}
