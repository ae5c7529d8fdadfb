#include "pull_json/stream.hpp"
#include <cstring>
#include <string>
#include <utility>

namespace pj {

Stream::Stream(std::unique_ptr<ByteSource> source)
  : Stream(std::move(source), TokenizerConfig{}) {}

Stream::Stream(std::unique_ptr<ByteSource> source, const TokenizerConfig& cfg)
  : source_(std::move(source)), tokenizer_(cfg) {
  if (!source_) panic("Stream constructed without a byte source");
}

Element Stream::root() {
  if (!root_) {
    root_ = Element::classify(*this);
    // classify() only reports "no value" from ValueBegin
    if (!root_) panic("root: no value at top level");
  }
  return *root_;
}

std::uint8_t Stream::read_byte() {
  std::uint8_t byte = 0;
  if (source_->read_byte(byte)) return byte;
  if (int err = source_->last_error()) {
    throw Error(Errc::Io, "read failed at offset " + std::to_string(consumed_) + ": " + std::strerror(err));
  }
  throw Error(Errc::MalformedInput, "unexpected end of input at offset " + std::to_string(consumed_));
}

// Only the first token is returned. The second one can only be a
// close-array/close-object after a numeral; Element::array_next sees the
// closed array through the tokenizer depth instead.
std::optional<Token> Stream::feed(std::uint8_t byte) {
  std::optional<Token> token1;
  std::optional<Token> token2;
  const std::uint64_t offset = consumed_++;
  if (!tokenizer_.feed(byte, token1, token2)) {
    throw Error(Errc::MalformedInput, tokenizer_.error() + " at offset " + std::to_string(offset));
  }
  // Opening tokens are never the second token of a byte.
  if (token1 && (token1->kind == TokenKind::ArrayBegin || token1->kind == TokenKind::ObjectBegin)) {
    open_seq_[tokenizer_.depth()] = ++opened_;
  }
  return token1;
}

void Stream::assert_state(std::initializer_list<State> valids, const char* op) const {
  for (State valid : valids) {
    if (tokenizer_.state() == valid) return;
  }
  panic("%s: unexpected state %s", op, to_string(tokenizer_.state()));
}

}
