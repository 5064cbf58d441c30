#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "config/transfer_config.hpp"

namespace docxfer {
namespace transfer {

// A write-sized run of encoded chunks
using Block = std::string;

// Groups encoded chunks into blocks of at least `capacity` bytes. A chunk
// is never split: the capacity check runs after each append, so a block
// may exceed capacity by up to one chunk.
class ChunkBuffer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkBuffer(std::size_t capacity = config::DEFAULT_BLOCK_CAPACITY);


  // ---- BUFFERING ----
  // Appends a chunk and returns the completed block once the buffered
  // size reaches capacity
  std::optional<Block> accumulate(const std::string& chunk);
  // Returns whatever is left, or nothing when the buffer is empty
  std::optional<Block> finalize();


  // ---- GETTERS ----
  std::size_t capacity() const { return capacity_; }
  std::size_t buffered_size() const { return buffer_size_; }
  std::size_t blocks_emitted() const { return blocks_emitted_; }

private:
  // ---- PARAMETERS ----
  std::size_t capacity_;
  std::size_t buffer_size_;
  std::size_t blocks_emitted_;
  std::string buffer_;

  // Hands out the buffered bytes and resets the counter
  Block take_block();
};

} // namespace transfer
} // namespace docxfer
