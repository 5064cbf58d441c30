#include "transfer/chunk_buffer.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace transfer {

namespace {
// Upper bound on memory reserved ahead of time
constexpr std::size_t MAX_RESERVE = 16 * 1024 * 1024;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkBuffer::ChunkBuffer(std::size_t capacity)
  : capacity_(capacity)
  , buffer_size_(0)
  , blocks_emitted_(0) {
  if (capacity_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunk buffer: Capacity must be positive";
    throw std::invalid_argument("Chunk buffer: Capacity must be positive");
  }
  buffer_.reserve(std::min(capacity_, MAX_RESERVE));
}


//==============================================
// BUFFERING
//==============================================

std::optional<Block> ChunkBuffer::accumulate(const std::string& chunk) {
  buffer_.append(chunk);
  buffer_size_ += chunk.size();

  if (buffer_size_ >= capacity_) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk buffer: Flushing block of " << buffer_size_ << " bytes";
    return take_block();
  }
  return std::nullopt;
}

std::optional<Block> ChunkBuffer::finalize() {
  if (buffer_size_ == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk buffer: Nothing left to flush";
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk buffer: Flushing final block of " << buffer_size_ << " bytes";
  return take_block();
}

Block ChunkBuffer::take_block() {
  Block block;
  block.swap(buffer_);
  buffer_size_ = 0;
  ++blocks_emitted_;
  buffer_.reserve(std::min(capacity_, MAX_RESERVE));
  return block;
}

} // namespace transfer
} // namespace docxfer
