#ifndef DOCXFER_CONFIG_TRANSFER_CONFIG_HPP
#define DOCXFER_CONFIG_TRANSFER_CONFIG_HPP

#include <cstddef>
#include "codec/codec_config.hpp"

namespace docxfer {
namespace config {

// Kept under the smallest multipart part size of common object stores
inline constexpr std::size_t DEFAULT_BLOCK_CAPACITY = 4 * 1024 * 1024 - 1024;

// Settings shared by the upload and download sides of a transfer. Both
// sides must agree on the codec settings for a stored object to decode.
struct TransferConfig {
  std::size_t block_capacity = DEFAULT_BLOCK_CAPACITY;
  codec::CodecConfig codec;
};

} // namespace config
} // namespace docxfer

#endif // DOCXFER_CONFIG_TRANSFER_CONFIG_HPP
