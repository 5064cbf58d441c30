#ifndef DOCXFER_CODEC_CONFIG_HPP
#define DOCXFER_CODEC_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace docxfer {
namespace codec {

enum class Protocol : uint8_t {
  Binary = 1
};

enum class Compression : uint8_t {
  None = 0,
  Gzip = 1,
  Zlib = 2
};

struct CodecConfig {
  Protocol protocol = Protocol::Binary;
  Compression compression = Compression::Gzip;
};

const char* to_string(Protocol protocol);
const char* to_string(Compression compression);
// Parses "none", "gzip" or "zlib"
std::optional<Compression> parse_compression(const std::string& name);

} // namespace codec
} // namespace docxfer

#endif // DOCXFER_CODEC_CONFIG_HPP
