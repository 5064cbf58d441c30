#include "codec/codec_config.hpp"

namespace docxfer {
namespace codec {

const char* to_string(Protocol protocol) {
  switch (protocol) {
    case Protocol::Binary: return "binary";
    default:               return "unknown";
  }
}

const char* to_string(Compression compression) {
  switch (compression) {
    case Compression::None: return "none";
    case Compression::Gzip: return "gzip";
    case Compression::Zlib: return "zlib";
    default:                return "unknown";
  }
}

std::optional<Compression> parse_compression(const std::string& name) {
  if (name == "none") return Compression::None;
  if (name == "gzip") return Compression::Gzip;
  if (name == "zlib") return Compression::Zlib;
  return std::nullopt;
}

} // namespace codec
} // namespace docxfer
