#ifndef DOCXFER_CODEC_DOCUMENT_CODEC_HPP
#define DOCXFER_CODEC_DOCUMENT_CODEC_HPP

#include <cstdint>
#include <istream>
#include <string>
#include "codec/codec_config.hpp"
#include "codec/document.hpp"

namespace docxfer {
namespace codec {

/**
 * Stream layout:
 *   header: "DXF" | version (1 byte) | protocol (1 byte) | compression (1 byte)
 *   frames: payload length (uint32, big endian) | payload
 * Each payload is one serialized document, compressed on its own.
 */
class DocumentEncoder {
public:
  DocumentEncoder(DocumentSource source, CodecConfig config);

  // Writes the next chunk into `chunk`. The first chunk is the header,
  // every following chunk is one document frame. Returns false when the
  // source is exhausted.
  bool next_chunk(std::string& chunk);

  std::size_t documents_encoded() const { return documents_encoded_; }

private:
  DocumentSource source_;
  CodecConfig config_;
  bool header_written_;
  bool exhausted_;
  std::size_t documents_encoded_;
};

class DocumentDecoder {
public:
  DocumentDecoder(std::istream& input, CodecConfig config);

  // Reads one frame and decodes it. Returns false on a clean end of
  // stream at a frame boundary; throws CodecError on a malformed stream
  // and TransferFailure when the underlying stream fails.
  bool next(Document& document);

  std::size_t bytes_read() const { return bytes_read_; }

private:
  std::istream& input_;
  CodecConfig config_;
  bool header_read_;
  std::size_t bytes_read_;

  void read_header();
  // Reads exactly `size` bytes. Returns false only when zero bytes were
  // available and `allow_eof` is set.
  bool read_exact(char* data, std::size_t size, bool allow_eof);
};

class DocumentCodec {
public:
  static constexpr char MAGIC[3] = {'D', 'X', 'F'};
  static constexpr uint8_t FORMAT_VERSION = 1;
  static constexpr std::size_t HEADER_SIZE = 6;
  static constexpr uint32_t MAX_FRAME_SIZE = 1u << 30;

  // ---- STREAM CODEC ----
  static DocumentEncoder encode(DocumentSource source, const CodecConfig& config);
  static DocumentDecoder decode(std::istream& input, const CodecConfig& config);


  // ---- DOCUMENT CODEC ----
  // Serializes and compresses a single document into a frame payload
  static std::string encode_document(const Document& document, const CodecConfig& config);
  // Decompresses and deserializes a frame payload
  static Document decode_document(const std::string& payload, const CodecConfig& config);
  static std::string make_header(const CodecConfig& config);
  // Narrows a size to a 32-bit length prefix, throws CodecError when it
  // does not fit
  static uint32_t length_prefix(std::size_t size);

private:
  // ---- SERIALIZATION ----
  static void write_field(std::string& out, const std::string& value);
  static void write_u32(std::string& out, uint32_t value);
  static std::string read_field(const std::string& in, std::size_t& offset);
  static uint32_t read_u32(const std::string& in, std::size_t& offset);


  // ---- COMPRESSION ----
  static std::string compress(const std::string& data, Compression compression);
  static std::string decompress(const std::string& data, Compression compression);
};

} // namespace codec
} // namespace docxfer

#endif // DOCXFER_CODEC_DOCUMENT_CODEC_HPP
