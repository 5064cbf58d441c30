#include "codec/document_codec.hpp"
#include "core/errors.hpp"
#include <cstring>
#include <limits>
#include <sstream>
#include <boost/endian/conversion.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace codec {

using core::CodecError;
using core::TransferFailure;

//==============================================
// ENCODER
//==============================================

DocumentEncoder::DocumentEncoder(DocumentSource source, CodecConfig config)
  : source_(std::move(source))
  , config_(config)
  , header_written_(false)
  , exhausted_(false)
  , documents_encoded_(0) {}

bool DocumentEncoder::next_chunk(std::string& chunk) {
  if (!header_written_) {
    chunk = DocumentCodec::make_header(config_);
    header_written_ = true;
    return true;
  }

  if (exhausted_) {
    return false;
  }

  Document document;
  if (!source_(document)) {
    exhausted_ = true;
    BOOST_LOG_TRIVIAL(debug) << "Codec: Source exhausted after " << documents_encoded_ << " documents";
    return false;
  }

  std::string payload = DocumentCodec::encode_document(document, config_);
  if (payload.size() > DocumentCodec::MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Document " << document.id << " encodes to " << payload.size() << " bytes";
    throw CodecError("document '" + document.id + "' exceeds the maximum frame size");
  }

  // Frame is length prefix in network byte order followed by the payload
  uint32_t network_size = boost::endian::native_to_big(static_cast<uint32_t>(payload.size()));
  chunk.assign(reinterpret_cast<const char*>(&network_size), sizeof(network_size));
  chunk += payload;

  ++documents_encoded_;
  return true;
}


//==============================================
// DECODER
//==============================================

DocumentDecoder::DocumentDecoder(std::istream& input, CodecConfig config)
  : input_(input)
  , config_(config)
  , header_read_(false)
  , bytes_read_(0) {}

bool DocumentDecoder::next(Document& document) {
  if (!header_read_) {
    read_header();
  }

  uint32_t network_size;
  if (!read_exact(reinterpret_cast<char*>(&network_size), sizeof(network_size), true)) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: End of stream after " << bytes_read_ << " bytes";
    return false;
  }

  uint32_t size = boost::endian::big_to_native(network_size);
  if (size > DocumentCodec::MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Frame size " << size << " exceeds limit";
    throw CodecError("frame size " + std::to_string(size) + " exceeds limit");
  }

  std::string payload(size, '\0');
  read_exact(payload.data(), size, false);
  document = DocumentCodec::decode_document(payload, config_);
  return true;
}

void DocumentDecoder::read_header() {
  char header[DocumentCodec::HEADER_SIZE];
  if (!read_exact(header, sizeof(header), true)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Stream is empty, header missing";
    throw CodecError("stream is empty, header missing");
  }

  if (header[0] != DocumentCodec::MAGIC[0] || header[1] != DocumentCodec::MAGIC[1] ||
      header[2] != DocumentCodec::MAGIC[2]) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Bad stream magic";
    throw CodecError("not a document stream (bad magic)");
  }

  uint8_t version = static_cast<uint8_t>(header[3]);
  if (version != DocumentCodec::FORMAT_VERSION) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unsupported format version " << static_cast<int>(version);
    throw CodecError("unsupported format version " + std::to_string(version));
  }

  // Tags recorded at push time must match what this side is configured for
  uint8_t protocol = static_cast<uint8_t>(header[4]);
  if (protocol != static_cast<uint8_t>(config_.protocol)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Protocol mismatch, stream has " << static_cast<int>(protocol)
                             << ", expected " << to_string(config_.protocol);
    throw CodecError("protocol mismatch: stream tag " + std::to_string(protocol) +
                     ", expected " + to_string(config_.protocol));
  }

  uint8_t compression = static_cast<uint8_t>(header[5]);
  if (compression != static_cast<uint8_t>(config_.compression)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Compression mismatch, stream has " << static_cast<int>(compression)
                             << ", expected " << to_string(config_.compression);
    throw CodecError("compression mismatch: stream tag " + std::to_string(compression) +
                     ", expected " + to_string(config_.compression));
  }

  header_read_ = true;
  BOOST_LOG_TRIVIAL(debug) << "Codec: Stream header verified (" << to_string(config_.protocol)
                           << ", " << to_string(config_.compression) << ")";
}

bool DocumentDecoder::read_exact(char* data, std::size_t size, bool allow_eof) {
  input_.read(data, static_cast<std::streamsize>(size));
  std::size_t got = static_cast<std::size_t>(input_.gcount());
  bytes_read_ += got;

  if (input_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Read failed after " << bytes_read_ << " bytes";
    throw TransferFailure("read failed after " + std::to_string(bytes_read_) + " bytes");
  }

  if (got == size) {
    return true;
  }

  if (got == 0 && allow_eof) {
    return false;
  }

  BOOST_LOG_TRIVIAL(error) << "Codec: Truncated stream, expected " << size << " bytes, got " << got;
  throw CodecError("truncated stream: expected " + std::to_string(size) +
                   " bytes, got " + std::to_string(got));
}


//==============================================
// STREAM CODEC
//==============================================

DocumentEncoder DocumentCodec::encode(DocumentSource source, const CodecConfig& config) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Creating encoder (" << to_string(config.protocol)
                           << ", " << to_string(config.compression) << ")";
  return DocumentEncoder(std::move(source), config);
}

DocumentDecoder DocumentCodec::decode(std::istream& input, const CodecConfig& config) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Creating decoder (" << to_string(config.protocol)
                           << ", " << to_string(config.compression) << ")";
  return DocumentDecoder(input, config);
}

std::string DocumentCodec::make_header(const CodecConfig& config) {
  std::string header(MAGIC, sizeof(MAGIC));
  header.push_back(static_cast<char>(FORMAT_VERSION));
  header.push_back(static_cast<char>(config.protocol));
  header.push_back(static_cast<char>(config.compression));
  return header;
}


//==============================================
// DOCUMENT CODEC
//==============================================

std::string DocumentCodec::encode_document(const Document& document, const CodecConfig& config) {
  if (config.protocol != Protocol::Binary) {
    throw CodecError("unsupported protocol " + std::to_string(static_cast<int>(config.protocol)));
  }

  std::string serialized;
  write_field(serialized, document.id);
  write_u32(serialized, length_prefix(document.fields.size()));
  for (const auto& [key, value] : document.fields) {
    write_field(serialized, key);
    write_field(serialized, value);
  }
  write_field(serialized, document.blob);

  return compress(serialized, config.compression);
}

Document DocumentCodec::decode_document(const std::string& payload, const CodecConfig& config) {
  if (config.protocol != Protocol::Binary) {
    throw CodecError("unsupported protocol " + std::to_string(static_cast<int>(config.protocol)));
  }

  std::string serialized = decompress(payload, config.compression);
  std::size_t offset = 0;

  Document document;
  document.id = read_field(serialized, offset);
  uint32_t field_count = read_u32(serialized, offset);
  for (uint32_t i = 0; i < field_count; ++i) {
    std::string key = read_field(serialized, offset);
    document.fields[key] = read_field(serialized, offset);
  }
  document.blob = read_field(serialized, offset);

  if (offset != serialized.size()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: " << serialized.size() - offset << " trailing bytes in document " << document.id;
    throw CodecError("trailing bytes after document '" + document.id + "'");
  }
  return document;
}


//==============================================
// SERIALIZATION
//==============================================

uint32_t DocumentCodec::length_prefix(std::size_t size) {
  if (size > std::numeric_limits<uint32_t>::max()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Length " << size << " does not fit a 32-bit prefix";
    throw CodecError("length " + std::to_string(size) + " exceeds the 32-bit limit");
  }
  return static_cast<uint32_t>(size);
}

void DocumentCodec::write_u32(std::string& out, uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  out.append(reinterpret_cast<const char*>(&network_value), sizeof(network_value));
}

void DocumentCodec::write_field(std::string& out, const std::string& value) {
  write_u32(out, length_prefix(value.size()));
  out.append(value);
}

uint32_t DocumentCodec::read_u32(const std::string& in, std::size_t& offset) {
  uint32_t network_value;
  if (in.size() - offset < sizeof(network_value)) {
    throw CodecError("document truncated while reading a length");
  }
  std::memcpy(&network_value, in.data() + offset, sizeof(network_value));
  offset += sizeof(network_value);
  return boost::endian::big_to_native(network_value);
}

std::string DocumentCodec::read_field(const std::string& in, std::size_t& offset) {
  uint32_t size = read_u32(in, offset);
  if (in.size() - offset < size) {
    throw CodecError("document truncated: field of " + std::to_string(size) + " bytes");
  }
  std::string value = in.substr(offset, size);
  offset += size;
  return value;
}


//==============================================
// COMPRESSION
//==============================================

std::string DocumentCodec::compress(const std::string& data, Compression compression) {
  namespace io = boost::iostreams;

  if (compression == Compression::None) {
    return data;
  }

  std::istringstream origin(data);
  std::ostringstream compressed;
  io::filtering_streambuf<io::input> in;
  if (compression == Compression::Gzip) {
    in.push(io::gzip_compressor());
  } else if (compression == Compression::Zlib) {
    in.push(io::zlib_compressor());
  } else {
    throw CodecError("unsupported compression " + std::to_string(static_cast<int>(compression)));
  }
  in.push(origin);

  try {
    io::copy(in, compressed);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Compression failed: " << e.what();
    throw CodecError(std::string("compression failed: ") + e.what());
  }
  return compressed.str();
}

std::string DocumentCodec::decompress(const std::string& data, Compression compression) {
  namespace io = boost::iostreams;

  if (compression == Compression::None) {
    return data;
  }

  std::istringstream origin(data);
  std::ostringstream decompressed;
  io::filtering_streambuf<io::input> in;
  if (compression == Compression::Gzip) {
    in.push(io::gzip_decompressor());
  } else if (compression == Compression::Zlib) {
    in.push(io::zlib_decompressor());
  } else {
    throw CodecError("unsupported compression " + std::to_string(static_cast<int>(compression)));
  }
  in.push(origin);

  try {
    io::copy(in, decompressed);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Decompression failed: " << e.what();
    throw CodecError(std::string("decompression failed: ") + e.what());
  }
  return decompressed.str();
}

} // namespace codec
} // namespace docxfer
