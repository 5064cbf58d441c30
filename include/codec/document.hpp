#ifndef DOCXFER_CODEC_DOCUMENT_HPP
#define DOCXFER_CODEC_DOCUMENT_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace docxfer {
namespace codec {

// A single record of a collection. The transfer pipelines move documents
// around without looking inside them; only the codec reads the fields.
struct Document {
  std::string id;
  std::map<std::string, std::string> fields;
  std::string blob;

  bool operator==(const Document& other) const {
    return id == other.id && fields == other.fields && blob == other.blob;
  }
  bool operator!=(const Document& other) const { return !(*this == other); }
};

// Lazy document sequence. Fills the document and returns true, returns
// false once exhausted, throws on failure.
using DocumentSource = std::function<bool(Document&)>;

// Iterates a materialized collection. The vector must outlive the source.
DocumentSource make_vector_source(const std::vector<Document>& documents);

} // namespace codec
} // namespace docxfer

#endif // DOCXFER_CODEC_DOCUMENT_HPP
