#include "codec/document.hpp"

namespace docxfer {
namespace codec {

DocumentSource make_vector_source(const std::vector<Document>& documents) {
  return [&documents, index = std::size_t{0}](Document& document) mutable -> bool {
    if (index >= documents.size()) return false;
    document = documents[index++];
    return true;
  };
}

} // namespace codec
} // namespace docxfer
