#ifndef DOCXFER_TRANSFER_UPLOAD_PIPELINE_HPP
#define DOCXFER_TRANSFER_UPLOAD_PIPELINE_HPP

#include <string>
#include <vector>
#include "codec/document.hpp"
#include "config/transfer_config.hpp"
#include "store/object_store.hpp"
#include "transfer/transfer_options.hpp"

namespace docxfer {
namespace transfer {

/**
 * Streams a document collection into a single stored object.
 *
 * Documents are pulled from the source one at a time, encoded, grouped into
 * blocks of `block_capacity` bytes and written to the object as each block
 * fills. The object only becomes visible when the whole collection has been
 * written; any failure along the way discards it, leaving a previous
 * version under the same name untouched.
 */
class UploadPipeline {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit UploadPipeline(store::ObjectStore& store, config::TransferConfig config = {});


  // ---- PUSH OPERATIONS ----
  PushResult push(const std::vector<codec::Document>& documents, const std::string& name,
                  const PushOptions& options = {});
  // Iterates `source` exactly once
  PushResult push_stream(codec::DocumentSource source, const std::string& name,
                         const PushOptions& options = {});


  // ---- GETTERS ----
  const config::TransferConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  store::ObjectStore& store_;
  config::TransferConfig config_;
};

} // namespace transfer
} // namespace docxfer

#endif // DOCXFER_TRANSFER_UPLOAD_PIPELINE_HPP
