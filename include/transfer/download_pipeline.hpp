#ifndef DOCXFER_TRANSFER_DOWNLOAD_PIPELINE_HPP
#define DOCXFER_TRANSFER_DOWNLOAD_PIPELINE_HPP

#include <memory>
#include <string>
#include <vector>
#include "codec/document.hpp"
#include "codec/document_codec.hpp"
#include "config/transfer_config.hpp"
#include "store/object_store.hpp"
#include "transfer/transfer_options.hpp"

namespace docxfer {
namespace transfer {

/**
 * Single-pass, lazily decoded view of a stored collection.
 *
 * Each call to next() reads and decodes at most one document from the
 * underlying object. The object's read handle is released when the stream
 * runs out, when next() throws, on close(), or when the stream is
 * destroyed before being drained.
 */
class DocumentStream {
public:
  DocumentStream(std::unique_ptr<store::ObjectReader> reader, const codec::CodecConfig& config,
                 std::string name, ProgressFn progress = {});
  ~DocumentStream();

  DocumentStream(const DocumentStream&) = delete;
  DocumentStream& operator=(const DocumentStream&) = delete;
  DocumentStream(DocumentStream&& other) noexcept;
  DocumentStream& operator=(DocumentStream&& other) noexcept;

  // Returns false once the collection is exhausted or the stream closed.
  // Decode and read failures are thrown from the call that hits them.
  bool next(codec::Document& document);
  void close();

  bool is_open() const { return reader_ != nullptr; }
  std::size_t documents_read() const { return documents_read_; }

private:
  std::unique_ptr<store::ObjectReader> reader_;
  std::unique_ptr<codec::DocumentDecoder> decoder_;
  std::string name_;
  ProgressFn progress_;
  std::size_t documents_read_;
};

class DownloadPipeline {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DownloadPipeline(store::ObjectStore& store, config::TransferConfig config = {});


  // ---- PULL OPERATIONS ----
  // Opens the stored object; throws NotFoundError when it does not exist
  DocumentStream pull_stream(const std::string& name, const PullOptions& options = {});
  // pull_stream drained into a vector
  std::vector<codec::Document> pull(const std::string& name, const PullOptions& options = {});

private:
  // ---- PARAMETERS ----
  store::ObjectStore& store_;
  config::TransferConfig config_;
};

} // namespace transfer
} // namespace docxfer

#endif // DOCXFER_TRANSFER_DOWNLOAD_PIPELINE_HPP
