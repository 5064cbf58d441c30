#include "transfer/upload_pipeline.hpp"
#include "codec/document_codec.hpp"
#include "core/namespace_path.hpp"
#include "crypto/digest.hpp"
#include "transfer/chunk_buffer.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace transfer {

namespace {

// Holds an object writer for the duration of a push. The writer is aborted
// on every exit path that did not reach commit().
class ScopedObjectWriter {
public:
  ScopedObjectWriter(store::ObjectStore& store, const std::string& bucket,
                     const std::string& key, const store::WriteOptions& options)
    : writer_(store.open_write(bucket, key, options))
    , committed_(false) {}

  ~ScopedObjectWriter() {
    if (committed_) {
      return;
    }
    try {
      writer_->abort();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Upload: Failed to abort writer: " << e.what();
    }
  }

  ScopedObjectWriter(const ScopedObjectWriter&) = delete;
  ScopedObjectWriter& operator=(const ScopedObjectWriter&) = delete;

  void write(const Block& block) { writer_->write(block.data(), block.size()); }

  void commit() {
    writer_->commit();
    committed_ = true;
  }

private:
  std::unique_ptr<store::ObjectWriter> writer_;
  bool committed_;
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UploadPipeline::UploadPipeline(store::ObjectStore& store, config::TransferConfig config)
  : store_(store)
  , config_(config) {
  if (config_.block_capacity == 0) {
    BOOST_LOG_TRIVIAL(error) << "Upload: Block capacity must be positive";
    throw std::invalid_argument("Upload: Block capacity must be positive");
  }
}


//==============================================
// PUSH OPERATIONS
//==============================================

PushResult UploadPipeline::push(const std::vector<codec::Document>& documents,
    const std::string& name, const PushOptions& options) {
  return push_stream(codec::make_vector_source(documents), name, options);
}

PushResult UploadPipeline::push_stream(codec::DocumentSource source, const std::string& name,
    const PushOptions& options) {
  core::NamespacePath path = core::NamespacePath::parse_object_name(name);
  const std::string key = path.object_key();

  BOOST_LOG_TRIVIAL(info) << "Upload: Pushing " << name << " to " << path.bucket() << "/" << key
                          << " (" << codec::to_string(config_.codec.compression)
                          << ", block capacity " << config_.block_capacity << ")";

  ScopedObjectWriter writer(store_, path.bucket(), key, store::WriteOptions{options.visibility});
  codec::DocumentEncoder encoder = codec::DocumentCodec::encode(std::move(source), config_.codec);
  ChunkBuffer buffer(config_.block_capacity);
  crypto::Sha256 digest;
  PushResult result;

  // Blocks go out one at a time, as soon as they are complete
  auto flush = [&](const Block& block) {
    writer.write(block);
    digest.update(block);
    result.bytes += block.size();
    BOOST_LOG_TRIVIAL(debug) << "Upload: Wrote block " << buffer.blocks_emitted() << " of "
                             << block.size() << " bytes";
    if (options.progress) {
      options.progress(TransferProgress{encoder.documents_encoded(), result.bytes});
    }
  };

  try {
    std::string chunk;
    while (encoder.next_chunk(chunk)) {
      if (auto block = buffer.accumulate(chunk)) {
        flush(*block);
      }
    }

    if (auto block = buffer.finalize()) {
      flush(*block);
    }

    writer.commit();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload: Push of " << name << " failed after " << result.bytes
                             << " bytes: " << e.what();
    throw;
  }

  result.documents = encoder.documents_encoded();
  result.blocks = buffer.blocks_emitted();
  result.sha256 = digest.hex_digest();
  if (options.progress) {
    options.progress(TransferProgress{result.documents, result.bytes});
  }

  BOOST_LOG_TRIVIAL(info) << "Upload: Pushed " << result.documents << " documents to " << name
                          << " (" << result.bytes << " bytes in " << result.blocks << " blocks)";
  return result;
}

} // namespace transfer
} // namespace docxfer
