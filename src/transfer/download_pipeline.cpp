#include "transfer/download_pipeline.hpp"
#include "core/namespace_path.hpp"
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace transfer {

//==============================================
// DOCUMENT STREAM
//==============================================

DocumentStream::DocumentStream(std::unique_ptr<store::ObjectReader> reader,
    const codec::CodecConfig& config, std::string name, ProgressFn progress)
  : reader_(std::move(reader))
  , name_(std::move(name))
  , progress_(std::move(progress))
  , documents_read_(0) {
  decoder_ = std::make_unique<codec::DocumentDecoder>(
    codec::DocumentCodec::decode(reader_->stream(), config));
}

DocumentStream::~DocumentStream() {
  try {
    close();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Download: Failed to close " << name_ << ": " << e.what();
  }
}

DocumentStream::DocumentStream(DocumentStream&& other) noexcept
  : reader_(std::move(other.reader_))
  , decoder_(std::move(other.decoder_))
  , name_(std::move(other.name_))
  , progress_(std::move(other.progress_))
  , documents_read_(other.documents_read_) {}

DocumentStream& DocumentStream::operator=(DocumentStream&& other) noexcept {
  if (this != &other) {
    try {
      close();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Download: Failed to close " << name_ << ": " << e.what();
    }
    reader_ = std::move(other.reader_);
    decoder_ = std::move(other.decoder_);
    name_ = std::move(other.name_);
    progress_ = std::move(other.progress_);
    documents_read_ = other.documents_read_;
  }
  return *this;
}

bool DocumentStream::next(codec::Document& document) {
  if (!reader_) {
    return false;
  }

  try {
    if (!decoder_->next(document)) {
      BOOST_LOG_TRIVIAL(info) << "Download: Pulled " << documents_read_ << " documents from " << name_;
      close();
      return false;
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Download: Pull of " << name_ << " failed after "
                             << documents_read_ << " documents: " << e.what();
    close();
    throw;
  }

  ++documents_read_;
  if (progress_) {
    progress_(TransferProgress{documents_read_, decoder_->bytes_read()});
  }
  return true;
}

void DocumentStream::close() {
  if (!reader_) {
    return;
  }
  // Decoder refers to the reader's stream, drop it first
  decoder_.reset();
  std::unique_ptr<store::ObjectReader> reader = std::move(reader_);
  reader->close();
  BOOST_LOG_TRIVIAL(debug) << "Download: Closed read stream for " << name_;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DownloadPipeline::DownloadPipeline(store::ObjectStore& store, config::TransferConfig config)
  : store_(store)
  , config_(config) {}


//==============================================
// PULL OPERATIONS
//==============================================

DocumentStream DownloadPipeline::pull_stream(const std::string& name, const PullOptions& options) {
  core::NamespacePath path = core::NamespacePath::parse_object_name(name);
  const std::string key = path.object_key();

  BOOST_LOG_TRIVIAL(info) << "Download: Pulling " << name << " from " << path.bucket() << "/" << key;
  return DocumentStream(store_.open_read(path.bucket(), key), config_.codec, name, options.progress);
}

std::vector<codec::Document> DownloadPipeline::pull(const std::string& name, const PullOptions& options) {
  DocumentStream stream = pull_stream(name, options);

  std::vector<codec::Document> documents;
  codec::Document document;
  while (stream.next(document)) {
    documents.push_back(std::move(document));
  }
  return documents;
}

} // namespace transfer
} // namespace docxfer
