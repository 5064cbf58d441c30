#include <gtest/gtest.h>
#include <filesystem>
#include "codec/document_codec.hpp"
#include "core/errors.hpp"
#include "store/local_object_store.hpp"
#include "store/memory_object_store.hpp"
#include "transfer/download_pipeline.hpp"
#include "transfer/upload_pipeline.hpp"
#include "test_utils.hpp"

using namespace docxfer::transfer;
using docxfer::codec::Compression;
using docxfer::codec::Document;
using docxfer::config::TransferConfig;
using docxfer::store::MemoryObjectStore;

namespace {

TransferConfig make_config(Compression compression, std::size_t capacity = 512) {
  TransferConfig config;
  config.block_capacity = capacity;
  config.codec.compression = compression;
  return config;
}

} // namespace

class DownloadRoundTripTest : public ::testing::TestWithParam<Compression> {
protected:
  MemoryObjectStore store;

  void SetUp() override {
    init_test_logging();
  }
};

TEST_P(DownloadRoundTripTest, PullReturnsPushedDocumentsInOrder) {
  TransferConfig config = make_config(GetParam());
  auto documents = make_documents(200, 100);

  UploadPipeline(store, config).push(documents, "bucket/ns/round");
  auto pulled = DownloadPipeline(store, config).pull("bucket/ns/round");

  EXPECT_EQ(pulled, documents);
  EXPECT_EQ(store.open_readers(), 0u);
}

TEST_P(DownloadRoundTripTest, EmptyCollectionPullsNothing) {
  TransferConfig config = make_config(GetParam());
  UploadPipeline(store, config).push({}, "bucket/empty");

  EXPECT_TRUE(DownloadPipeline(store, config).pull("bucket/empty").empty());
}

TEST_P(DownloadRoundTripTest, SingleEmptyDocument) {
  TransferConfig config = make_config(GetParam());
  std::vector<Document> documents(1);

  UploadPipeline(store, config).push(documents, "bucket/blank");
  EXPECT_EQ(DownloadPipeline(store, config).pull("bucket/blank"), documents);
}

INSTANTIATE_TEST_SUITE_P(Compressions, DownloadRoundTripTest,
                         ::testing::Values(Compression::None, Compression::Gzip, Compression::Zlib));


class DownloadPipelineTest : public ::testing::Test {
protected:
  MemoryObjectStore store;
  TransferConfig config = make_config(Compression::Gzip);

  void SetUp() override {
    init_test_logging();
    UploadPipeline(store, config).push(make_documents(20), "bucket/coll");
  }
};

TEST_F(DownloadPipelineTest, MissingCollectionThrowsNotFound) {
  DownloadPipeline pipeline(store, config);
  EXPECT_THROW(pipeline.pull_stream("bucket/absent"), docxfer::core::NotFoundError);
  EXPECT_THROW(pipeline.pull("nobucket/coll"), docxfer::core::NotFoundError);
  EXPECT_EQ(store.open_readers(), 0u);
}

TEST_F(DownloadPipelineTest, InvalidNameRejected) {
  DownloadPipeline pipeline(store, config);
  EXPECT_THROW(pipeline.pull("coll"), docxfer::core::InvalidNameError);
  EXPECT_THROW(pipeline.pull("/coll"), docxfer::core::InvalidNameError);
}

TEST_F(DownloadPipelineTest, StreamDecodesLazily) {
  auto expected = make_documents(20);
  DownloadPipeline pipeline(store, config);
  DocumentStream stream = pipeline.pull_stream("bucket/coll");

  EXPECT_TRUE(stream.is_open());
  EXPECT_EQ(stream.documents_read(), 0u);

  Document document;
  ASSERT_TRUE(stream.next(document));
  EXPECT_EQ(document, expected[0]);
  ASSERT_TRUE(stream.next(document));
  EXPECT_EQ(document, expected[1]);
  EXPECT_EQ(stream.documents_read(), 2u);
  EXPECT_EQ(store.open_readers(), 1u);
}

TEST_F(DownloadPipelineTest, AbandonedStreamReleasesReader) {
  DownloadPipeline pipeline(store, config);
  {
    DocumentStream stream = pipeline.pull_stream("bucket/coll");
    Document document;
    ASSERT_TRUE(stream.next(document));
    EXPECT_EQ(store.open_readers(), 1u);
  }
  EXPECT_EQ(store.open_readers(), 0u);
}

TEST_F(DownloadPipelineTest, ExhaustedStreamClosesItself) {
  DownloadPipeline pipeline(store, config);
  DocumentStream stream = pipeline.pull_stream("bucket/coll");

  Document document;
  std::size_t count = 0;
  while (stream.next(document)) {
    ++count;
  }
  EXPECT_EQ(count, 20u);
  EXPECT_FALSE(stream.is_open());
  EXPECT_EQ(store.open_readers(), 0u);
  EXPECT_FALSE(stream.next(document));
}

TEST_F(DownloadPipelineTest, ExplicitCloseStopsIteration) {
  DownloadPipeline pipeline(store, config);
  DocumentStream stream = pipeline.pull_stream("bucket/coll");

  Document document;
  ASSERT_TRUE(stream.next(document));
  stream.close();
  stream.close();
  EXPECT_FALSE(stream.next(document));
  EXPECT_EQ(store.open_readers(), 0u);
}

TEST_F(DownloadPipelineTest, MovedStreamKeepsPosition) {
  auto expected = make_documents(20);
  DownloadPipeline pipeline(store, config);
  DocumentStream first = pipeline.pull_stream("bucket/coll");

  Document document;
  ASSERT_TRUE(first.next(document));
  DocumentStream second = std::move(first);
  ASSERT_TRUE(second.next(document));
  EXPECT_EQ(document, expected[1]);
  EXPECT_EQ(store.open_readers(), 1u);
}

TEST_F(DownloadPipelineTest, CompressionMismatchSurfacesOnFirstRead) {
  DownloadPipeline pipeline(store, make_config(Compression::Zlib));
  DocumentStream stream = pipeline.pull_stream("bucket/coll");

  Document document;
  EXPECT_THROW(stream.next(document), docxfer::core::CodecError);
  EXPECT_FALSE(stream.is_open());
  EXPECT_EQ(store.open_readers(), 0u);
}

TEST_F(DownloadPipelineTest, TruncatedObjectFailsAfterValidDocuments) {
  std::string data = store.contents("bucket", "coll.da");
  store.put("bucket", "cut.da", data.substr(0, data.size() - 3));

  DownloadPipeline pipeline(store, config);
  DocumentStream stream = pipeline.pull_stream("bucket/cut");

  Document document;
  std::size_t decoded = 0;
  EXPECT_THROW({
    while (stream.next(document)) {
      ++decoded;
    }
  }, docxfer::core::CodecError);
  EXPECT_EQ(decoded, 19u);
  EXPECT_FALSE(stream.is_open());
  EXPECT_EQ(store.open_readers(), 0u);
}

TEST_F(DownloadPipelineTest, ForeignObjectRejected) {
  store.put("bucket", "foreign.da", "this is not a document stream");
  DownloadPipeline pipeline(store, config);
  EXPECT_THROW(pipeline.pull("bucket/foreign"), docxfer::core::CodecError);
  EXPECT_EQ(store.open_readers(), 0u);
}

TEST_F(DownloadPipelineTest, ProgressReportedPerDocument) {
  std::vector<TransferProgress> reports;
  PullOptions options;
  options.progress = [&](const TransferProgress& progress) { reports.push_back(progress); };

  DownloadPipeline(store, config).pull("bucket/coll", options);

  ASSERT_EQ(reports.size(), 20u);
  EXPECT_EQ(reports.front().documents, 1u);
  EXPECT_EQ(reports.back().documents, 20u);
  EXPECT_EQ(reports.back().bytes, store.contents("bucket", "coll.da").size());
}

TEST(DownloadLocalStoreTest, LargeCollectionRoundTripThroughFiles) {
  init_test_logging();
  auto root = std::filesystem::temp_directory_path() / "docxfer_download_test";
  std::filesystem::remove_all(root);
  {
    docxfer::store::LocalObjectStore store(root.string());
    TransferConfig config = make_config(Compression::Gzip, 64 * 1024);
    auto documents = make_documents(3000, 200);

    PushResult result = UploadPipeline(store, config).push(documents, "bucket/deep/ns/big");
    EXPECT_GT(result.blocks, 1u);
    EXPECT_TRUE(std::filesystem::exists(root / "bucket" / "deep" / "ns" / "big.da"));

    EXPECT_EQ(DownloadPipeline(store, config).pull("bucket/deep/ns/big"), documents);
  }
  std::filesystem::remove_all(root);
}
