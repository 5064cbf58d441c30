#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/namespace_path.hpp"
#include "test_utils.hpp"

using namespace docxfer::core;

class NamespacePathTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }
};

TEST_F(NamespacePathTest, SplitsOnFirstSeparator) {
  NamespacePath path = NamespacePath::parse("mybucket/foo/bar");
  EXPECT_EQ(path.bucket(), "mybucket");
  EXPECT_EQ(path.rest(), "foo/bar");
  EXPECT_EQ(path.object_key(), "foo/bar.da");
  EXPECT_EQ(path.to_string(), "mybucket/foo/bar");
}

TEST_F(NamespacePathTest, MissingSeparatorIsInvalid) {
  EXPECT_THROW(NamespacePath::parse("mybucket"), InvalidNameError);
  EXPECT_THROW(NamespacePath::parse(""), InvalidNameError);
  EXPECT_THROW(NamespacePath::parse_object_name("noslash"), InvalidNameError);
}

TEST_F(NamespacePathTest, EmptyBucketIsInvalid) {
  EXPECT_THROW(NamespacePath::parse("/foo"), InvalidNameError);
}

TEST_F(NamespacePathTest, ObjectNameRequiresKey) {
  NamespacePath listing = NamespacePath::parse("mybucket/");
  EXPECT_EQ(listing.bucket(), "mybucket");
  EXPECT_TRUE(listing.rest().empty());

  EXPECT_THROW(NamespacePath::parse_object_name("mybucket/"), InvalidNameError);
}

TEST_F(NamespacePathTest, InvalidNameIsTransferError) {
  try {
    NamespacePath::parse("nobucket");
    FAIL() << "Expected InvalidNameError";
  } catch (const TransferError& e) {
    EXPECT_NE(std::string(e.what()).find("nobucket"), std::string::npos);
  }
}

TEST_F(NamespacePathTest, NameFromKey) {
  EXPECT_EQ(NamespacePath::name_from_key("ns/a.da"), "a");
  EXPECT_EQ(NamespacePath::name_from_key("a.da"), "a");
  EXPECT_EQ(NamespacePath::name_from_key("ns/deep/v1.2.da"), "v1.2");
  EXPECT_EQ(NamespacePath::name_from_key("ns/plain"), "plain");
}

TEST_F(NamespacePathTest, CollectionExtension) {
  EXPECT_TRUE(NamespacePath::has_collection_extension("ns/a.da"));
  EXPECT_TRUE(NamespacePath::has_collection_extension(".da"));
  EXPECT_FALSE(NamespacePath::has_collection_extension("ns/a.dat"));
  EXPECT_FALSE(NamespacePath::has_collection_extension("da"));
  EXPECT_FALSE(NamespacePath::has_collection_extension(""));
}
