#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>

#include "mdquery/index/file_system_indexer.hpp"
#include "utilities_test.hpp"

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;

namespace mdquery_tests {

using namespace mdquery;
namespace fs = std::filesystem;

class FileSystemIndexerTest : public IndexBackendTestBase {
 protected:
  void SetUp() override {
    IndexBackendTestBase::SetUp();
    root_ = TestUtilities::create_temp_dir("indexer");
    TestUtilities::write_file(root_ / "notes.txt", "hello");
    TestUtilities::write_file(root_ / "photos" / "beach.JPG", "not really a jpeg");
    TestUtilities::write_file(root_ / "photos" / "trip" / "clip.mov", "0123456789");
    TestUtilities::write_file(root_ / ".cache" / "blob.bin", "x");
    TestUtilities::write_file(root_ / ".hidden.txt", "secret");
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(root_);
    IndexBackendTestBase::TearDown();
  }

  std::string path_of(const fs::path& relative) const {
    return fs::absolute(root_ / relative).lexically_normal().string();
  }

  fs::path root_;
};

TEST_F(FileSystemIndexerTest, IndexesVisibleFilesAndFolders) {
  // Arrange
  FileSystemIndexer indexer(*backend_);

  // Act
  IndexStats stats = indexer.index_directory(root_);

  // Assert
  EXPECT_EQ(stats.files_indexed, 3u);
  EXPECT_EQ(stats.folders_indexed, 3u);
  EXPECT_EQ(stats.errors, 0u);
  EXPECT_TRUE(backend_->lookup(path_of("photos/trip/clip.mov")).has_value());
  EXPECT_FALSE(backend_->lookup(path_of(".hidden.txt")).has_value());
  EXPECT_FALSE(backend_->lookup(path_of(".cache/blob.bin")).has_value());
}

TEST_F(FileSystemIndexerTest, HiddenItemsCanBeIncluded) {
  FileSystemIndexer indexer(*backend_);

  IndexStats stats = indexer.index_directory(root_, true);

  EXPECT_EQ(stats.files_indexed, 5u);
  auto id = backend_->lookup(path_of(".hidden.txt"));
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(backend_->values(*id)->at("kMDItemFSInvisible"), AttributeValue{true});
}

TEST_F(FileSystemIndexerTest, ReadsFileAttributes) {
  // Act
  AttributeValues values = FileSystemIndexer::read_attributes(root_ / "photos" / "trip" / "clip.mov");

  // Assert
  EXPECT_EQ(values.at("kMDItemFSName"), AttributeValue{std::string("clip.mov")});
  EXPECT_EQ(values.at("kMDItemFSSize"), AttributeValue{std::int64_t{10}});
  EXPECT_EQ(values.at("kMDItemContentType"),
            AttributeValue{std::string("com.apple.quicktime-movie")});
  EXPECT_EQ(values.at("kMDItemFSInvisible"), AttributeValue{false});
  EXPECT_TRUE(std::holds_alternative<TimePoint>(values.at("kMDItemFSContentChangeDate")));
  EXPECT_TRUE(std::holds_alternative<TimePoint>(values.at("kMDItemFSCreationDate")));
}

TEST_F(FileSystemIndexerTest, ReadsFolderAttributes) {
  AttributeValues values = FileSystemIndexer::read_attributes(root_ / "photos");

  EXPECT_EQ(values.at("kMDItemContentType"), AttributeValue{std::string("public.folder")});
  EXPECT_EQ(values.at("kMDItemFSNodeCount"), AttributeValue{std::int64_t{2}});
  EXPECT_EQ(values.count("kMDItemFSSize"), 0u);
}

TEST_F(FileSystemIndexerTest, ExtensionsMapToContentTypes) {
  EXPECT_EQ(FileSystemIndexer::content_type_for_extension("JPG"), "public.jpeg");
  EXPECT_EQ(FileSystemIndexer::content_type_for_extension("pdf"), "com.adobe.pdf");
  EXPECT_EQ(FileSystemIndexer::content_type_for_extension("unknownext"), "public.data");
}

TEST_F(FileSystemIndexerTest, ContentTypeTreeFollowsConformance) {
  EXPECT_THAT(FileSystemIndexer::content_type_tree("public.jpeg"),
              ElementsAre("public.jpeg", "public.image", "public.data", "public.content",
                          "public.item"));
  EXPECT_THAT(FileSystemIndexer::content_type_tree("public.folder"),
              ElementsAre("public.folder", "public.directory", "public.item"));
  EXPECT_THAT(FileSystemIndexer::content_type_tree("com.example.custom"),
              ElementsAre("com.example.custom", "public.data", "public.item"));
}

TEST_F(FileSystemIndexerTest, ReindexingUpdatesInPlace) {
  // Arrange
  FileSystemIndexer indexer(*backend_);
  ItemId first = indexer.index_path(root_ / "notes.txt");
  TestUtilities::write_file(root_ / "notes.txt", "hello again");

  // Act
  ItemId second = indexer.index_path(root_ / "notes.txt");

  // Assert
  EXPECT_EQ(first, second);
  EXPECT_EQ(backend_->values(second)->at("kMDItemFSSize"), AttributeValue{std::int64_t{11}});
}

TEST_F(FileSystemIndexerTest, IndexedFoldersAreFolders) {
  FileSystemIndexer indexer(*backend_);
  indexer.index_directory(root_);

  auto id = backend_->lookup(path_of("photos"));
  ASSERT_TRUE(id.has_value());
  auto values = backend_->values(*id);

  const auto& tree = std::get<std::vector<std::string>>(values->at("kMDItemContentTypeTree"));
  EXPECT_THAT(tree, Contains("public.folder"));
  EXPECT_THAT(tree, Not(Contains("public.data")));
}

TEST_F(FileSystemIndexerTest, RejectsAMissingRoot) {
  FileSystemIndexer indexer(*backend_);

  EXPECT_THROW(indexer.index_directory(root_ / "does-not-exist"), IndexBackendError);
}

}  // namespace mdquery_tests
