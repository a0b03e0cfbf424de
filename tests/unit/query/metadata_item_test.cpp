#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mdquery/query/metadata_item.hpp"
#include "utilities_test.hpp"

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

namespace mdquery_tests {

using namespace mdquery;

class MetadataItemTest : public ::testing::Test {
 protected:
  AttributeValues values_ = TestUtilities::create_file_values("Report.Final.pdf", 2048);
};

TEST_F(MetadataItemTest, TypedAccessorsReadFetchedValues) {
  // Arrange
  values_["kMDItemUserTags"] = std::vector<std::string>{"Red", "Work"};
  values_["kMDItemDurationSeconds"] = std::int64_t{90};
  MetadataItem item(1, values_);

  // Act & Assert
  EXPECT_EQ(item.file_name(), "Report.Final.pdf");
  EXPECT_EQ(item.file_size(), 2048);
  EXPECT_EQ(item.modification_date(), TestUtilities::time_at("2024-03-15T10:00:00Z"));
  EXPECT_THAT(item.finder_tags(), ElementsAre("Red", "Work"));
  EXPECT_DOUBLE_EQ(*item.duration(), 90.0);
  EXPECT_FALSE(item.creation_date().has_value());
  EXPECT_EQ(item.value("kMDItemTitle"), nullptr);
}

TEST_F(MetadataItemTest, FileExtensionUsesTheLastDot) {
  EXPECT_EQ(MetadataItem(1, values_).file_extension(), "pdf");
  EXPECT_FALSE(
      MetadataItem(2, TestUtilities::create_file_values(".profile")).file_extension().has_value());
  EXPECT_FALSE(
      MetadataItem(3, TestUtilities::create_file_values("Makefile")).file_extension().has_value());
}

TEST_F(MetadataItemTest, PathPrefersFetchedValueOverPrefetchedPath) {
  // Arrange
  MetadataItem unfetched(1, values_, std::nullopt, std::string("/tmp/prefetched.pdf"));
  AttributeValues with_path = values_;
  with_path["kMDItemPath"] = std::string("/tmp/fetched.pdf");
  MetadataItem fetched(2, with_path, std::nullopt, std::string("/tmp/prefetched.pdf"));

  // Act & Assert
  EXPECT_EQ(unfetched.path(), "/tmp/prefetched.pdf");
  EXPECT_EQ(fetched.path(), "/tmp/fetched.pdf");
  EXPECT_FALSE(MetadataItem(3, values_).path().has_value());
}

TEST_F(MetadataItemTest, WithPathReturnsANewItem) {
  auto original = std::make_shared<const MetadataItem>(1, values_);

  auto located = original->with_path("/tmp/a.pdf");

  EXPECT_NE(located.get(), original.get());
  EXPECT_EQ(located->path(), "/tmp/a.pdf");
  EXPECT_FALSE(original->path().has_value());
  EXPECT_EQ(located->values(), original->values());
}

TEST_F(MetadataItemTest, PixelSizeNeedsBothDimensions) {
  values_["kMDItemPixelWidth"] = std::int64_t{1920};
  EXPECT_FALSE(MetadataItem(1, values_).pixel_size().has_value());

  values_["kMDItemPixelHeight"] = std::int64_t{1080};
  auto size = MetadataItem(1, values_).pixel_size();

  ASSERT_TRUE(size.has_value());
  EXPECT_EQ(size->first, 1920);
  EXPECT_EQ(size->second, 1080);
}

TEST_F(MetadataItemTest, FolderDetectionUsesContentTypeTree) {
  auto folder = TestUtilities::create_test_folder(1, "/Users/tester/Documents");

  EXPECT_TRUE(folder->is_folder());
  EXPECT_FALSE(MetadataItem(2, values_).is_folder());
}

TEST_F(MetadataItemTest, ChangesAreEmptyWithoutPreviousValues) {
  EXPECT_TRUE(MetadataItem(1, values_).changes().empty());
}

TEST_F(MetadataItemTest, ChangesListDifferingKeys) {
  // Arrange
  AttributeValues updated = values_;
  updated["kMDItemFSSize"] = std::int64_t{4096};
  updated["kMDItemTitle"] = std::string("Final report");
  updated["com_example_custom"] = std::string("x");
  MetadataItem item(1, updated, values_);

  // Act
  MetadataItemChanges changes = item.changes();

  // Assert
  EXPECT_THAT(changes.changed_keys,
              UnorderedElementsAre("kMDItemFSSize", "kMDItemTitle", "com_example_custom"));
  EXPECT_THAT(changes.changed_attributes,
              UnorderedElementsAre(AttributeId::FileSize, AttributeId::Title));
  EXPECT_TRUE(changes.did_change(AttributeId::FileSize));
  EXPECT_FALSE(changes.did_change(AttributeId::FileName));
}

}  // namespace mdquery_tests
