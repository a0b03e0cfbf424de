#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mdquery/projection/hierarchical_results.hpp"
#include "utilities_test.hpp"

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

namespace mdquery_tests {

using namespace mdquery;

class HierarchicalResultsTest : public ::testing::Test {
 protected:
  static std::vector<std::string> names(const std::vector<HierarchyFile>& files) {
    std::vector<std::string> result;
    for (const auto& file : files) result.push_back(file.name);
    return result;
  }
};

TEST_F(HierarchicalResultsTest, EmptyInputGivesAnEmptyRoot) {
  HierarchicalResults tree = build_hierarchy({});

  EXPECT_EQ(tree.top_level_path(), "/");
  EXPECT_TRUE(tree.files().empty());
  EXPECT_TRUE(tree.folders().empty());
}

TEST_F(HierarchicalResultsTest, RootIsTheDeepestCommonFolder) {
  // Arrange
  std::vector<MetadataItemPtr> items = {
      TestUtilities::create_test_item(1, "/Users/tester/Documents/a.txt"),
      TestUtilities::create_test_item(2, "/Users/tester/Documents/Work/b.txt"),
      TestUtilities::create_test_item(3, "/Users/tester/Documents/Work/Old/c.txt"),
  };

  // Act
  HierarchicalResults tree = build_hierarchy(items);

  // Assert
  EXPECT_EQ(tree.top_level_path(), "/Users/tester/Documents");
  EXPECT_THAT(names(tree.files()), ElementsAre("a.txt"));
  ASSERT_EQ(tree.folders().size(), 1u);
  const HierarchyFolder& work = *tree.folders()[0];
  EXPECT_EQ(work.path, "/Users/tester/Documents/Work");
  EXPECT_EQ(work.item, nullptr);
  EXPECT_THAT(names(work.files), ElementsAre("b.txt"));
  ASSERT_EQ(work.subfolders.size(), 1u);
  EXPECT_THAT(names(work.subfolders[0]->files), ElementsAre("c.txt"));
}

TEST_F(HierarchicalResultsTest, SingleFileSitsInItsParent) {
  HierarchicalResults tree =
      build_hierarchy({TestUtilities::create_test_item(1, "/Users/tester/a.txt")});

  EXPECT_EQ(tree.top_level_path(), "/Users/tester");
  EXPECT_THAT(names(tree.files()), ElementsAre("a.txt"));
}

TEST_F(HierarchicalResultsTest, FolderItemsBecomeFolders) {
  // Arrange
  auto folder = TestUtilities::create_test_folder(1, "/Users/tester/Projects");
  auto file = TestUtilities::create_test_item(2, "/Users/tester/Projects/plan.md");

  // Act
  HierarchicalResults tree = build_hierarchy({file, folder});

  // Assert
  EXPECT_EQ(tree.top_level_path(), "/Users/tester");
  ASSERT_EQ(tree.folders().size(), 1u);
  EXPECT_EQ(tree.folders()[0]->item, folder);
  EXPECT_THAT(names(tree.folders()[0]->files), ElementsAre("plan.md"));
  EXPECT_TRUE(tree.files().empty());
}

TEST_F(HierarchicalResultsTest, AncestorsOfOtherItemsAreFolders) {
  // Arrange
  auto parent = TestUtilities::create_test_item(1, "/data/bundle");
  auto child = TestUtilities::create_test_item(2, "/data/bundle/inner.bin");

  // Act
  HierarchicalResults tree = build_hierarchy({parent, child});

  // Assert
  ASSERT_NE(tree.folder_at("/data/bundle"), nullptr);
  EXPECT_EQ(tree.folder_at("/data/bundle")->item, parent);
  EXPECT_EQ(tree.file_at("/data/bundle"), nullptr);
}

TEST_F(HierarchicalResultsTest, EveryItemIsPlacedExactlyOnce) {
  // Arrange
  std::vector<MetadataItemPtr> items = {
      TestUtilities::create_test_folder(1, "/a"),
      TestUtilities::create_test_item(2, "/a/x.txt"),
      TestUtilities::create_test_item(3, "/a/b/y.txt"),
      TestUtilities::create_test_item(4, "/c/z.txt"),
      TestUtilities::create_test_item(5, ""),
  };

  // Act
  HierarchicalResults tree = build_hierarchy(items);

  // Assert
  EXPECT_EQ(tree.top_level_path(), "/");
  EXPECT_THAT(TestUtilities::ids_of(tree.all_items()), UnorderedElementsAre(1u, 2u, 3u, 4u, 5u));
}

TEST_F(HierarchicalResultsTest, ItemsWithoutPathAreRootFiles) {
  HierarchicalResults tree = build_hierarchy({TestUtilities::create_test_item(7, "")});

  ASSERT_EQ(tree.files().size(), 1u);
  EXPECT_EQ(tree.files()[0].item->id(), 7u);
  EXPECT_TRUE(tree.files()[0].path.empty());
}

TEST_F(HierarchicalResultsTest, LookupsNormalizeSlashes) {
  auto item = TestUtilities::create_test_item(1, "/Users/tester/Documents/a.txt");
  HierarchicalResults tree =
      build_hierarchy({item, TestUtilities::create_test_item(2, "/Users/tester/b.txt")});

  EXPECT_EQ(tree.item_at("/Users/tester/Documents/a.txt"), item);
  EXPECT_EQ(tree.item_at("/Users//tester/Documents/a.txt/"), item);
  ASSERT_NE(tree.folder_at("/Users/tester/Documents/"), nullptr);
  EXPECT_EQ(tree.item_at("/Users/tester/missing.txt"), nullptr);
}

TEST(PathComponentsTest, SplitAndJoin) {
  EXPECT_THAT(split_path("/a/b/"), ElementsAre("a", "b"));
  EXPECT_THAT(split_path("//a//b"), ElementsAre("a", "b"));
  EXPECT_TRUE(split_path("/").empty());
  EXPECT_EQ(join_path({"a", "b", "c"}, 2), "/a/b");
  EXPECT_EQ(join_path({"a"}, 0), "/");
}

}  // namespace mdquery_tests
