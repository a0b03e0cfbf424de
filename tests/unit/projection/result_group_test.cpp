#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mdquery/projection/result_group.hpp"
#include "utilities_test.hpp"

using ::testing::ElementsAre;

namespace mdquery_tests {

using namespace mdquery;

class ResultGroupTest : public ::testing::Test {
 protected:
  static MetadataItemPtr item(ItemId id, const std::string& content_type, std::int64_t size) {
    AttributeValues values;
    if (!content_type.empty()) {
      values["kMDItemContentType"] = content_type;
    }
    values["kMDItemFSSize"] = size;
    return TestUtilities::create_test_item(id, "/tmp/item" + std::to_string(id), values);
  }
};

TEST_F(ResultGroupTest, NoAttributesMeansNoGroups) {
  EXPECT_TRUE(build_groups({item(1, "public.jpeg", 1)}, {}).empty());
}

TEST_F(ResultGroupTest, GroupsAppearInFirstSeenOrder) {
  // Arrange
  std::vector<MetadataItemPtr> items = {item(1, "public.png", 1), item(2, "public.jpeg", 1),
                                        item(3, "public.png", 2)};

  // Act
  auto groups = build_groups(items, {AttributeId::ContentType});

  // Assert
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].attribute, AttributeId::ContentType);
  EXPECT_EQ(groups[0].value, AttributeValue{std::string("public.png")});
  EXPECT_THAT(TestUtilities::ids_of(groups[0].items), ElementsAre(1u, 3u));
  EXPECT_EQ(groups[1].value, AttributeValue{std::string("public.jpeg")});
  EXPECT_TRUE(groups[0].subgroups.empty());
}

TEST_F(ResultGroupTest, MissingValuesFormTheirOwnGroup) {
  auto groups = build_groups({item(1, "", 1), item(2, "public.png", 1), item(3, "", 1)},
                             {AttributeId::ContentType});

  ASSERT_EQ(groups.size(), 2u);
  EXPECT_TRUE(is_null(groups[0].value));
  EXPECT_THAT(TestUtilities::ids_of(groups[0].items), ElementsAre(1u, 3u));
}

TEST_F(ResultGroupTest, NestedGroupingSplitsEachGroup) {
  // Arrange
  std::vector<MetadataItemPtr> items = {item(1, "public.png", 10), item(2, "public.png", 20),
                                        item(3, "public.jpeg", 10), item(4, "public.png", 10)};

  // Act
  auto groups = build_groups(items, {AttributeId::ContentType, AttributeId::FileSize});

  // Assert
  ASSERT_EQ(groups.size(), 2u);
  const auto& png = groups[0];
  ASSERT_EQ(png.subgroups.size(), 2u);
  EXPECT_EQ(png.subgroups[0].attribute, AttributeId::FileSize);
  EXPECT_EQ(png.subgroups[0].value, AttributeValue{std::int64_t{10}});
  EXPECT_THAT(TestUtilities::ids_of(png.subgroups[0].items), ElementsAre(1u, 4u));
  EXPECT_THAT(TestUtilities::ids_of(png.subgroups[1].items), ElementsAre(2u));
  ASSERT_EQ(groups[1].subgroups.size(), 1u);
}

}  // namespace mdquery_tests
