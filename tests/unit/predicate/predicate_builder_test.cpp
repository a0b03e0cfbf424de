#include <gtest/gtest.h>

#include "mdquery/predicate/fields.hpp"
#include "mdquery/predicate/predicate_compiler.hpp"

namespace mdquery_tests {

using namespace mdquery;

class PredicateBuilderTest : public ::testing::Test {
 protected:
  PredicateRoot item_;
};

TEST_F(PredicateBuilderTest, DefaultPredicateIsEmpty) {
  Predicate predicate;

  EXPECT_TRUE(predicate.empty());
  EXPECT_TRUE(predicate.referenced_attributes().empty());
}

TEST_F(PredicateBuilderTest, ConnectivesSkipEmptyOperands) {
  // Arrange
  Predicate name = item_.file_name().contains("a");

  // Act
  Predicate combined = name.and_(Predicate{});
  Predicate none = all_of({Predicate{}, Predicate{}});

  // Assert
  EXPECT_EQ(compile_predicate(combined).query, compile_predicate(name).query);
  EXPECT_TRUE(none.empty());
}

TEST_F(PredicateBuilderTest, DoubleNegationCollapses) {
  Predicate name = item_.file_name().contains("a");

  EXPECT_EQ(name.not_().not_().root(), name.root());
}

TEST_F(PredicateBuilderTest, NegatingEmptyPredicateThrows) {
  EXPECT_THROW(Predicate{}.not_(), PredicateError);
}

TEST_F(PredicateBuilderTest, InvalidRangesThrow) {
  EXPECT_THROW(item_.file_size().between(20, 10), PredicateError);
  EXPECT_THROW(item_.file_size().between_any({}), PredicateError);
}

TEST_F(PredicateBuilderTest, EmptyValueListsThrow) {
  EXPECT_THROW(item_.file_name().equals_any({}), PredicateError);
  EXPECT_THROW(item_.file_name().contains_any({}), PredicateError);
  EXPECT_THROW(item_.file_extension().equals_any({}), PredicateError);
  EXPECT_THROW(item_.finder_tags().contains_none({}), PredicateError);
  EXPECT_THROW(item_.file_type().equals_any({}), PredicateError);
  EXPECT_THROW(item_.modification_date().is_any({}), PredicateError);
}

TEST_F(PredicateBuilderTest, NegativeSizeThrows) {
  EXPECT_THROW(item_.file_size().megabytes().greater_than(-1), PredicateError);
}

TEST_F(PredicateBuilderTest, SizeUnitsScaleByThousands) {
  EXPECT_EQ(bytes_per_unit(SizeUnit::Kilobytes), 1000);
  EXPECT_EQ(bytes_per_unit(SizeUnit::Megabytes), 1000000);
  EXPECT_EQ(bytes_per_unit(SizeUnit::Gigabytes), 1000000000);
  EXPECT_EQ(bytes_per_unit(SizeUnit::Petabytes), 1000000000000000LL);
  EXPECT_EQ(item_.file_size().megabytes().unit(), SizeUnit::Megabytes);
}

TEST_F(PredicateBuilderTest, DurationUnitsConvertToSeconds) {
  EXPECT_DOUBLE_EQ(seconds_per_unit(DurationUnit::Hours), 3600.0);
  EXPECT_DOUBLE_EQ(seconds_per_unit(DurationUnit::Weeks), 604800.0);
}

TEST_F(PredicateBuilderTest, NotEqualsAnyRequiresEveryValueToDiffer) {
  // Arrange
  Predicate predicate = item_.file_name().not_equals_any({"a", "b"});

  // Act
  const auto* conjunction = std::get_if<And>(&predicate.root()->node);

  // Assert
  ASSERT_NE(conjunction, nullptr);
  EXPECT_EQ(conjunction->children.size(), 2u);
}

TEST_F(PredicateBuilderTest, ComparisonCarriesStringOptions) {
  // Arrange
  Predicate predicate = item_.title().case_sensitive().word_based().equals("Plan");

  // Act
  const auto& comparison = std::get<Comparison>(predicate.root()->node);

  // Assert
  EXPECT_EQ(comparison.attribute, AttributeId::Title);
  EXPECT_EQ(comparison.op, ComparisonOp::Equal);
  EXPECT_TRUE(comparison.options.case_sensitive);
  EXPECT_FALSE(comparison.options.diacritic_sensitive);
  EXPECT_TRUE(comparison.options.word_based);
  EXPECT_EQ(comparison.options.modifier_suffix(), "dw");
}

}  // namespace mdquery_tests
