#include <gtest/gtest.h>

#include "mdquery/predicate/fields.hpp"
#include "mdquery/predicate/predicate_compiler.hpp"
#include "utilities_test.hpp"

namespace mdquery_tests {

using namespace mdquery;

class PredicateCompilerTest : public ::testing::Test {
 protected:
  std::string compile(const Predicate& predicate) {
    return compile_predicate(predicate).query;
  }

  PredicateRoot item_;
};

TEST_F(PredicateCompilerTest, EmptyPredicateMatchesAllItems) {
  // Arrange & Act
  CompiledPredicate compiled = compile_predicate(Predicate{});

  // Assert
  EXPECT_EQ(compiled.query, "kMDItemContentTypeTree == \"public.item\"");
  EXPECT_EQ(compiled.referenced_attributes.count(AttributeId::ContentTypeTree), 1u);
}

TEST_F(PredicateCompilerTest, StringOperatorsUseWildcardsAndModifiers) {
  EXPECT_EQ(compile(item_.file_name().contains("report")), "kMDItemFSName == \"*report*\"cd");
  EXPECT_EQ(compile(item_.file_name().starts_with("IMG_")), "kMDItemFSName == \"IMG_*\"cd");
  EXPECT_EQ(compile(item_.file_name().ends_with(".txt")), "kMDItemFSName == \"*.txt\"cd");
  EXPECT_EQ(compile(item_.title().not_equals("Draft")), "kMDItemTitle != \"Draft\"cd");
}

TEST_F(PredicateCompilerTest, StringOptionsChangeTheModifierSuffix) {
  EXPECT_EQ(compile(item_.file_name().case_sensitive().equals("A")), "kMDItemFSName == \"A\"d");
  EXPECT_EQ(compile(item_.file_name().diacritic_sensitive().equals("é")),
            "kMDItemFSName == \"é\"c");
  EXPECT_EQ(compile(item_.file_name().case_sensitive().diacritic_sensitive().equals("x")),
            "kMDItemFSName == \"x\"");
  EXPECT_EQ(compile(item_.text_content().word_based().contains("plan")),
            "kMDItemTextContent == \"*plan*\"cdw");
}

TEST_F(PredicateCompilerTest, EscapesQuotesBackslashesAndWildcards) {
  EXPECT_EQ(escape_query_string("a*b\"c\\d"), "a\\*b\\\"c\\\\d");
  EXPECT_EQ(compile(item_.file_name().contains("50*")), "kMDItemFSName == \"*50\\**\"cd");
}

TEST_F(PredicateCompilerTest, NumericComparisonsUseConvertedUnits) {
  EXPECT_EQ(compile(item_.file_size().megabytes().greater_than(2)), "kMDItemFSSize > 2000000");
  EXPECT_EQ(compile(item_.file_size().kilobytes().less_or_equal(1.5)), "kMDItemFSSize <= 1500");
  EXPECT_EQ(compile(item_.duration().minutes().greater_or_equal(2)),
            "kMDItemDurationSeconds >= 120");
  EXPECT_EQ(compile(item_.pixel_width().equals(1920)), "kMDItemPixelWidth == 1920");
}

TEST_F(PredicateCompilerTest, BooleanAndExistenceForms) {
  EXPECT_EQ(compile(item_.file_is_invisible().is_true()), "kMDItemFSInvisible == 1");
  EXPECT_EQ(compile(item_.is_screen_capture().is_false()), "kMDItemIsScreenCapture == 0");
  EXPECT_EQ(compile(item_.title().exists()), "kMDItemTitle == \"*\"");
  EXPECT_EQ(compile(item_.title().missing()), "!(kMDItemTitle == \"*\")");
}

TEST_F(PredicateCompilerTest, ExtensionCompilesToFileNameSuffix) {
  EXPECT_EQ(compile(item_.file_extension().equals(".pdf")), "kMDItemFSName == \"*.pdf\"cd");
  EXPECT_EQ(compile(item_.file_extension().not_equals("tmp")), "kMDItemFSName != \"*.tmp\"cd");
  EXPECT_EQ(compile(item_.file_extension().equals_any({"mp4", "mov"})),
            "(kMDItemFSName == \"*.mp4\"cd || kMDItemFSName == \"*.mov\"cd)");
}

TEST_F(PredicateCompilerTest, ExtensionExistenceRequiresASuffix) {
  EXPECT_EQ(compile(item_.file_extension().exists()), "kMDItemFSName == \"*.*\"");
  EXPECT_EQ(compile(item_.file_extension().missing()), "!(kMDItemFSName == \"*.*\")");
}

TEST_F(PredicateCompilerTest, FileTypesCompileToContentTypeTree) {
  EXPECT_EQ(compile(item_.file_type().equals(FileType::Image)),
            "kMDItemContentTypeTree == \"public.image\"cd");
  EXPECT_EQ(compile(item_.is_folder()), "kMDItemContentTypeTree == \"public.folder\"cd");
  EXPECT_EQ(compile(item_.file_type().conforms_to("public.jpeg")),
            "kMDItemContentTypeTree == \"public.jpeg\"cd");
}

TEST_F(PredicateCompilerTest, ConformsToAnyIsADisjunction) {
  // Arrange
  Predicate predicate = item_.file_type().conforms_to_any({"public.jpeg", "com.adobe.pdf"});

  // Act
  CompiledPredicate compiled = compile_predicate(predicate);

  // Assert
  EXPECT_EQ(compiled.query,
            "(kMDItemContentTypeTree == \"public.jpeg\"cd || "
            "kMDItemContentTypeTree == \"com.adobe.pdf\"cd)");
  EXPECT_EQ(compiled.referenced_attributes.count(AttributeId::FileType), 1u);
  EXPECT_THROW(item_.file_type().conforms_to_any({}), PredicateError);
}

TEST_F(PredicateCompilerTest, RangesAreInclusive) {
  EXPECT_EQ(compile(item_.file_size().between(10, 20)),
            "(kMDItemFSSize >= 10 && kMDItemFSSize <= 20)");
}

TEST_F(PredicateCompilerTest, DateBucketsAreHalfOpen) {
  // Arrange
  TimePoint now = TestUtilities::time_at("2024-03-15T10:00:00Z");

  // Act
  std::string query = compile(item_.modification_date().is(DateValue::today(), now));

  // Assert
  EXPECT_EQ(query,
            "(kMDItemFSContentChangeDate >= $time.iso(2024-03-15T00:00:00Z) && "
            "kMDItemFSContentChangeDate < $time.iso(2024-03-16T00:00:00Z))");
}

TEST_F(PredicateCompilerTest, ConnectivesAreFlattenedAndParenthesized) {
  // Arrange
  Predicate a = item_.file_name().contains("a");
  Predicate b = item_.file_size().greater_than(1);
  Predicate c = item_.file_is_invisible().is_false();

  // Act
  std::string conjunction = compile(a.and_(b).and_(c));
  std::string mixed = compile(a.or_(b).and_(c.not_()));

  // Assert
  EXPECT_EQ(conjunction,
            "(kMDItemFSName == \"*a*\"cd && kMDItemFSSize > 1 && kMDItemFSInvisible == 0)");
  EXPECT_EQ(mixed,
            "((kMDItemFSName == \"*a*\"cd || kMDItemFSSize > 1) && !(kMDItemFSInvisible == 0))");
}

TEST_F(PredicateCompilerTest, CompilationIsDeterministic) {
  Predicate predicate = item_.file_name().contains("x").or_(item_.finder_tags().contains("red"));

  EXPECT_EQ(compile(predicate), compile(predicate));
}

TEST_F(PredicateCompilerTest, ReferencedAttributesCoverEveryLeaf) {
  // Arrange
  Predicate predicate = item_.file_name()
                            .contains("a")
                            .and_(item_.file_size().between(1, 2).not_())
                            .or_(item_.creation_date().is(DateValue::yesterday()));

  // Act
  CompiledPredicate compiled = compile_predicate(predicate);

  // Assert
  EXPECT_EQ(compiled.referenced_attributes,
            (std::set<AttributeId>{AttributeId::FileName, AttributeId::FileSize,
                                   AttributeId::CreationDate}));
}

TEST_F(PredicateCompilerTest, FormatsLiteralValues) {
  EXPECT_EQ(format_query_value(AttributeValue{std::string("x\"y")}), "\"x\\\"y\"");
  EXPECT_EQ(format_query_value(AttributeValue{std::int64_t{7}}), "7");
  EXPECT_EQ(format_query_value(AttributeValue{0.25}), "0.25");
  EXPECT_EQ(format_query_value(AttributeValue{false}), "0");
  EXPECT_EQ(format_query_value(AttributeValue{TestUtilities::time_at("2024-01-01T00:00:00Z")}),
            "$time.iso(2024-01-01T00:00:00Z)");
}

}  // namespace mdquery_tests
