#include "../src/column_matching.hpp"

#include <gtest/gtest.h>
#include <re2/re2.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mwtab;

namespace {
const ColumnFinder& finder(const std::string& name) {
    const auto* found = find_column_finder(name);
    if (!found) throw std::runtime_error("No column finder named " + name);
    return *found;
}

bool fullMatch(const std::string& value, const std::string& pattern) {
    re2::RE2 compiled(pattern);
    return re2::RE2::FullMatch(value, compiled);
}
} // namespace

TEST(ColumnMatchingTests, ListRegexNeedsDelimiterUnlessEmptyAllowed) {
    EXPECT_TRUE(fullMatch("1,2,3", make_list_regex(R"(\d+)", ",")));
    EXPECT_TRUE(fullMatch("1 , 2", make_list_regex(R"(\d+)", ",")));
    EXPECT_FALSE(fullMatch("1", make_list_regex(R"(\d+)", ",")));
    EXPECT_TRUE(fullMatch("1", make_list_regex(R"(\d+)", ",", false, true)));
    EXPECT_TRUE(fullMatch("'1','2'", make_list_regex(R"(\d+)", ",", true)));
    EXPECT_FALSE(fullMatch("a,b", make_list_regex(R"(\d+)", ",")));
}

TEST(ColumnMatchingTests, RecognizesColumnMissingValues) {
    EXPECT_TRUE(is_column_na_value(""));
    EXPECT_TRUE(is_column_na_value("Internal Standard"));
    EXPECT_TRUE(is_column_na_value("NF"));
    EXPECT_FALSE(is_column_na_value("glucose"));
}

TEST(ColumnMatchingTests, DetectsNumbers) {
    EXPECT_TRUE(is_numeric("12"));
    EXPECT_TRUE(is_numeric("-1.5e3"));
    EXPECT_FALSE(is_numeric("12a"));
    EXPECT_FALSE(is_numeric(""));
    EXPECT_FALSE(is_numeric("nan"));
}

TEST(ColumnMatchingTests, CompilePatternRejectsBadExpression) {
    EXPECT_THROW(compile_pattern("(unclosed"), std::runtime_error);
    EXPECT_NO_THROW(compile_pattern("(?i)closed"));
}

TEST(ColumnMatchingTests, RetentionTimeNames) {
    const auto& rt = finder("retention_time").name;

    EXPECT_TRUE(rt.matches("rt"));
    EXPECT_TRUE(rt.matches("rt (min)"));
    EXPECT_TRUE(rt.matches("retention time"));
    EXPECT_TRUE(rt.matches("medrt"));
    EXPECT_FALSE(rt.matches("rt error"));
    EXPECT_FALSE(rt.matches("retention index"));
    EXPECT_FALSE(rt.matches("smart"));
}

TEST(ColumnMatchingTests, MatchLowersAndKeepsOriginalNames) {
    const auto& rt = finder("retention_time").name;

    EXPECT_EQ(rt.match({"Metabolite", " RT ", "Retention Time", "kegg_id"}),
              (std::vector<std::string>{" RT ", "Retention Time"}));
}

TEST(ColumnMatchingTests, DatabaseIdNamesDoNotOverlap) {
    EXPECT_TRUE(finder("pubchem_id").name.matches("pubchem_id"));
    EXPECT_TRUE(finder("pubchem_id").name.matches("cid"));
    EXPECT_FALSE(finder("pubchem_id").name.matches("kegg/pubchem"));
    EXPECT_TRUE(finder("kegg_id").name.matches("kegg_id"));
    EXPECT_FALSE(finder("other_id").name.matches("pubchem_id"));
    EXPECT_TRUE(finder("other_id").name.matches("id"));
    EXPECT_TRUE(finder("other_id").name.matches("database identifier"));
}

TEST(ColumnMatchingTests, PlainMetaboliteLabelMatchesNothing) {
    for (const auto& column : column_finders()) {
        EXPECT_FALSE(column.name.matches("metabolite")) << column.standard_name;
    }
}

TEST(ColumnMatchingTests, ValueMatcherChecksPattern) {
    const auto& kegg = finder("kegg_id").values;

    EXPECT_TRUE(kegg.matches("C00031"));
    EXPECT_TRUE(kegg.matches("C00031, C00221"));
    EXPECT_FALSE(kegg.matches("glucose"));
    EXPECT_TRUE(kegg.matches("-"));
    EXPECT_FALSE(kegg.matches("-", false));
}

TEST(ColumnMatchingTests, ValueMatcherChecksType) {
    ValueMatcher integer(ValueType::INTEGER);
    EXPECT_TRUE(integer.matches("12"));
    EXPECT_FALSE(integer.matches("1.5"));
    EXPECT_FALSE(integer.matches("abc"));

    ValueMatcher numeric(ValueType::NUMERIC);
    EXPECT_TRUE(numeric.matches("1.5"));
    EXPECT_FALSE(numeric.matches("abc"));

    ValueMatcher text(ValueType::NON_NUMERIC);
    EXPECT_TRUE(text.matches("abc"));
    EXPECT_TRUE(text.matches("NA"));
    EXPECT_FALSE(text.matches("12"));
}

TEST(ColumnMatchingTests, InverseExpressionRejectsMatches) {
    ValueMatcher not_float(ValueType::ANY, "", patterns::FLOAT);

    EXPECT_TRUE(not_float.matches("abc"));
    EXPECT_FALSE(not_float.matches("0.25"));
}

TEST(ColumnMatchingTests, ValueMatcherIgnoresSurroundingMarks) {
    const auto& pubchem = finder("pubchem_id").values;

    EXPECT_TRUE(pubchem.matches(" 5793 "));
    EXPECT_TRUE(pubchem.matches("\xE2\x80\x8E" "5793"));
    EXPECT_TRUE(pubchem.matches("5793,612"));
    EXPECT_FALSE(pubchem.matches("CHEBI:17234"));
}

TEST(ColumnMatchingTests, FindsFindersByStandardName) {
    EXPECT_NE(find_column_finder("retention_index_type"), nullptr);
    EXPECT_EQ(find_column_finder("not_a_column"), nullptr);

    bool other_pair = false;
    for (const auto& [parent, implied] : implied_pairs()) {
        if (parent == "other_id") other_pair = implied == std::vector<std::string>{"other_id_type"};
    }
    EXPECT_TRUE(other_pair);
}
