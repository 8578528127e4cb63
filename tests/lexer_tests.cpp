#include "../src/lexer.hpp"
#include "../src/errors.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace mwtab;

namespace {
struct TokenExpectation {
    TokenType type;
    std::string key;
    std::string value;
};

void expect_tokens(std::string_view source, const std::vector<TokenExpectation>& expected) {
    Lexer lexer(source);
    const auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), expected.size()) << "Token count mismatch";

    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i].type) << "Token type mismatch at index " << i << ": " << tokens[i].to_string();
        EXPECT_EQ(tokens[i].key, expected[i].key) << "Token key mismatch at index " << i;
        EXPECT_EQ(tokens[i].value, expected[i].value) << "Token value mismatch at index " << i;
    }
}

size_t tokenize_error_line(std::string_view source) {
    Lexer lexer(source);
    try {
        lexer.tokenize();
    } catch (const TokenizeError& err) {
        return err.line_index();
    }
    ADD_FAILURE() << "Expected a TokenizeError";
    return 0;
}
} // namespace

TEST(LexerTests, ScansHeaderAndSections) {
    const std::string source =
        "#METABOLOMICS WORKBENCH STUDY_ID:ST000001 ANALYSIS_ID:AN000001\n"
        "VERSION\t1\n"
        "#PROJECT\n"
        "PR:PROJECT_TITLE\tLiver study\n"
        "#END\n";

    expect_tokens(source, {
        {TokenType::SECTION_START, "METABOLOMICS WORKBENCH", ""},
        {TokenType::KEY_VALUE, "STUDY_ID", "ST000001"},
        {TokenType::KEY_VALUE, "ANALYSIS_ID", "AN000001"},
        {TokenType::KEY_VALUE, "VERSION", "1"},
        {TokenType::END_OF_SECTION, "", ""},
        {TokenType::SECTION_START, "PROJECT", ""},
        {TokenType::KEY_VALUE, "PROJECT_TITLE", "Liver study"},
        {TokenType::END_OF_SECTION, "", ""},
        {TokenType::SECTION_START, "END", ""},
        {TokenType::END_OF_SECTION, "", ""},
        {TokenType::END_OF_FILE, "", ""},
    });
}

TEST(LexerTests, TerminatesWithoutEndMarker) {
    const std::string source = "#METABOLOMICS WORKBENCH STUDY_ID:ST000001\n#STUDY\nST:STUDY_TITLE\tA\n";

    expect_tokens(source, {
        {TokenType::SECTION_START, "METABOLOMICS WORKBENCH", ""},
        {TokenType::KEY_VALUE, "STUDY_ID", "ST000001"},
        {TokenType::END_OF_SECTION, "", ""},
        {TokenType::SECTION_START, "STUDY", ""},
        {TokenType::KEY_VALUE, "STUDY_TITLE", "A"},
        {TokenType::END_OF_SECTION, "", ""},
        {TokenType::END_OF_FILE, "", ""},
    });
}

TEST(LexerTests, KeepsEndOfFileAfterStreamIsDrained) {
    Lexer lexer("#PROJECT\n");
    lexer.tokenize();
    EXPECT_TRUE(lexer.done());
    EXPECT_EQ(lexer.next().type, TokenType::END_OF_FILE);
}

TEST(LexerTests, SkipsBlankLinesAndCarriageReturns) {
    const std::string source = "#PROJECT\r\n\r\n\nPR:PHONE\t555-0100\r\n";

    expect_tokens(source, {
        {TokenType::END_OF_SECTION, "", ""},
        {TokenType::SECTION_START, "PROJECT", ""},
        {TokenType::KEY_VALUE, "PHONE", "555-0100"},
        {TokenType::END_OF_SECTION, "", ""},
        {TokenType::END_OF_FILE, "", ""},
    });
}

TEST(LexerTests, PrefixedValuesAreKeptVerbatim) {
    Lexer lexer("#PROJECT\nPR:PROJECT_SUMMARY           \t  indented text \nUNPREFIXED\t  padded  \n");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[2].key, "PROJECT_SUMMARY");
    EXPECT_EQ(tokens[2].value, "  indented text ");
    EXPECT_EQ(tokens[3].key, "UNPREFIXED");
    EXPECT_EQ(tokens[3].value, "padded");
}

TEST(LexerTests, UnitsLineBecomesUnitsKey) {
    Lexer lexer("#MS_METABOLITE_DATA\nMS_METABOLITE_DATA:UNITS         \tPeak area\n");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].type, TokenType::KEY_VALUE);
    EXPECT_EQ(tokens[2].key, "Units");
    EXPECT_EQ(tokens[2].value, "Peak area");
}

TEST(LexerTests, ResultsFileKeepsTabSeparatedAttributes) {
    Lexer lexer("#MS\nMS:MS_RESULTS_FILE\tST000001_AN000001_Results.txt\tUNITS:Peak area\tHas m/z:Yes\n");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].key, "MS_RESULTS_FILE");
    EXPECT_EQ(tokens[2].value, "ST000001_AN000001_Results.txt\tUNITS:Peak area\tHas m/z:Yes");
}

TEST(LexerTests, ScansDataBlockRows) {
    const std::string source =
        "#MS_METABOLITE_DATA\n"
        "MS_METABOLITE_DATA_START\n"
        "Samples\tS001\tS002\n"
        "\"glucose\"\t 1000 \t2000\n"
        "MS_METABOLITE_DATA_END\n";

    Lexer lexer(source);
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 8u);
    EXPECT_EQ(tokens[2].type, TokenType::BLOCK_START);
    EXPECT_EQ(tokens[2].key, "MS_METABOLITE_DATA_START");
    EXPECT_EQ(tokens[3].type, TokenType::KEY_VALUE_LIST);
    EXPECT_EQ(tokens[3].values, (std::vector<std::string>{"Samples", "S001", "S002"}));
    EXPECT_EQ(tokens[4].key, "glucose");
    EXPECT_EQ(tokens[4].values, (std::vector<std::string>{"glucose", "1000", "2000"}));
    EXPECT_EQ(tokens[5].type, TokenType::BLOCK_END);
    EXPECT_EQ(tokens[5].key, "MS_METABOLITE_DATA_END");
}

TEST(LexerTests, DecomposesSubjectSampleFactorRow) {
    Lexer lexer("SUBJECT_SAMPLE_FACTORS           \tSU001\tS001\tTreatment:Control | Time:0h\tRAW_FILE_NAME=a.raw; Batch=1\n");
    auto token = lexer.next();

    ASSERT_EQ(token.type, TokenType::SUBJECT_SAMPLE_FACTOR_ROW);
    ASSERT_TRUE(token.row.has_value());
    EXPECT_EQ(token.row->subject_id, "SU001");
    EXPECT_EQ(token.row->sample_id, "S001");
    EXPECT_EQ(token.row->factors, (Multimap{{"Treatment", "Control"}, {"Time", "0h"}}));
    ASSERT_TRUE(token.row->extra.has_value());
    EXPECT_EQ(*token.row->extra, (Multimap{{"RAW_FILE_NAME", "a.raw"}, {"Batch", "1"}}));
}

TEST(LexerTests, FactorRowWithoutAdditionalData) {
    Lexer lexer("SUBJECT_SAMPLE_FACTORS\t-\tS001\tTreatment:Control\t\n");
    auto token = lexer.next();

    ASSERT_TRUE(token.row.has_value());
    EXPECT_EQ(token.row->subject_id, "-");
    EXPECT_FALSE(token.row->extra.has_value());
}

TEST(LexerTests, RejectsShortFactorRow) {
    EXPECT_EQ(tokenize_error_line("#SUBJECT_SAMPLE_FACTORS:\nSUBJECT_SAMPLE_FACTORS\tSU001\tS001\n"), 2u);
}

TEST(LexerTests, RejectsFactorWithoutColon) {
    Lexer lexer("SUBJECT_SAMPLE_FACTORS\tSU001\tS001\tControl\n");
    try {
        lexer.tokenize();
        FAIL() << "Expected a TokenizeError";
    } catch (const TokenizeError& err) {
        EXPECT_EQ(err.line_index(), 1u);
        EXPECT_NE(err.reason().find("MalformedRow"), std::string::npos);
        EXPECT_EQ(err.raw_line(), "SUBJECT_SAMPLE_FACTORS\tSU001\tS001\tControl");
    }
}

TEST(LexerTests, RejectsItemWithoutTab) {
    EXPECT_EQ(tokenize_error_line("#PROJECT\nPR:PROJECT_TITLE Liver study\n"), 2u);
}

TEST(LexerTests, RejectsUnterminatedBlock) {
    EXPECT_THROW(Lexer("#MS_METABOLITE_DATA\nMS_METABOLITE_DATA_START\nSamples\tS001\n").tokenize(), TokenizeError);
}
