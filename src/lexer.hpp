#pragma once
#include "multimap.hpp"
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mwtab {

enum class TokenType
{
    SECTION_START,
    END_OF_SECTION,
    KEY_VALUE,
    KEY_VALUE_LIST,
    SUBJECT_SAMPLE_FACTOR_ROW,
    BLOCK_START,
    BLOCK_END,
    END_OF_FILE,
};

std::string_view to_string(TokenType type);

struct FactorRow
{
    std::string subject_id;
    std::string sample_id;
    Multimap factors;
    std::optional<Multimap> extra;
};

struct Token
{
    TokenType type;
    std::string key;                 // section name, item key, block marker or row label
    std::string value;               // KEY_VALUE only
    std::vector<std::string> values; // KEY_VALUE_LIST cells, label first
    std::optional<FactorRow> row;    // SUBJECT_SAMPLE_FACTOR_ROW only
    size_t line = 0;
    std::string to_string() const;
};

/**
 * Line scanner for the mwTab text form.
 *
 * Tokens are produced lazily by next(); the stream always ends with
 * END_OF_SECTION, END_OF_FILE even when the text has no "#END" line.
 * A Lexer is single use: scanning again needs a fresh instance.
 */
class Lexer
{
    std::string_view source;
    size_t cursor = 0;
    size_t line_number = 0;
    std::deque<Token> pending;
    bool in_block = false;
    bool finished = false;

public:
    explicit Lexer(std::string_view src) : source(src) {}

    Token next();
    bool done() const { return finished && pending.empty(); }
    // Drains the remaining stream, END_OF_FILE included.
    std::vector<Token> tokenize();

private:
    std::optional<std::string_view> next_line();
    void scan_line(std::string_view line);
    void scan_block_line(std::string_view line);
    void scan_header(std::string_view line);
    void scan_factor_row(std::string_view line);
    void scan_item(std::string_view line);
    void emit(TokenType type, std::string key = "", std::string value = "");

    constexpr bool is_eof() const { return cursor >= source.length(); }
};

} // namespace mwtab
