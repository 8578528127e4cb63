#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mwtab {

constexpr bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string strip(std::string_view text);
std::string strip(std::string_view text, std::string_view chars);
std::string rstrip(std::string_view text);
std::string to_lower(std::string_view text);

// Splits on every occurrence of delimiter; an empty input yields one empty field.
std::vector<std::string> split(std::string_view text, std::string_view delimiter);
// Splits on runs of whitespace, dropping empty fields.
std::vector<std::string> split_whitespace(std::string_view text);
// Splits on the first delimiter, nullopt if it does not occur.
std::optional<std::pair<std::string, std::string>> split_first(std::string_view text, std::string_view delimiter);

std::string join(const std::vector<std::string>& parts, std::string_view separator);
// Wraps each part in quote characters before joining.
std::string join_quoted(const std::vector<std::string>& parts, std::string_view separator, char quote = '"');
// ['a', 'b']
std::string bracket_list(const std::vector<std::string>& parts);

// Number of code points in a UTF-8 string.
size_t utf8_length(std::string_view text);

} // namespace mwtab
