#include "text.hpp"
#include <cctype>

namespace mwtab {

std::string strip(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return std::string(text.substr(begin, end - begin));
}

std::string strip(std::string_view text, std::string_view chars) {
    size_t begin = text.find_first_not_of(chars);
    if (begin == std::string_view::npos) return "";
    size_t end = text.find_last_not_of(chars);
    return std::string(text.substr(begin, end - begin + 1));
}

std::string rstrip(std::string_view text) {
    size_t end = text.size();
    while (end > 0 && is_space(text[end - 1])) --end;
    return std::string(text.substr(0, end));
}

std::string to_lower(std::string_view text) {
    std::string result(text);
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::vector<std::string> split(std::string_view text, std::string_view delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            return parts;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + delimiter.size();
    }
}

std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i > start) parts.emplace_back(text.substr(start, i - start));
    }
    return parts;
}

std::optional<std::pair<std::string, std::string>> split_first(std::string_view text, std::string_view delimiter) {
    size_t pos = text.find(delimiter);
    if (pos == std::string_view::npos) return std::nullopt;
    return std::make_pair(std::string(text.substr(0, pos)), std::string(text.substr(pos + delimiter.size())));
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::string join_quoted(const std::vector<std::string>& parts, std::string_view separator, char quote) {
    std::vector<std::string> quoted;
    quoted.reserve(parts.size());
    for (const auto& part : parts) quoted.push_back(quote + part + quote);
    return join(quoted, separator);
}

std::string bracket_list(const std::vector<std::string>& parts) {
    return "[" + join_quoted(parts, ", ", '\'') + "]";
}

size_t utf8_length(std::string_view text) {
    size_t length = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++length;
    }
    return length;
}

} // namespace mwtab
