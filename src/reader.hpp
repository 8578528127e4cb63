#pragma once
#include "document.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mwtab {

// mwTab when the first non-blank line is the header sentinel, else JSON if it
// parses as an object. Throws UnknownFormat otherwise.
Format detect_format(std::string_view text);

// Builds one document from text in either form.
Document read(const std::string& source, std::string_view text, std::optional<Format> format = std::nullopt);

std::string read_file(const std::string& filename);

} // namespace mwtab
