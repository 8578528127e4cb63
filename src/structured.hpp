#pragma once
#include "document.hpp"
#include <json/json.h>
#include <string>
#include <string_view>
#include <vector>

namespace mwtab {

// Members of a JSON object in document order. Order is carried by each
// member's offset (byte offset when parsed, ordinal when built here).
std::vector<std::string> ordered_members(const Json::Value& object);

// "Factors{{{_1_}}}" for the second occurrence of "Factors".
std::string encode_duplicate_key(const std::string& key, size_t occurrence);
// Strips a duplicate-key suffix, if any.
std::string decode_duplicate_key(const std::string& key);

Json::Value to_structured(const Document& doc);
Document from_structured(const std::string& source, const Json::Value& root);

Json::Value parse_json(std::string_view text);
// 4-space indented JSON with members in document order and non-ASCII escaped.
std::string write_json(const Json::Value& value);

} // namespace mwtab
