#include "reader.hpp"
#include "errors.hpp"
#include "parser.hpp"
#include "structured.hpp"
#include "text.hpp"
#include <fstream>
#include <sstream>

namespace mwtab {

Format detect_format(std::string_view text) {
    size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) ++begin;
    if (begin == text.size()) throw UnknownFormat("Input is empty");

    if (text.substr(begin).starts_with("#METABOLOMICS WORKBENCH")) return Format::MWTAB;

    if (parse_json(text).isObject()) return Format::JSON;
    throw UnknownFormat("Input is neither mwTab text nor a JSON object");
}

Document read(const std::string& source, std::string_view text, std::optional<Format> format) {
    Format chosen = format ? *format : detect_format(text);
    switch (chosen) {
    case Format::MWTAB: return build(source, text);
    case Format::JSON: return from_structured(source, parse_json(text));
    }
    throw UnknownFormat("Unsupported input format");
}

std::string read_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace mwtab
