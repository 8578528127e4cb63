#pragma once
#include <stdexcept>
#include <string>

namespace mwtab {

// A line that cannot be decomposed by the tokenizer. Aborts the document.
class TokenizeError : public std::runtime_error
{
    size_t line;
    std::string raw;
    std::string why;

public:
    TokenizeError(size_t line_index, std::string raw_line, std::string reason)
        : std::runtime_error("line " + std::to_string(line_index) + ": " + reason + ": \"" + raw_line + "\""),
          line(line_index), raw(std::move(raw_line)), why(std::move(reason)) {}

    size_t line_index() const { return line; }
    const std::string& raw_line() const { return raw; }
    const std::string& reason() const { return why; }
};

// Structurally required element missing or impossible merge target.
class BuildError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Content that is neither native text nor structured form, or an unsupported target.
class UnknownFormat : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace mwtab
