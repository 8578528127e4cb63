#pragma once
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace mwtab {

enum class Severity
{
    ERROR,
    WARNING,
};

enum class Tag
{
    VALUE,
    CONSISTENCY,
    FORMAT,
};

constexpr std::string_view to_string(Severity severity) {
    return severity == Severity::ERROR ? "Error" : "Warning";
}

constexpr std::string_view to_string(Tag tag) {
    switch (tag) {
    case Tag::VALUE: return "value";
    case Tag::CONSISTENCY: return "consistency";
    case Tag::FORMAT: return "format";
    }
    return "";
}

/**
 * @brief One validation observation.
 *
 * The message always starts with "Error: " or "Warning: " matching severity.
 * id is a stable number per kind of check; name is its short title.
 */
struct Finding
{
    Severity severity = Severity::ERROR;
    std::string message;
    std::vector<Tag> tags;
    std::string section;
    std::string sub_section;
    int id = 0;
    std::string name;

    bool operator==(const Finding&) const = default;
};

struct Report
{
    std::vector<Finding> findings;

    bool passing() const { return findings.empty(); }
    size_t size() const { return findings.size(); }

    size_t count(Severity severity) const {
        return std::count_if(findings.begin(), findings.end(),
                             [&](const Finding& f) { return f.severity == severity; });
    }

    size_t count(Tag tag) const {
        size_t total = 0;
        for (const auto& f : findings) total += std::count(f.tags.begin(), f.tags.end(), tag);
        return total;
    }

    void add(Severity severity, int id, std::string name, std::vector<Tag> tags,
             std::string section, std::string sub_section, const std::string& body) {
        findings.push_back({severity, std::string(to_string(severity)) + ": " + body, std::move(tags),
                            std::move(section), std::move(sub_section), id, std::move(name)});
    }

    bool operator==(const Report&) const = default;
};

} // namespace mwtab
