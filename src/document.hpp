#pragma once
#include "multimap.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mwtab {

constexpr std::string_view HEADER_SECTION = "METABOLOMICS WORKBENCH";
constexpr std::string_view SSF_SECTION = "SUBJECT_SAMPLE_FACTORS";
constexpr std::string_view METABOLITES_SECTION = "METABOLITES";
constexpr std::string_view LABEL_COLUMN = "Metabolite";
constexpr std::string_view BIN_LABEL_COLUMN = "Bin range(ppm)";

// Canonical section order used before serialization.
constexpr std::array<std::string_view, 15> SECTION_ORDER = {
    "METABOLOMICS WORKBENCH", "PROJECT", "STUDY", "SUBJECT", "SUBJECT_SAMPLE_FACTORS",
    "COLLECTION", "TREATMENT", "SAMPLEPREP", "CHROMATOGRAPHY", "ANALYSIS",
    "MS", "NM", "MS_METABOLITE_DATA", "NMR_METABOLITE_DATA", "NMR_BINNED_DATA",
};

enum class Format
{
    MWTAB,
    JSON,
};

std::string_view to_string(Format format);
Format parse_format(std::string_view name);

// Two-letter key prefix written before item keys ("PR:", "ST:", ...), empty if none.
std::string_view section_prefix(std::string_view section);
bool is_data_section_name(std::string_view section);

using Row = Multimap;

struct Table
{
    // Captured header line, label cell first. Empty for tables not read from text.
    std::vector<std::string> header;
    std::vector<Row> rows;

    // Column names after the label column.
    std::vector<std::string> columns() const;
    std::vector<std::string> labels() const;

    bool operator==(const Table& other) const { return rows == other.rows; }
};

/**
 * Results-file composite: a filename plus labeled attributes packed into a
 * single line ("ST000001_results.txt UNITS:Peak area Has m/z:Yes").
 */
struct ResultsFile
{
    std::string key;
    std::optional<std::string> filename;
    std::optional<std::string> units;
    std::optional<std::string> has_mz;
    std::optional<std::string> has_rt;
    std::optional<std::string> rt_units;

    static ResultsFile parse(std::string key, std::string_view text);

    // (name, value) for every present attribute, filename first.
    std::vector<std::pair<std::string, std::string>> fields() const;
    std::string render(std::string_view separator) const;

    bool operator==(const ResultsFile&) const = default;
};

struct ItemSection
{
    Multimap items;
    // The composite's key also holds a placeholder entry in items to keep its position.
    std::optional<ResultsFile> results_file;

    void set_results_file(ResultsFile file);

    bool operator==(const ItemSection&) const = default;
};

struct SubjectSampleFactor
{
    std::optional<std::string> subject_id;
    std::optional<std::string> sample_id;
    Multimap factors;
    std::optional<Multimap> additional_data;
    // Keys other than the four above, only reachable from structured input.
    Multimap other;
    // False for a structured entry with no "Factors" member.
    bool has_factors = true;

    bool operator==(const SubjectSampleFactor&) const = default;
};

struct ListSection
{
    std::vector<SubjectSampleFactor> rows;

    bool operator==(const ListSection&) const = default;
};

struct DataSection
{
    std::optional<std::string> units;
    std::optional<Table> data;
    std::optional<Table> metabolites;
    std::optional<Table> extended;
    std::optional<ResultsFile> results_file;
    Multimap items;

    bool operator==(const DataSection&) const = default;
};

using Section = std::variant<ItemSection, ListSection, DataSection>;

class Document
{
public:
    using NamedSection = std::pair<std::string, Section>;

    std::string source;
    Format input_format = Format::MWTAB;

    // Side channels captured while building from text.
    std::optional<Multimap> data_factors; // sample id -> "k:v | k:v"
    std::vector<std::string> short_headers; // blocks with rows longer than their header
    std::vector<std::pair<std::string, std::string>> duplicate_sub_sections;

    const std::vector<NamedSection>& sections() const { return sections_; }
    std::vector<NamedSection>& sections() { return sections_; }
    std::vector<std::string> section_names() const;

    Section* find(std::string_view name);
    const Section* find(std::string_view name) const;
    bool contains(std::string_view name) const { return find(name) != nullptr; }

    template <typename T>
    T* get(std::string_view name)
    {
        auto* section = find(name);
        return section ? std::get_if<T>(section) : nullptr;
    }

    template <typename T>
    const T* get(std::string_view name) const
    {
        const auto* section = find(name);
        return section ? std::get_if<T>(section) : nullptr;
    }

    // Replaces an existing section in place, or appends a new one.
    Section& set(const std::string& name, Section section);
    bool erase(std::string_view name);

    const ItemSection* header() const { return get<ItemSection>(HEADER_SECTION); }
    std::string study_id() const;
    std::string analysis_id() const;

    // First section holding metabolite or binned data, empty if none.
    std::string data_section_name() const;
    const DataSection* data_section() const;

    void add_short_header(const std::string& block);
    void add_duplicate_sub_section(const std::string& section, const std::string& key);

    bool operator==(const Document& other) const
    {
        return sections_ == other.sections_ && data_factors == other.data_factors;
    }

private:
    std::vector<NamedSection> sections_;
};

// Puts sections, data-section tables and row labels into canonical order. Idempotent.
void canonicalize(Document& doc);

} // namespace mwtab
