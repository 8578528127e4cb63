#pragma once
#include "document.hpp"
#include "report.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace re2 {
class RE2;
}

namespace mwtab {

// Values treated as "no value" in metadata fields.
bool is_na_value(std::string_view value);
// Same list minus "NA", which is a real metabolite name.
bool is_metabolite_na_value(std::string_view value);

// Number followed by a space and one of units, optionally a range ("5-6 V", "5 to 6 V").
std::string units_pattern(const std::vector<std::string>& units, bool can_be_range);
std::string units_message(const std::vector<std::string>& units, bool can_be_range);

enum class SectionKind
{
    ITEMS,
    FACTORS,
    DATA,
};

/**
 * @brief Checks applied to one key of a section.
 *
 * pattern is searched (not anchored unless the expression says so); a value
 * matching rejected fails. allowed, when non-empty, is an exact enumeration.
 * A composite field holds a results-file composite checked against the
 * table's results_file rules.
 */
struct FieldRule
{
    std::string key;
    bool reject_na = false;
    std::shared_ptr<const re2::RE2> pattern;
    std::string pattern_message;
    std::shared_ptr<const re2::RE2> rejected;
    std::string rejected_message;
    std::vector<std::string> allowed;
    bool email = false;
    bool composite = false;
};

struct SectionSchema
{
    std::string name;
    SectionKind kind = SectionKind::ITEMS;
    std::vector<FieldRule> fields;
    std::vector<std::string> required;

    // FACTORS only: rules for keys of "Additional sample data".
    std::vector<FieldRule> additional_fields;
    // DATA only: whether Metabolites and Extended tables may appear.
    bool annotation_tables = true;

    const FieldRule* field(std::string_view key) const;
    bool is_required(std::string_view key) const;
};

/**
 * Per-analysis-kind schema: every section the document may hold, which of
 * them are mandatory, and where results must live when no data section is
 * present.
 */
struct SchemaTable
{
    std::string analysis_section;
    std::vector<SectionSchema> sections;
    std::vector<std::string> required_sections;
    SectionSchema results_file;

    // If none of these are present, analysis_section must carry results_key.
    std::vector<std::string> result_sections;
    std::string results_key;
    std::string missing_results_message;

    const SectionSchema* find(std::string_view name) const;
};

const SchemaTable& ms_schema();
const SchemaTable& nmr_schema();

// Appends one finding per schema violation, in schema order.
void check_schema(const Document& doc, const SchemaTable& schema, Report& report);

} // namespace mwtab
