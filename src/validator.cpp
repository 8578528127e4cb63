#include "validator.hpp"
#include "column_matching.hpp"
#include "text.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <optional>
#include <set>
#include <sstream>

namespace mwtab {

std::string_view engine_version() {
    return ENGINE_VERSION;
}

std::string ordinal_suffix(size_t number) {
    std::string suffix = "th";
    size_t tens = number % 100;
    if (tens < 10 || tens > 20) {
        switch (number % 10) {
        case 1: suffix = "st"; break;
        case 2: suffix = "nd"; break;
        case 3: suffix = "rd"; break;
        default: break;
        }
    }
    return std::to_string(number) + suffix;
}

std::string format_column_name(const std::string& name, size_t occurrence, size_t position) {
    if (occurrence > 0) {
        return "The " + ordinal_suffix(occurrence + 1) + " \"" + name + "\" column at position " + std::to_string(position);
    }
    return "The \"" + name + "\" column at position " + std::to_string(position);
}

namespace {
// Lowered header spellings that should never appear as a row label.
const std::vector<std::string> RESERVED_LABELS = {"samples", "factors", "bin range(ppm)", "metabolite_name",
                                                  "metabolite name"};
const std::set<std::string> POSITIVE_POLARITY = {"pos", "positive", "+"};
const std::set<std::string> NEGATIVE_POLARITY = {"neg", "negative", "-"};

struct Column
{
    std::string name;
    size_t occurrence = 0;
};

// Every column of a table, in order of first appearance across rows.
std::vector<Column> table_columns(const Table& table) {
    std::vector<Column> columns;
    for (const auto& row : table.rows) {
        for (const auto& entry : row) {
            bool seen = std::any_of(columns.begin(), columns.end(), [&](const Column& c) {
                return c.name == entry.key && c.occurrence == entry.occurrence;
            });
            if (!seen) columns.push_back({entry.key, entry.occurrence});
        }
    }
    return columns;
}

std::optional<std::string> cell(const Row& row, const Column& column) {
    for (const auto& entry : row) {
        if (entry.key == column.name && entry.occurrence == column.occurrence) return entry.value;
    }
    return std::nullopt;
}

bool is_null_cell(const std::optional<std::string>& value) {
    return !value || is_column_na_value(*value);
}

std::vector<std::string> stripped_labels(const std::optional<Table>& table) {
    std::vector<std::string> labels;
    if (!table) return labels;
    for (const auto& label : table->labels()) labels.push_back(strip(label));
    return labels;
}

// Later occurrences of values already seen.
std::vector<std::string> repeated_values(const std::vector<std::string>& values) {
    std::set<std::string> seen;
    std::vector<std::string> repeated;
    for (const auto& value : values) {
        if (!seen.insert(value).second) repeated.push_back(value);
    }
    return repeated;
}

std::vector<std::string> missing_from(const std::vector<std::string>& values, const std::vector<std::string>& pool) {
    std::vector<std::string> missing;
    for (const auto& value : values) {
        if (std::find(pool.begin(), pool.end(), value) == pool.end()) missing.push_back(value);
    }
    return missing;
}

std::string factor_string(const Multimap& factors) {
    std::vector<std::string> pairs;
    for (const auto& entry : factors) pairs.push_back(entry.key + ":" + entry.value);
    return join(pairs, " | ");
}

std::string current_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

const SchemaTable& select_schema(const Document& doc, Report& report) {
    bool has_ms = doc.contains("MS");
    bool has_nm = doc.contains("NM");
    if (has_ms && has_nm) {
        report.add(Severity::ERROR, 37, "Both MS and NM Sections", {Tag::FORMAT}, "", "",
                   R"(Both an "MS" and an "NM" section were found, so analysis type is ambiguous. NMR will be assumed.)");
    }
    if (has_nm) return nmr_schema();
    if (!has_ms) {
        report.add(Severity::ERROR, 32, "No MS or NM Section", {Tag::FORMAT}, "", "",
                   R"(No "MS" or "NM" section was found, so analysis type could not be determined. Mass spec will be assumed.)");
    }
    return ms_schema();
}

class Validator
{
public:
    Validator(const Document& d, Report& r)
        : doc(d), report(r), text_form(d.input_format == Format::MWTAB), data_name(d.data_section_name()),
          data(d.data_section()) {
        if (const auto* list = d.get<ListSection>(SSF_SECTION)) factor_rows = &list->rows;
    }

    void run(const SchemaTable& schema);

private:
    const Document& doc;
    Report& report;
    bool text_form;
    std::string data_name;
    const DataSection* data;
    const std::vector<SubjectSampleFactor>* factor_rows = nullptr;

    void checkFactorRows();
    void checkFactorAgreement();
    void checkSamples();
    void checkDataLabels();
    void checkMetaboliteLabels();
    void checkExtended();
    void checkColumnSemantics();
    void checkReservedLabels();
    void checkTable(const std::string& sub_section, const Table& table);
    void checkHeaderLengths();
    void checkSubSectionUniqueness();
    void checkPolarity();

    bool binned() const { return data_name.find("BINNED") != std::string::npos; }
    std::string tableLocation(const std::string& sub_section) const;
    std::set<std::string> factorSampleIds() const;
};

void Validator::run(const SchemaTable& schema) {
    check_schema(doc, schema, report);

    checkFactorRows();
    checkFactorAgreement();

    if (data) {
        checkSamples();
        checkDataLabels();
        checkMetaboliteLabels();
        if (data->extended) checkExtended();
        if (data->metabolites && !binned()) checkColumnSemantics();

        checkReservedLabels();
        if (data->data) checkTable("Data", *data->data);
        if (data->metabolites) checkTable("Metabolites", *data->metabolites);
        if (data->extended) checkTable("Extended", *data->extended);
    }

    checkHeaderLengths();
    checkSubSectionUniqueness();

    if (data && data->metabolites && !binned()) checkPolarity();
}

// ----------------------------------------------------------------------------
// Subject sample factors
// ----------------------------------------------------------------------------

void Validator::checkFactorRows() {
    if (!factor_rows) return;
    const std::string section(SSF_SECTION);

    std::set<std::string> seen;
    for (size_t i = 0; i < factor_rows->size(); ++i) {
        const auto& row = (*factor_rows)[i];
        std::string location = text_form ? section + " entry #" + std::to_string(i + 1)
                                         : "The SSF at [\"" + section + "\"][" + std::to_string(i) + "]";

        if (row.sample_id && !row.sample_id->empty()) {
            if (seen.count(*row.sample_id)) {
                report.add(Severity::WARNING, 4, "Duplicate Sample ID in SSF", {Tag::VALUE}, section, "",
                           location + " has a duplicate Sample ID.");
            }
            seen.insert(*row.sample_id);
        }

        std::vector<std::string> repeated;
        for (const auto& entry : row.factors) {
            if (entry.occurrence > 0) repeated.push_back(entry.key);
        }
        if (!repeated.empty()) {
            report.add(Severity::WARNING, 5, "Duplicate Factors in SSF", {Tag::VALUE}, section, "",
                       location + " has the following duplicate keys in its Factors:\n\t"
                           + join_quoted(repeated, "\n\t"));
        }

        if (row.additional_data) {
            repeated.clear();
            for (const auto& entry : *row.additional_data) {
                if (entry.occurrence > 0) repeated.push_back(entry.key);
            }
            if (!repeated.empty()) {
                report.add(Severity::WARNING, 6, "Duplicate Additional Data", {Tag::VALUE}, section, "",
                           location + " has the following duplicate keys in its Additional sample data:\n\t"
                               + join_quoted(repeated, "\n\t"));
            }
        }
    }
}

void Validator::checkFactorAgreement() {
    if (!doc.data_factors || doc.data_factors->empty()) return;

    std::map<std::string, std::string> from_data;
    for (const auto& entry : *doc.data_factors) from_data[entry.key] = entry.value;

    std::map<std::string, std::string> from_rows;
    if (factor_rows) {
        for (const auto& row : *factor_rows) {
            if (row.sample_id && from_data.count(*row.sample_id)) from_rows[*row.sample_id] = factor_string(row.factors);
        }
    }

    if (from_data != from_rows) {
        report.add(Severity::ERROR, 3, "Factor Mismatch", {Tag::CONSISTENCY}, std::string(SSF_SECTION), "",
                   "The factors in the METABOLITE_DATA section and SUBJECT_SAMPLE_FACTORS section do not match.");
    }
}

// ----------------------------------------------------------------------------
// Data section cross-references
// ----------------------------------------------------------------------------

void Validator::checkSamples() {
    if (!data->data) return;
    const auto& table = *data->data;

    std::vector<std::string> samples;
    if (table.header.size() > 1) {
        samples.assign(table.header.begin() + 1, table.header.end());
    } else {
        samples = table.columns();
    }

    auto known = factorSampleIds();
    std::set<std::string> missing;
    for (const auto& sample : samples) {
        if (!known.count(sample)) missing.insert(sample);
    }
    std::string location = text_form ? data_name : tableLocation("Data");
    if (!missing.empty()) {
        report.add(Severity::ERROR, 7, "Missing Sample ID(s) in SSF", {Tag::CONSISTENCY}, std::string(SSF_SECTION), "",
                   "SUBJECT_SAMPLE_FACTORS section missing sample ID(s). The following IDs were found in the "
                       + location + " section but not in the SUBJECT_SAMPLE_FACTORS:\n\t"
                       + join_quoted(std::vector<std::string>(missing.begin(), missing.end()), "\n\t"));
    }

    if (!repeated_values(samples).empty()) {
        report.add(Severity::WARNING, 8, "Duplicate Samples in DATA", {Tag::VALUE}, data_name, "Data",
                   "There are duplicate samples in the " + location + " section.");
    }
}

void Validator::checkDataLabels() {
    auto labels = stripped_labels(data->data);
    std::string location = tableLocation("Data");

    if (data->metabolites && !binned()) {
        auto missing = missing_from(labels, stripped_labels(data->metabolites));
        if (!missing.empty()) {
            report.add(Severity::WARNING, 9, "Metabolite(s) in DATA not METABOLITES", {Tag::CONSISTENCY}, data_name,
                       "Data",
                       "The following metabolites in the " + location + " table were not found in the "
                           + tableLocation("Metabolites") + " table:\n\t" + join_quoted(missing, "\n\t"));
        }
    }

    if (std::any_of(labels.begin(), labels.end(), is_metabolite_na_value)) {
        report.add(Severity::ERROR, 10, "Blank Metabolite(s) in DATA", {Tag::VALUE}, data_name, "Data",
                   "A metabolite without a name was found in the " + location + " table.");
    }

    auto repeated = repeated_values(labels);
    if (!repeated.empty()) {
        report.add(Severity::WARNING, 11, "Duplicate Metabolite(s) in DATA", {Tag::VALUE}, data_name, "Data",
                   "The following metabolites in the " + location + " table appear more than once in the table:\n\t"
                       + join_quoted(repeated, "\n\t"));
    }
}

void Validator::checkMetaboliteLabels() {
    if (data_name.find("METABOLITE_DATA") == std::string::npos) return;

    std::string location = tableLocation("Metabolites");
    if (!data->metabolites) {
        report.add(Severity::WARNING, 33, "Missing METABOLITES Section", {Tag::FORMAT}, "", "",
                   "Missing " + location + " section.");
        return;
    }

    auto labels = stripped_labels(data->metabolites);
    auto missing = missing_from(labels, stripped_labels(data->data));
    if (!missing.empty()) {
        report.add(Severity::WARNING, 12, "Metabolite(s) in METABOLITES not DATA", {Tag::CONSISTENCY}, data_name,
                   "Metabolites",
                   "The following metabolites in the " + location + " table were not found in the "
                       + tableLocation("Data") + " table:\n\t" + join_quoted(missing, "\n\t"));
    }

    if (std::any_of(labels.begin(), labels.end(), is_metabolite_na_value)) {
        report.add(Severity::ERROR, 13, "Blank Metabolite(s) in METABOLITES", {Tag::VALUE}, data_name, "Metabolites",
                   "A metabolite without a name was found in the " + location + " table.");
    }

    auto repeated = repeated_values(labels);
    if (!repeated.empty()) {
        report.add(Severity::WARNING, 14, "Duplicate Metabolite(s) in METABOLITES", {Tag::VALUE}, data_name,
                   "Metabolites",
                   "The following metabolites in the " + location + " table appear more than once in the table:\n\t"
                       + join_quoted(repeated, "\n\t"));
    }
}

void Validator::checkExtended() {
    const auto& table = *data->extended;
    std::string location = tableLocation("Extended");
    auto columns = table_columns(table);

    auto find_column = [&](const std::string& name) {
        return std::find_if(columns.begin(), columns.end(), [&](const Column& c) { return c.name == name; });
    };

    auto sample_column = find_column("sample_id");
    if (sample_column == columns.end()) {
        report.add(Severity::ERROR, 21, "Missing \"sample_id\" in EXTENDED", {Tag::FORMAT}, data_name, "Extended",
                   "The " + location + " table does not have a column for \"sample_id\".");
    } else {
        auto known = factorSampleIds();
        std::set<std::string> unknown;
        bool blank = false;
        for (const auto& row : table.rows) {
            auto value = cell(row, *sample_column);
            if (!value || is_na_value(*value)) blank = true;
            if (value && !known.count(*value)) unknown.insert(*value);
        }
        if (!unknown.empty()) {
            std::string ssf = text_form ? "in the SUBJECT_SAMPLE_FACTORS section" : "in [\"SUBJECT_SAMPLE_FACTORS\"]";
            report.add(Severity::ERROR, 22, "Missing Sample ID(s) in EXTENDED", {Tag::CONSISTENCY}, data_name,
                       "Extended",
                       "The " + location + " table has Sample IDs that were not found " + ssf + ". Those IDs are:\n\t"
                           + join_quoted(std::vector<std::string>(unknown.begin(), unknown.end()), "\n\t"));
        }
        if (blank) {
            report.add(Severity::ERROR, 35, "Blank Sample ID(s) in EXTENDED", {Tag::VALUE}, data_name, "Extended",
                       "A Sample ID without a name was found in the " + location + " table.");
        }
    }

    auto label_column = find_column(std::string(LABEL_COLUMN));
    if (label_column != columns.end()) {
        bool blank = std::any_of(table.rows.begin(), table.rows.end(), [&](const Row& row) {
            auto value = cell(row, *label_column);
            return !value || is_metabolite_na_value(*value);
        });
        if (blank) {
            report.add(Severity::ERROR, 36, "Blank Metabolite(s) in EXTENDED", {Tag::VALUE}, data_name, "Extended",
                       "A metabolite without a name was found in the " + location + " table.");
        }
    }
}

// ----------------------------------------------------------------------------
// Column semantics
// ----------------------------------------------------------------------------

void Validator::checkColumnSemantics() {
    const auto& table = *data->metabolites;
    const std::string location = tableLocation("Metabolites");
    auto columns = table_columns(table);

    auto add = [&](int id, const std::string& name, const std::string& body, std::vector<Tag> tags) {
        report.add(Severity::WARNING, id, name, std::move(tags), data_name, "Metabolites", body);
    };

    std::vector<std::pair<std::string, std::vector<size_t>>> found;
    std::vector<std::pair<size_t, std::vector<std::string>>> standards_by_column;

    for (const auto& finder : column_finders()) {
        std::vector<size_t> matched;
        for (size_t i = 0; i < columns.size(); ++i) {
            if (finder.name.matches(to_lower(strip(columns[i].name)))) matched.push_back(i);
        }
        if (matched.empty()) continue;
        found.emplace_back(finder.standard_name, matched);

        bool standard_present = std::any_of(columns.begin(), columns.end(),
                                            [&](const Column& c) { return c.name == finder.standard_name; });
        if (!standard_present) {
            for (size_t i : matched) {
                if (to_lower(columns[i].name) == finder.standard_name) continue;
                add(15, "Standard Column Name Match",
                    format_column_name(columns[i].name, columns[i].occurrence, i + 1) + " in the " + location
                        + " table, matches a standard column name, \"" + finder.standard_name
                        + "\". If this match was not in error, the column should be renamed to the standard name or "
                          "a name that doesn't resemble the standard name.",
                    {Tag::VALUE});
            }
        }

        for (size_t i : matched) {
            auto entry = std::find_if(standards_by_column.begin(), standards_by_column.end(),
                                      [&](const auto& pair) { return pair.first == i; });
            if (entry == standards_by_column.end()) {
                standards_by_column.push_back({i, {finder.standard_name}});
            } else {
                entry->second.push_back(finder.standard_name);
            }

            std::vector<std::string> bad_values;
            for (size_t r = 0; r < table.rows.size(); ++r) {
                std::string value = cell(table.rows[r], columns[i]).value_or("");
                if (!finder.values.matches(value)) bad_values.push_back(std::to_string(r) + "    " + value);
            }
            if (!bad_values.empty()) {
                add(16, "METABOLITES Bad Standard Values",
                    format_column_name(columns[i].name, columns[i].occurrence, i + 1) + " in the " + location
                        + " table, matches a standard column name, \"" + finder.standard_name
                        + "\", and some of the values in the column do not match the expected type or format for "
                          "that column. The non-matching values are:\n"
                        + join(bad_values, "\n"),
                    {Tag::VALUE});
            }
        }
    }

    auto found_columns = [&](const std::string& name) -> const std::vector<size_t>* {
        for (const auto& [standard, matched] : found) {
            if (standard == name) return &matched;
        }
        return nullptr;
    };

    for (const auto& [standard, matched] : found) {
        auto pair = std::find_if(implied_pairs().begin(), implied_pairs().end(),
                                 [&](const auto& p) { return p.first == standard; });
        if (pair == implied_pairs().end()) continue;

        const auto& parent = columns[matched.front()];
        for (const auto& implied : pair->second) {
            const auto* companion = found_columns(implied);
            if (!companion) {
                add(17, "Missing Implied Column",
                    "The column \"" + parent.name + "\" was found in the " + location
                        + " table, but this column implies that another column, \"" + implied
                        + "\", should also exist, and that column was not found.",
                    {});
                continue;
            }

            const auto& child = columns[companion->front()];
            bool mismatch = std::any_of(table.rows.begin(), table.rows.end(), [&](const Row& row) {
                return is_null_cell(cell(row, parent)) != is_null_cell(cell(row, child));
            });
            if (mismatch) {
                add(18, "Paired Columns Value Mismatch",
                    "The column pair, \"" + parent.name + "\" and \"" + child.name
                        + "\", in the METABOLITES table should have data in the same rows, but at least one row has "
                          "data in one column and nothing in the other.",
                    {});
            }
        }
    }

    if (const auto* other = found_columns("other_id")) {
        add(19, "\"other_id\" Column",
            "The standard column, \"other_id\", was found in the METABOLITES table as \"" + columns[other->front()].name
                + "\". If this column contains database IDs for standard databases such as KEGG, PubChem, HMDB, etc., "
                  "it is recommended to make individual columns for these and not lump them together into a less "
                  "descriptive \"other_id\" column.",
            {});
    }

    for (const auto& [index, standards] : standards_by_column) {
        if (standards.size() < 2) continue;
        add(20, "Multiple Standard Name Match",
            "The column, \"" + columns[index].name + "\", in the " + location
                + " table was matched to multiple standard names, " + bracket_list(standards)
                + ". This is a good indication that the values in that column should be split into the appropriate "
                  "individual columns.",
            {});
    }
}

// ----------------------------------------------------------------------------
// Table integrity
// ----------------------------------------------------------------------------

void Validator::checkReservedLabels() {
    const std::vector<std::pair<std::string, const std::optional<Table>*>> tables = {
        {"Metabolites", &data->metabolites}, {"Data", &data->data}, {"Extended", &data->extended}};

    for (const auto& [sub_section, table] : tables) {
        if (!*table) continue;

        std::string where;
        if (!text_form) {
            where = "in the table at [\"" + data_name + "\"][\"" + sub_section + "\"]";
        } else if (sub_section == "Metabolites") {
            where = "in the METABOLITES table";
        } else if (sub_section == "Data") {
            where = binned() ? "in the BINNED_DATA table" : "in the METABOLITE_DATA table";
        } else {
            where = "in the EXTENDED_METABOLITE_DATA table";
        }

        for (const auto& row : (*table)->rows) {
            const auto* label = row.find(LABEL_COLUMN);
            if (!label) continue;
            if (std::find(RESERVED_LABELS.begin(), RESERVED_LABELS.end(), to_lower(*label)) == RESERVED_LABELS.end())
                continue;
            report.add(Severity::WARNING, 23, "Bad Metabolite Name", {Tag::VALUE}, data_name, sub_section,
                       "There is a metabolite name, \"" + *label + "\", " + where
                           + " that is probably wrong. It is close to a header name and is likely due to a badly "
                             "constructed Tab file.");
        }
    }
}

void Validator::checkTable(const std::string& sub_section, const Table& table) {
    const std::string location = tableLocation(sub_section);
    auto add = [&](Severity severity, int id, const std::string& name, Tag tag, const std::string& body) {
        report.add(severity, id, name, {tag}, data_name, sub_section, body);
    };

    std::string expected;
    if (sub_section == "Data") {
        expected = binned() ? std::string(BIN_LABEL_COLUMN) : text_form ? "Samples" : std::string(LABEL_COLUMN);
    } else {
        expected = text_form ? "metabolite_name" : std::string(LABEL_COLUMN);
    }
    if (!table.header.empty() && std::find(table.header.begin(), table.header.end(), expected) == table.header.end()) {
        add(Severity::ERROR, 34, "Missing Header", Tag::FORMAT,
            "The " + location + " table does not have a column for \"" + expected
                + "\". It is likely misspelled or using a common incorrect substitute.");
    }

    if (!table.rows.empty()) {
        auto keys = [](const Row& row) {
            std::vector<std::string> names;
            for (const auto& entry : row) names.push_back(entry.key);
            return names;
        };
        auto first = keys(table.rows.front());
        bool ragged = std::any_of(table.rows.begin(), table.rows.end(), [&](const Row& row) { return keys(row) != first; });
        if (ragged) {
            add(Severity::ERROR, 25, "Inconsistent Columns", Tag::CONSISTENCY,
                "The " + location + " table does not have the same columns for every row.");
        }
    }

    auto columns = table_columns(table);
    if (std::any_of(columns.begin(), columns.end(), [](const Column& c) { return c.name.empty(); })) {
        add(Severity::ERROR, 26, "Column With No Name", Tag::VALUE,
            "Column(s) with no name were found in the " + location + " table.");
    }

    if (!table.rows.empty()) {
        for (size_t i = 0; i < columns.size(); ++i) {
            bool all_null = std::all_of(table.rows.begin(), table.rows.end(),
                                        [&](const Row& row) { return is_null_cell(cell(row, columns[i])); });
            if (all_null) {
                add(Severity::WARNING, 27, "Null Column", Tag::VALUE,
                    format_column_name(columns[i].name, columns[i].occurrence, i + 1) + " in the " + location
                        + " table has all null values.");
            }
        }
    }

    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == LABEL_COLUMN) continue;

        std::map<std::string, size_t> counts;
        size_t total = 0;
        for (const auto& row : table.rows) {
            auto value = cell(row, columns[i]);
            if (is_null_cell(value)) continue;
            ++counts[*value];
            ++total;
        }
        if (counts.size() < 2) continue;

        size_t most = 0;
        for (const auto& [value, count] : counts) most = std::max(most, count);
        if (most * 10 >= total * 9) {
            add(Severity::WARNING, 28, "Possible Bad Column Values", Tag::VALUE,
                format_column_name(columns[i].name, columns[i].occurrence, i + 1) + " in the " + location
                    + " table may have incorrect values. 90% or more of the values are the same, but 10% or less are "
                      "different.");
        }
    }

    std::set<std::vector<std::string>> seen_rows;
    bool duplicate_rows = false;
    for (const auto& row : table.rows) {
        std::vector<std::string> flat;
        for (const auto& entry : row) {
            flat.push_back(entry.key);
            flat.push_back(entry.value);
        }
        if (!seen_rows.insert(std::move(flat)).second) duplicate_rows = true;
    }
    if (duplicate_rows) {
        add(Severity::WARNING, 29, "Duplicate Rows", Tag::VALUE,
            "There are duplicate rows in the " + location + " table.");
    }

    // Repeated sample names in Data are reported as duplicate samples instead.
    if (sub_section != "Data" &&
        std::any_of(columns.begin(), columns.end(), [](const Column& c) { return c.occurrence > 0; })) {
        add(Severity::WARNING, 30, "Duplicate Column Names", Tag::VALUE,
            "There are duplicate column names in the " + location + " table.");
    }
}

void Validator::checkHeaderLengths() {
    for (const auto& block : doc.short_headers) {
        report.add(Severity::ERROR, 2, "Bad Headers", {Tag::CONSISTENCY}, block, "",
                   "The section, " + block
                       + ", has a mismatch between the number of headers and the number of elements in each line. "
                         "Either a line(s) has more values than headers or there are too few headers.");
    }
}

void Validator::checkSubSectionUniqueness() {
    for (const auto& [section, sub_section] : doc.duplicate_sub_sections) {
        report.add(Severity::WARNING, 1, "Duplicate Sub-section", {Tag::CONSISTENCY}, section, sub_section,
                   "The section, " + section + ", has a sub-section, " + sub_section + ", that is duplicated.");
    }
}

void Validator::checkPolarity() {
    const auto* finder = find_column_finder("polarity");
    if (!finder) return;

    const auto& table = *data->metabolites;
    auto columns = table_columns(table);
    for (const auto& column : columns) {
        if (!finder->name.matches(to_lower(strip(column.name)))) continue;

        bool positive = false;
        bool negative = false;
        for (const auto& row : table.rows) {
            auto value = cell(row, column);
            if (!value) continue;
            auto lowered = to_lower(*value);
            positive = positive || POSITIVE_POLARITY.count(lowered) > 0;
            negative = negative || NEGATIVE_POLARITY.count(lowered) > 0;
        }
        if (positive && negative) {
            report.add(Severity::ERROR, 31, "Multiple Polarities", {Tag::FORMAT}, data_name, "Metabolites",
                       "The \"" + column.name + "\" column in the " + tableLocation("Metabolites")
                           + " table indicates multiple polarities in a single analysis, and this should not be. A "
                             "single mwTab file is supposed to be restricted to a single analysis. This means "
                             "multiple MS runs under different settings should each be in their own file.");
            break;
        }
    }
}

std::string Validator::tableLocation(const std::string& sub_section) const {
    if (!text_form) return "[\"" + data_name + "\"][\"" + sub_section + "\"]";
    if (sub_section == "Metabolites") return std::string(METABOLITES_SECTION);
    if (sub_section == "Extended") return "EXTENDED_METABOLITE_DATA";
    return data_name;
}

std::set<std::string> Validator::factorSampleIds() const {
    std::set<std::string> ids;
    if (!factor_rows) return ids;
    for (const auto& row : *factor_rows) {
        if (row.sample_id) ids.insert(*row.sample_id);
    }
    return ids;
}
} // namespace

Report validate(const Document& doc) {
    Report report;
    const auto& schema = select_schema(doc, report);
    Validator(doc, report).run(schema);
    return report;
}

Report validate(const Document& doc, const SchemaTable& schema) {
    Report report;
    Validator(doc, report).run(schema);
    return report;
}

// ----------------------------------------------------------------------------
// Report formatting
// ----------------------------------------------------------------------------

std::string format_report(const Document& doc, const Report& report) {
    return format_report(doc, report, current_timestamp());
}

std::string format_report(const Document& doc, const Report& report, const std::string& timestamp) {
    auto or_na = [](const std::string& value) { return value.empty() ? std::string("N/A") : value; };

    std::ostringstream out;
    out << "Validation Log\n"
        << timestamp << "\n"
        << "mwtab Library Version: " << engine_version() << "\n"
        << "Source:        " << doc.source << "\n"
        << "Study ID:      " << or_na(doc.study_id()) << "\n"
        << "Analysis ID:   " << or_na(doc.analysis_id()) << "\n"
        << "File format:   " << to_string(doc.input_format) << "\n";

    if (report.passing()) {
        out << "Status: Passing\n";
        return out.str();
    }

    out << "Status: Contains Validation Errors\n"
        << "Number of Issues: " << report.size() << "\n\n"
        << "Number of Warnings: " << report.count(Severity::WARNING) << "\n\n"
        << "Number of Value Errors: " << report.count(Tag::VALUE) << "\n\n"
        << "Number of Consistency Errors: " << report.count(Tag::CONSISTENCY) << "\n\n"
        << "Number of Format Errors: " << report.count(Tag::FORMAT) << "\n\n"
        << "Issue Log:\n";

    std::vector<std::string> messages;
    for (const auto& finding : report.findings) messages.push_back(finding.message);
    out << join(messages, "\n") << "\n";
    return out.str();
}

} // namespace mwtab
