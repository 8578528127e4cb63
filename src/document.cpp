#include "document.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <algorithm>

namespace mwtab {

std::string_view to_string(Format format) {
    switch (format) {
    case Format::MWTAB: return "mwtab";
    case Format::JSON: return "json";
    }
    throw UnknownFormat("Unsupported format");
}

Format parse_format(std::string_view name) {
    if (name == "mwtab" || name == "txt") return Format::MWTAB;
    if (name == "json") return Format::JSON;
    throw UnknownFormat("Unsupported format: " + std::string(name));
}

std::string_view section_prefix(std::string_view section) {
    if (section == "PROJECT") return "PR:";
    if (section == "STUDY") return "ST:";
    if (section == "SUBJECT") return "SU:";
    if (section == "COLLECTION") return "CO:";
    if (section == "TREATMENT") return "TR:";
    if (section == "SAMPLEPREP") return "SP:";
    if (section == "CHROMATOGRAPHY") return "CH:";
    if (section == "ANALYSIS") return "AN:";
    if (section == "MS") return "MS:";
    if (section == "NM" || section == "NMR") return "NM:";
    return "";
}

bool is_data_section_name(std::string_view section) {
    return section.find("METABOLITE_DATA") != std::string_view::npos
        || section.find("BINNED_DATA") != std::string_view::npos;
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

std::vector<std::string> Table::columns() const {
    std::vector<std::string> names;
    if (!rows.empty()) {
        for (const auto& entry : rows.front()) names.push_back(entry.key);
    } else {
        names = header;
    }
    if (!names.empty()) names.erase(names.begin());
    return names;
}

std::vector<std::string> Table::labels() const {
    std::vector<std::string> result;
    for (const auto& row : rows) {
        result.push_back(row.get(LABEL_COLUMN));
    }
    return result;
}

// ----------------------------------------------------------------------------
// ResultsFile
// ----------------------------------------------------------------------------

namespace {
constexpr std::array<std::string_view, 4> RESULTS_LABELS = {"UNITS", "Has m/z", "Has RT", "RT units"};

struct LabelHit
{
    size_t label;
    size_t position;
};

// First "label:" occurrence that starts the text or follows whitespace.
std::optional<size_t> find_label(std::string_view text, std::string_view label) {
    std::string needle = std::string(label) + ":";
    size_t from = 0;
    while (true) {
        size_t pos = text.find(needle, from);
        if (pos == std::string_view::npos) return std::nullopt;
        if (pos == 0 || is_space(text[pos - 1])) return pos;
        from = pos + 1;
    }
}
} // namespace

ResultsFile ResultsFile::parse(std::string key, std::string_view text) {
    ResultsFile file;
    file.key = std::move(key);

    std::vector<LabelHit> hits;
    for (size_t i = 0; i < RESULTS_LABELS.size(); ++i) {
        if (auto pos = find_label(text, RESULTS_LABELS[i])) {
            hits.push_back({i, *pos});
        }
    }
    std::sort(hits.begin(), hits.end(), [](const LabelHit& a, const LabelHit& b) { return a.position < b.position; });

    std::string head = strip(text.substr(0, hits.empty() ? text.size() : hits.front().position));
    if (!head.empty() && head.find(':') == std::string::npos) {
        file.filename = head;
    }

    std::array<std::optional<std::string>*, 4> slots = {&file.units, &file.has_mz, &file.has_rt, &file.rt_units};
    for (size_t i = 0; i < hits.size(); ++i) {
        size_t begin = hits[i].position + RESULTS_LABELS[hits[i].label].size() + 1;
        size_t end = i + 1 < hits.size() ? hits[i + 1].position : text.size();
        *slots[hits[i].label] = strip(text.substr(begin, end - begin));
    }
    return file;
}

std::vector<std::pair<std::string, std::string>> ResultsFile::fields() const {
    std::vector<std::pair<std::string, std::string>> result;
    if (filename) result.emplace_back("filename", *filename);
    if (units) result.emplace_back("UNITS", *units);
    if (has_mz) result.emplace_back("Has m/z", *has_mz);
    if (has_rt) result.emplace_back("Has RT", *has_rt);
    if (rt_units) result.emplace_back("RT units", *rt_units);
    return result;
}

std::string ResultsFile::render(std::string_view separator) const {
    std::vector<std::string> parts;
    if (filename && !filename->empty()) parts.push_back(*filename);
    for (const auto& [name, value] : fields()) {
        if (name != "filename") parts.push_back(name + ":" + value);
    }
    return join(parts, separator);
}

void ItemSection::set_results_file(ResultsFile file) {
    items.set(file.key, file.render(" "));
    results_file = std::move(file);
}

// ----------------------------------------------------------------------------
// Document
// ----------------------------------------------------------------------------

std::vector<std::string> Document::section_names() const {
    std::vector<std::string> names;
    for (const auto& [name, section] : sections_) names.push_back(name);
    return names;
}

Section* Document::find(std::string_view name) {
    for (auto& [key, section] : sections_) {
        if (key == name) return &section;
    }
    return nullptr;
}

const Section* Document::find(std::string_view name) const {
    for (const auto& [key, section] : sections_) {
        if (key == name) return &section;
    }
    return nullptr;
}

Section& Document::set(const std::string& name, Section section) {
    if (auto* existing = find(name)) {
        *existing = std::move(section);
        return *existing;
    }
    sections_.emplace_back(name, std::move(section));
    return sections_.back().second;
}

bool Document::erase(std::string_view name) {
    return std::erase_if(sections_, [&](const NamedSection& entry) { return entry.first == name; }) > 0;
}

std::string Document::study_id() const {
    const auto* head = header();
    return head ? head->items.get("STUDY_ID") : "";
}

std::string Document::analysis_id() const {
    const auto* head = header();
    return head ? head->items.get("ANALYSIS_ID") : "";
}

std::string Document::data_section_name() const {
    for (const auto& [name, section] : sections_) {
        if (is_data_section_name(name) && std::holds_alternative<DataSection>(section)) return name;
    }
    return "";
}

const DataSection* Document::data_section() const {
    auto name = data_section_name();
    return name.empty() ? nullptr : get<DataSection>(name);
}

void Document::add_short_header(const std::string& block) {
    if (std::find(short_headers.begin(), short_headers.end(), block) == short_headers.end()) {
        short_headers.push_back(block);
    }
}

void Document::add_duplicate_sub_section(const std::string& section, const std::string& key) {
    std::pair<std::string, std::string> entry{section, key};
    if (std::find(duplicate_sub_sections.begin(), duplicate_sub_sections.end(), entry) == duplicate_sub_sections.end()) {
        duplicate_sub_sections.push_back(std::move(entry));
    }
}

// ----------------------------------------------------------------------------
// Canonical order
// ----------------------------------------------------------------------------

namespace {
void canonicalize_rows(std::optional<Table>& table) {
    if (!table) return;
    for (auto& row : table->rows) {
        row.reorder({std::string(LABEL_COLUMN), std::string(BIN_LABEL_COLUMN)});
    }
}
} // namespace

void canonicalize(Document& doc) {
    auto& sections = doc.sections();
    std::stable_sort(sections.begin(), sections.end(), [](const auto& a, const auto& b) {
        auto rank = [](const std::string& name) {
            auto it = std::find(SECTION_ORDER.begin(), SECTION_ORDER.end(), name);
            return static_cast<size_t>(it - SECTION_ORDER.begin());
        };
        return rank(a.first) < rank(b.first);
    });

    for (auto& [name, section] : sections) {
        if (auto* data = std::get_if<DataSection>(&section)) {
            canonicalize_rows(data->data);
            canonicalize_rows(data->metabolites);
            canonicalize_rows(data->extended);
        }
    }
}

} // namespace mwtab
