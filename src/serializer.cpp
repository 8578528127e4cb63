#include "serializer.hpp"
#include "errors.hpp"
#include "structured.hpp"
#include "text.hpp"
#include <algorithm>

namespace mwtab {

namespace {
std::string padding(size_t width, std::string_view key) {
    size_t length = utf8_length(key);
    return std::string(length < width ? width - length : 0, ' ');
}

std::string factor_string(const Multimap& factors) {
    std::vector<std::string> pairs;
    for (const auto& entry : factors) pairs.push_back(entry.key + ":" + entry.value);
    return join(pairs, " | ");
}

std::vector<std::string> row_values(const Row& row) {
    std::vector<std::string> values;
    for (const auto& entry : row) values.push_back(entry.value);
    return values;
}
} // namespace

std::string TextWriter::write() {
    for (const auto& [name, section] : doc.sections()) {
        if (const auto* factors = std::get_if<ListSection>(&section)) {
            emitLine("#SUBJECT_SAMPLE_FACTORS:         \tSUBJECT(optional)[tab]SAMPLE[tab]FACTORS(NAME:VALUE pairs separated by |)[tab]Additional sample data");
            emitFactors(*factors);
        } else if (const auto* items = std::get_if<ItemSection>(&section)) {
            if (name == HEADER_SECTION) {
                emitHeader(*items);
            } else {
                emitLine(name == "NM" ? "#NMR" : "#" + name);
                emitItems(name, *items);
            }
        } else {
            emitLine("#" + name);
            emitData(name, std::get<DataSection>(section));
        }
    }
    emitLine("#END");
    return out.str();
}

void TextWriter::emitHeader(const ItemSection& header) {
    std::vector<std::string> pairs;
    for (const auto& entry : header.items) {
        if (entry.key != "VERSION" && entry.key != "CREATED_ON") pairs.push_back(entry.key + ":" + entry.value);
    }
    emitLine("#" + std::string(HEADER_SECTION) + " " + join(pairs, " "));

    for (const auto& entry : header.items) {
        if (entry.key == "VERSION" || entry.key == "CREATED_ON") {
            emitLine(entry.key + padding(HEADER_KEY_WIDTH, entry.key) + "\t" + entry.value);
        }
    }
}

void TextWriter::emitItems(const std::string& section, const ItemSection& items) {
    auto prefix = section_prefix(section);
    for (const auto& entry : items.items) {
        if (items.results_file && entry.key == items.results_file->key) {
            emitResultsFile(prefix, *items.results_file);
        } else {
            emitItem(prefix, entry.key, entry.value);
        }
    }
}

void TextWriter::emitItem(std::string_view prefix, const std::string& key, const std::string& value) {
    std::string lead = std::string(prefix) + key + padding(KEY_WIDTH, key) + "\t";

    if (utf8_length(value) <= WRAP_WIDTH || key.ends_with("_FILENAME")) {
        emitLine(lead + value);
        return;
    }

    // Greedy re-flow on single spaces; a word longer than the width gets a line of its own.
    std::vector<std::string> line;
    size_t length = 0;
    for (const auto& word : split(value, " ")) {
        size_t word_length = utf8_length(word);
        if (length + word_length + line.size() < WRAP_WIDTH + 1) {
            line.push_back(word);
            length += word_length;
        } else {
            if (!line.empty()) emitLine(lead + join(line, " "));
            line = {word};
            length = word_length;
        }
    }
    emitLine(lead + join(line, " "));
}

void TextWriter::emitResultsFile(std::string_view prefix, const ResultsFile& file) {
    emitLine(std::string(prefix) + file.key + padding(KEY_WIDTH, file.key) + "\t" + file.render("\t"));
}

void TextWriter::emitFactors(const ListSection& factors) {
    for (const auto& row : factors.rows) {
        std::vector<std::string> fields{row.subject_id.value_or(""), row.sample_id.value_or(""), factor_string(row.factors)};
        if (row.additional_data) {
            std::vector<std::string> pairs;
            for (const auto& entry : *row.additional_data) pairs.push_back(entry.key + "=" + entry.value);
            fields.push_back(join(pairs, "; "));
        }
        std::string line = std::string(SSF_SECTION) + std::string(11, ' ') + "\t" + join(fields, "\t");
        if (fields.size() < 4) line += "\t";
        emitLine(line);
    }
}

void TextWriter::emitData(const std::string& section, const DataSection& data) {
    if (data.units) {
        std::string key = section + ":UNITS";
        emitLine(key + padding(UNITS_WIDTH, key) + "\t" + *data.units);
    }
    if (data.data) {
        emitDataTable(section, *data.data);
    }
    if (data.metabolites) {
        emitLine("#METABOLITES");
        emitAnnotationTable("METABOLITES_START", "METABOLITES_END", *data.metabolites);
    }
    if (data.extended) {
        emitAnnotationTable("EXTENDED_" + section + "_START", "EXTENDED_" + section + "_END", *data.extended);
    }
    if (data.results_file) {
        emitResultsFile("", *data.results_file);
    }
    for (const auto& entry : data.items) {
        emitItem("", entry.key, entry.value);
    }
}

void TextWriter::emitDataTable(const std::string& section, const Table& table) {
    emitLine(section + "_START");

    bool metabolite_data = section.find("METABOLITE") != std::string::npos;
    auto header = headerLine(table, metabolite_data ? "Samples" : std::string(BIN_LABEL_COLUMN));
    emitLine(join(header, "\t"));

    std::vector<std::string> samples(header.begin() + 1, header.end());
    if (metabolite_data && !samples.empty()) {
        auto factors = factorLine(samples);
        if (!factors.empty()) {
            factors.insert(factors.begin(), "Factors");
            emitLine(join(factors, "\t"));
        }
    }

    emitRows(table);
    emitLine(section + "_END");
}

void TextWriter::emitAnnotationTable(const std::string& start, const std::string& end, const Table& table) {
    emitLine(start);
    emitLine(join(headerLine(table, "metabolite_name"), "\t"));
    emitRows(table);
    emitLine(end);
}

void TextWriter::emitRows(const Table& table) {
    for (const auto& row : table.rows) {
        emitLine(join(row_values(row), "\t"));
    }
}

// The header captured from text input while it still names the table's columns,
// otherwise label followed by the column names.
std::vector<std::string> TextWriter::headerLine(const Table& table, const std::string& label) const {
    auto columns = table.columns();
    std::vector<std::string> header{label};
    if (!table.header.empty()) {
        std::vector<std::string> captured(table.header.begin() + 1, table.header.end());
        if (captured.size() <= columns.size() && std::equal(captured.begin(), captured.end(), columns.begin())) {
            if (doc.input_format == Format::MWTAB) header.front() = table.header.front();
            header.insert(header.end(), captured.begin(), captured.end());
            return header;
        }
    }
    header.insert(header.end(), columns.begin(), columns.end());
    return header;
}

// Factor strings aligned with samples, or empty when any sample has none.
std::vector<std::string> TextWriter::factorLine(const std::vector<std::string>& samples) const {
    Multimap by_sample;
    if (doc.data_factors) {
        by_sample = *doc.data_factors;
    } else if (const auto* ssf = doc.get<ListSection>(SSF_SECTION)) {
        for (const auto& row : ssf->rows) {
            by_sample.set(row.sample_id.value_or(""), factor_string(row.factors));
        }
    }

    std::vector<std::string> line;
    for (const auto& sample : samples) {
        const auto* factors = by_sample.find(sample);
        if (!factors) return {};
        line.push_back(*factors);
    }
    return line;
}

std::string to_text(const Document& doc) {
    Document canonical = doc;
    canonicalize(canonical);
    return TextWriter(canonical).write();
}

std::string serialize(const Document& doc, Format format) {
    switch (format) {
    case Format::MWTAB: return to_text(doc);
    case Format::JSON: return write_json(to_structured(doc));
    }
    throw UnknownFormat("Unsupported output format");
}

std::string serialize(const Document& doc, std::string_view format) {
    return serialize(doc, parse_format(format));
}

} // namespace mwtab
