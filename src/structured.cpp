#include "structured.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstddef>
#include <map>
#include <memory>
#include <sstream>

namespace mwtab {

namespace {
const std::string DUPLICATE_OPEN = "{{{_";
const std::string DUPLICATE_CLOSE = "_}}}";

// Builds objects whose member order survives jsoncpp's sorted storage.
class OrderedObject
{
    Json::Value object{Json::objectValue};
    std::ptrdiff_t ordinal = 0;

public:
    void put(const std::string& key, Json::Value value)
    {
        value.setOffsetStart(ordinal++);
        object[key] = std::move(value);
    }

    Json::Value release() { return std::move(object); }
};

Json::Value from_multimap(const Multimap& map) {
    OrderedObject object;
    for (const auto& entry : map) {
        object.put(encode_duplicate_key(entry.key, entry.occurrence), entry.value);
    }
    return object.release();
}

Json::Value from_table(const Table& table, bool binned) {
    Json::Value rows{Json::arrayValue};
    for (const auto& row : table.rows) {
        Row copy = row;
        if (binned) copy.rename(LABEL_COLUMN, std::string(BIN_LABEL_COLUMN));
        rows.append(from_multimap(copy));
    }
    return rows;
}

std::string scalar(const Json::Value& value, const std::string& where) {
    if (value.isString()) return value.asString();
    if (value.isNull()) return "";
    if (value.isBool() || value.isNumeric()) return value.asString();
    throw BuildError("Expected a text value for " + where);
}

Multimap to_multimap(const Json::Value& object, const std::string& where) {
    if (!object.isObject()) throw BuildError("Expected an object for " + where);
    Multimap map;
    for (const auto& name : ordered_members(object)) {
        map.add(decode_duplicate_key(name), scalar(object[name], where + "[\"" + name + "\"]"));
    }
    return map;
}

Table to_table(const Json::Value& rows, const std::string& where) {
    if (!rows.isArray()) throw BuildError("Expected a list of rows for " + where);
    Table table;
    for (Json::ArrayIndex i = 0; i < rows.size(); ++i) {
        Row row = to_multimap(rows[i], where + "[" + std::to_string(i) + "]");
        if (table.header.empty()) {
            for (const auto& entry : row) table.header.push_back(entry.key);
        }
        if (row.contains(BIN_LABEL_COLUMN)) {
            row.erase(LABEL_COLUMN);
            row.rename(BIN_LABEL_COLUMN, std::string(LABEL_COLUMN));
            row.reorder({std::string(LABEL_COLUMN)});
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

ListSection to_factors(const Json::Value& rows, const std::string& name) {
    ListSection section;
    for (Json::ArrayIndex i = 0; i < rows.size(); ++i) {
        const auto& element = rows[i];
        std::string where = "[\"" + name + "\"][" + std::to_string(i) + "]";
        if (!element.isObject()) throw BuildError("Expected an object for " + where);

        SubjectSampleFactor row;
        row.has_factors = false;
        for (const auto& member : ordered_members(element)) {
            std::string key = decode_duplicate_key(member);
            const auto& value = element[member];
            if (key == "Subject ID") row.subject_id = scalar(value, where);
            else if (key == "Sample ID") row.sample_id = scalar(value, where);
            else if (key == "Factors") {
                row.factors = to_multimap(value, where + "[\"Factors\"]");
                row.has_factors = true;
            }
            else if (key == "Additional sample data") row.additional_data = to_multimap(value, where + "[\"Additional sample data\"]");
            else row.other.add(key, scalar(value, where));
        }
        section.rows.push_back(std::move(row));
    }
    return section;
}

DataSection to_data(const Json::Value& object, const std::string& name) {
    DataSection data;
    for (const auto& member : ordered_members(object)) {
        std::string key = decode_duplicate_key(member);
        const auto& value = object[member];
        std::string where = "[\"" + name + "\"][\"" + key + "\"]";
        if (key == "Units") data.units = scalar(value, where);
        else if (key == "Data") data.data = to_table(value, where);
        else if (key == "Metabolites") data.metabolites = to_table(value, where);
        else if (key == "Extended") data.extended = to_table(value, where);
        else if (key.ends_with("_RESULTS_FILE")) data.results_file = ResultsFile::parse(key, scalar(value, where));
        else data.items.add(key, scalar(value, where));
    }
    return data;
}

ItemSection to_items(const Json::Value& object, const std::string& name) {
    ItemSection section;
    for (const auto& member : ordered_members(object)) {
        std::string key = decode_duplicate_key(member);
        std::string value = scalar(object[member], "[\"" + name + "\"][\"" + key + "\"]");
        if (key.ends_with("_RESULTS_FILE")) section.set_results_file(ResultsFile::parse(key, value));
        else section.items.add(key, value);
    }
    return section;
}

// Renames the second and later uses of a member name within one object to the
// "{{{_N_}}}" form. jsoncpp keeps only the last value of a repeated name.
std::string mark_repeated_members(std::string_view text) {
    struct Frame
    {
        bool object;
        bool expect_key;
        std::map<std::string, size_t> seen;
    };
    std::vector<Frame> frames;

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '"') {
            size_t end = i + 1;
            while (end < text.size() && text[end] != '"') end += text[end] == '\\' ? 2 : 1;
            if (end >= text.size()) {
                // Unterminated string; left for the parser to report.
                out.append(text.substr(i));
                break;
            }
            std::string literal(text.substr(i + 1, end - i - 1));
            if (!frames.empty() && frames.back().object && frames.back().expect_key) {
                size_t occurrence = frames.back().seen[literal]++;
                literal = encode_duplicate_key(literal, occurrence);
                frames.back().expect_key = false;
            }
            out += '"';
            out += literal;
            out += '"';
            i = end;
            continue;
        }

        switch (c) {
        case '{': frames.push_back({true, true, {}}); break;
        case '[': frames.push_back({false, false, {}}); break;
        case '}':
        case ']':
            if (!frames.empty()) frames.pop_back();
            break;
        case ',':
            if (!frames.empty() && frames.back().object) frames.back().expect_key = true;
            break;
        default: break;
        }
        out += c;
    }
    return out;
}

void write_value(std::ostringstream& out, const Json::Value& value, size_t depth) {
    const std::string indent((depth + 1) * 4, ' ');
    const std::string closing(depth * 4, ' ');

    if (value.isObject()) {
        auto members = ordered_members(value);
        if (members.empty()) {
            out << "{}";
            return;
        }
        out << "{\n";
        for (size_t i = 0; i < members.size(); ++i) {
            out << indent << Json::valueToQuotedString(members[i].c_str()) << ": ";
            write_value(out, value[members[i]], depth + 1);
            out << (i + 1 < members.size() ? ",\n" : "\n");
        }
        out << closing << "}";
    } else if (value.isArray()) {
        if (value.empty()) {
            out << "[]";
            return;
        }
        out << "[\n";
        for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
            out << indent;
            write_value(out, value[i], depth + 1);
            out << (i + 1 < value.size() ? ",\n" : "\n");
        }
        out << closing << "]";
    } else if (value.isString()) {
        out << Json::valueToQuotedString(value.asCString());
    } else if (value.isNull()) {
        out << "null";
    } else {
        out << value.asString();
    }
}
} // namespace

std::vector<std::string> ordered_members(const Json::Value& object) {
    auto names = object.getMemberNames();
    std::stable_sort(names.begin(), names.end(), [&](const std::string& a, const std::string& b) {
        return object[a].getOffsetStart() < object[b].getOffsetStart();
    });
    return names;
}

std::string encode_duplicate_key(const std::string& key, size_t occurrence) {
    if (occurrence == 0) return key;
    return key + DUPLICATE_OPEN + std::to_string(occurrence) + DUPLICATE_CLOSE;
}

std::string decode_duplicate_key(const std::string& key) {
    if (!key.ends_with(DUPLICATE_CLOSE)) return key;
    size_t open = key.rfind(DUPLICATE_OPEN);
    if (open == std::string::npos) return key;
    size_t digits_begin = open + DUPLICATE_OPEN.size();
    size_t digits_end = key.size() - DUPLICATE_CLOSE.size();
    if (digits_end <= digits_begin) return key;
    for (size_t i = digits_begin; i < digits_end; ++i) {
        if (key[i] < '0' || key[i] > '9') return key;
    }
    return key.substr(0, open);
}

Json::Value to_structured(const Document& doc) {
    Document canonical = doc;
    canonicalize(canonical);

    OrderedObject root;
    for (const auto& [name, section] : canonical.sections()) {
        if (const auto* items = std::get_if<ItemSection>(&section)) {
            root.put(name, from_multimap(items->items));
        } else if (const auto* factors = std::get_if<ListSection>(&section)) {
            Json::Value rows{Json::arrayValue};
            for (const auto& row : factors->rows) {
                OrderedObject element;
                if (row.subject_id) element.put("Subject ID", *row.subject_id);
                if (row.sample_id) element.put("Sample ID", *row.sample_id);
                if (row.has_factors) element.put("Factors", from_multimap(row.factors));
                if (row.additional_data) element.put("Additional sample data", from_multimap(*row.additional_data));
                for (const auto& entry : row.other) {
                    element.put(encode_duplicate_key(entry.key, entry.occurrence), entry.value);
                }
                rows.append(element.release());
            }
            root.put(name, std::move(rows));
        } else {
            const auto& data = std::get<DataSection>(section);
            bool binned = name.find("BINNED_DATA") != std::string::npos;
            OrderedObject object;
            if (data.units) object.put("Units", *data.units);
            if (data.data) object.put("Data", from_table(*data.data, binned));
            if (data.metabolites) object.put("Metabolites", from_table(*data.metabolites, false));
            if (data.extended) object.put("Extended", from_table(*data.extended, false));
            if (data.results_file) object.put(data.results_file->key, data.results_file->render(" "));
            for (const auto& entry : data.items) {
                object.put(encode_duplicate_key(entry.key, entry.occurrence), entry.value);
            }
            root.put(name, object.release());
        }
    }
    return root.release();
}

Document from_structured(const std::string& source, const Json::Value& root) {
    if (!root.isObject()) throw BuildError("Structured input must be an object of sections");

    Document doc;
    doc.source = source;
    doc.input_format = Format::JSON;

    for (const auto& member : ordered_members(root)) {
        std::string name = decode_duplicate_key(member);
        const auto& value = root[member];
        if (value.isArray()) {
            doc.set(name, to_factors(value, name));
        } else if (value.isObject()) {
            bool tables = value.isMember("Data") || value.isMember("Metabolites") || value.isMember("Extended");
            if (tables || is_data_section_name(name)) doc.set(name, to_data(value, name));
            else doc.set(name, to_items(value, name));
        } else {
            throw BuildError("Section \"" + name + "\" is neither an object nor a list");
        }
    }

    if (!doc.header()) throw BuildError("MissingHeaderSection: no \"METABOLOMICS WORKBENCH\" section in " + source);
    return doc;
}

Json::Value parse_json(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string marked = mark_repeated_members(text);
    Json::Value root;
    std::string errors;
    if (!reader->parse(marked.data(), marked.data() + marked.size(), &root, &errors)) {
        throw UnknownFormat("Input is not valid JSON: " + errors);
    }
    return root;
}

std::string write_json(const Json::Value& value) {
    std::ostringstream out;
    write_value(out, value, 0);
    return out.str();
}

} // namespace mwtab
