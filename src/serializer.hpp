#pragma once
#include "document.hpp"
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace mwtab {

/**
 * Renders a Document in the mwTab text form.
 *
 * Works on a canonicalized copy, so the document itself is left untouched
 * and documents built out of order still come out in section order.
 */
class TextWriter
{
    std::ostringstream out;
    const Document& doc;

    static constexpr size_t WRAP_WIDTH = 80;
    static constexpr size_t KEY_WIDTH = 30;
    static constexpr size_t HEADER_KEY_WIDTH = 20;
    static constexpr size_t UNITS_WIDTH = 33;

public:
    explicit TextWriter(const Document& canonical) : doc(canonical) {}

    std::string write();

private:
    void emitLine(std::string_view line) { out << line << '\n'; }
    void emitHeader(const ItemSection& header);
    void emitItems(const std::string& section, const ItemSection& items);
    void emitItem(std::string_view prefix, const std::string& key, const std::string& value);
    void emitResultsFile(std::string_view prefix, const ResultsFile& file);
    void emitFactors(const ListSection& factors);
    void emitData(const std::string& section, const DataSection& data);
    void emitDataTable(const std::string& section, const Table& table);
    void emitAnnotationTable(const std::string& start, const std::string& end, const Table& table);
    void emitRows(const Table& table);
    std::vector<std::string> headerLine(const Table& table, const std::string& label) const;
    std::vector<std::string> factorLine(const std::vector<std::string>& samples) const;
};

std::string to_text(const Document& doc);
// Dispatches on the target format; JSON goes through to_structured.
std::string serialize(const Document& doc, Format format);
std::string serialize(const Document& doc, std::string_view format);

} // namespace mwtab
