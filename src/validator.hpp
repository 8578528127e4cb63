#pragma once
#include "document.hpp"
#include "report.hpp"
#include "schema.hpp"
#include <string>
#include <string_view>

namespace mwtab {

constexpr std::string_view ENGINE_VERSION = "0.1.0";

std::string_view engine_version();

/**
 * @brief Validates a document against the schema for its analysis kind.
 *
 * The MS schema is used when the document has an "MS" section, the NMR schema
 * when it has "NM". Having neither (or both) is itself reported. Never throws
 * for document content and never modifies doc.
 */
Report validate(const Document& doc);

// Same checks against a caller-supplied schema table, without analysis-kind selection.
Report validate(const Document& doc, const SchemaTable& schema);

// "1st", "2nd", "3rd", "11th", ...
std::string ordinal_suffix(size_t number);
// `The "X" column at position N`, or `The 2nd "X" column ...` for a repeated name.
std::string format_column_name(const std::string& name, size_t occurrence, size_t position);

// Textual validation log: banner, status, counts and every message.
std::string format_report(const Document& doc, const Report& report);
std::string format_report(const Document& doc, const Report& report, const std::string& timestamp);

} // namespace mwtab
