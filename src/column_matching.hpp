#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace re2 {
class RE2;
}

namespace mwtab {

// Regular-expression building blocks shared by the column matchers and the schema.
namespace patterns {
inline const std::string INTEGER = R"(-?\d+)";
inline const std::string FLOAT = R"(-?\d*\.\d+)";
inline const std::string SCIENTIFIC_NOTATION = R"(-?\d*\.\d+E(-|\+)?\d+)";
inline const std::string NUMS = "(" + FLOAT + "|" + SCIENTIFIC_NOTATION + "|" + INTEGER + ")";
inline const std::string NUM_RANGE = NUMS + R"((-|\sto\s|−))" + NUMS;
inline const std::string POSITIVE_INTS = R"(\d+)";
} // namespace patterns

/**
 * @brief Regular expression matching a list of element separated by delimiter.
 *
 * Requires at least one delimiter unless empty_string is set, in which case a
 * single element (or nothing) also matches. quoted_elements additionally
 * accepts lists whose elements are all single- or all double-quoted.
 */
std::string make_list_regex(const std::string& element, const std::string& delimiter,
                            bool quoted_elements = false, bool empty_string = false);

// Values treated as missing inside METABOLITES table cells.
bool is_column_na_value(std::string_view value);
bool is_numeric(std::string_view value);

// Compiles with the options every matcher uses; throws std::runtime_error on a bad expression.
std::shared_ptr<const re2::RE2> compile_pattern(const std::string& pattern, bool case_insensitive = false);

struct NameCriteria
{
    // Searched with non-alphanumeric (or string edge) on both sides.
    std::vector<std::string> regex_search_strings;
    std::vector<std::string> not_regex_search_strings;
    // Every string of any one set must be found, each wrapped as above.
    std::vector<std::vector<std::string>> regex_search_sets;
    // Plain substring tests.
    std::vector<std::string> in_strings;
    std::vector<std::string> not_in_strings;
    std::vector<std::vector<std::string>> in_string_sets;
    std::vector<std::string> exact_strings;
};

/**
 * Matches column names. Any positive criterion selects a name; any "not"
 * criterion rejects it regardless. Names are compared after lowering and
 * stripping.
 */
class NameMatcher
{
public:
    explicit NameMatcher(NameCriteria criteria);

    bool matches(std::string_view name) const;
    // Original names that match, in input order.
    std::vector<std::string> match(const std::vector<std::string>& names) const;

private:
    NameCriteria criteria;
    std::shared_ptr<const re2::RE2> search;
    std::shared_ptr<const re2::RE2> not_search;
    std::vector<std::vector<std::shared_ptr<const re2::RE2>>> search_sets;
};

enum class ValueType
{
    ANY,
    INTEGER,
    NUMERIC,
    NON_NUMERIC,
};

/**
 * Matches cell values by type and by a full-match expression (or the absence
 * of a match for the inverse expression). Missing values match when
 * match_na is set.
 */
class ValueMatcher
{
public:
    explicit ValueMatcher(ValueType type = ValueType::ANY, const std::string& regex = "",
                          const std::string& inverse_regex = "");

    bool matches(std::string_view value, bool match_na = true) const;

private:
    ValueType type;
    std::shared_ptr<const re2::RE2> regex;
    std::shared_ptr<const re2::RE2> inverse_regex;
};

struct ColumnFinder
{
    std::string standard_name;
    NameMatcher name;
    ValueMatcher values;
};

// Every standard METABOLITES column, built once on first use.
const std::vector<ColumnFinder>& column_finders();
const ColumnFinder* find_column_finder(std::string_view standard_name);

// Standard columns whose presence implies another standard column.
const std::vector<std::pair<std::string, std::vector<std::string>>>& implied_pairs();

} // namespace mwtab
