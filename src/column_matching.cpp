#include "column_matching.hpp"
#include "text.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <re2/re2.h>
#include <stdexcept>

namespace mwtab {

std::string make_list_regex(const std::string& element, const std::string& delimiter, bool quoted_elements,
                            bool empty_string) {
    if (quoted_elements) {
        return "(" + make_list_regex(element, delimiter, false, empty_string) + "|"
             + make_list_regex("'" + element + "'", delimiter, false, empty_string) + "|"
             + make_list_regex("\"" + element + "\"", delimiter, false, empty_string) + ")";
    }
    std::string repetition = empty_string ? "*" : "+";
    return "((" + element + R"re(\s*)re" + delimiter + R"re(\s*))re" + repetition + "(" + element
         + R"re(\s*|\s*)))re";
}

namespace {
// Includes both the ASCII hyphen and U+2212; they are different values.
constexpr std::array<std::string_view, 38> COLUMN_NA_VALUES = {
    "", "-", "−", "--", "---", ".", ",",
    "NA", "na", "n.a.", "N.A.", "n/a", "N/A", "<NA>", "#N/A", "NaN", "nan", "N", "null", "Null", "NULL", "NF",
    "No result", "NOT Found in Database", "No ID", "no data", "unknown", "undefined", "No record", "NIDB",
    "Not available", "TBC", "Internal Standard", "Intstd", "internal standard", "Internal standard",
    "Spiked Stable Isotope Labeled Internal Standards", "Int Std",
};

constexpr std::string_view LEFT_TO_RIGHT_MARK = "\xE2\x80\x8E";

const std::string WRAP = "[^a-zA-Z0-9]";

std::string wrap(const std::string& word) {
    return "(" + WRAP + "|^)" + word + "(" + WRAP + "|$)";
}

std::string any_of(const std::vector<std::string>& words) {
    std::vector<std::string> wrapped;
    for (const auto& word : words) wrapped.push_back(wrap(word));
    return join(wrapped, "|");
}

std::string strip_value(std::string_view value) {
    std::string stripped = strip(value);
    std::string_view view = stripped;
    while (view.starts_with(LEFT_TO_RIGHT_MARK)) view.remove_prefix(LEFT_TO_RIGHT_MARK.size());
    while (view.ends_with(LEFT_TO_RIGHT_MARK)) view.remove_suffix(LEFT_TO_RIGHT_MARK.size());
    return std::string(view);
}

bool contains(std::string_view text, std::string_view word) {
    return text.find(word) != std::string_view::npos;
}

std::string replace_all(std::string text, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}
} // namespace

bool is_column_na_value(std::string_view value) {
    return std::find(COLUMN_NA_VALUES.begin(), COLUMN_NA_VALUES.end(), value) != COLUMN_NA_VALUES.end();
}

bool is_numeric(std::string_view value) {
    if (value.empty()) return false;
    std::string text(value);
    char* end = nullptr;
    double number = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size() && !std::isnan(number);
}

std::shared_ptr<const re2::RE2> compile_pattern(const std::string& pattern, bool case_insensitive) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    options.set_max_mem(int64_t{64} << 20);
    options.set_case_sensitive(!case_insensitive);
    std::shared_ptr<const re2::RE2> compiled = std::make_shared<re2::RE2>(pattern, options);
    if (!compiled->ok()) {
        throw std::runtime_error("Invalid pattern \"" + pattern + "\": " + compiled->error());
    }
    return compiled;
}

// ----------------------------------------------------------------------------
// NameMatcher
// ----------------------------------------------------------------------------

NameMatcher::NameMatcher(NameCriteria c) : criteria(std::move(c)) {
    if (!criteria.regex_search_strings.empty()) search = compile_pattern(any_of(criteria.regex_search_strings));
    if (!criteria.not_regex_search_strings.empty())
        not_search = compile_pattern(any_of(criteria.not_regex_search_strings));
    for (const auto& set : criteria.regex_search_sets) {
        std::vector<std::shared_ptr<const re2::RE2>> compiled;
        for (const auto& word : set) compiled.push_back(compile_pattern(wrap(word)));
        search_sets.push_back(std::move(compiled));
    }
}

bool NameMatcher::matches(std::string_view name) const {
    bool selected = (search && re2::RE2::PartialMatch(name, *search))
        || std::any_of(search_sets.begin(), search_sets.end(), [&](const auto& set) {
               return std::all_of(set.begin(), set.end(),
                                  [&](const auto& re) { return re2::RE2::PartialMatch(name, *re); });
           })
        || std::any_of(criteria.in_strings.begin(), criteria.in_strings.end(),
                       [&](const std::string& word) { return contains(name, word); })
        || std::any_of(criteria.in_string_sets.begin(), criteria.in_string_sets.end(), [&](const auto& set) {
               return std::all_of(set.begin(), set.end(), [&](const std::string& word) { return contains(name, word); });
           })
        || std::find(criteria.exact_strings.begin(), criteria.exact_strings.end(), name) != criteria.exact_strings.end();
    if (!selected) return false;

    if (not_search && re2::RE2::PartialMatch(name, *not_search)) return false;
    return std::none_of(criteria.not_in_strings.begin(), criteria.not_in_strings.end(),
                        [&](const std::string& word) { return contains(name, word); });
}

std::vector<std::string> NameMatcher::match(const std::vector<std::string>& names) const {
    std::vector<std::string> result;
    for (const auto& name : names) {
        if (matches(to_lower(strip(name)))) result.push_back(name);
    }
    return result;
}

// ----------------------------------------------------------------------------
// ValueMatcher
// ----------------------------------------------------------------------------

ValueMatcher::ValueMatcher(ValueType t, const std::string& re, const std::string& inverse) : type(t) {
    if (!re.empty()) {
        regex = compile_pattern(re);
    } else if (!inverse.empty()) {
        inverse_regex = compile_pattern(inverse);
    }
}

bool ValueMatcher::matches(std::string_view raw, bool match_na) const {
    std::string value = strip_value(raw);
    bool missing = is_column_na_value(value);

    bool pattern_ok = true;
    if (regex) {
        pattern_ok = re2::RE2::FullMatch(value, *regex);
    } else if (inverse_regex) {
        pattern_ok = !re2::RE2::FullMatch(value, *inverse_regex);
    }
    if (match_na) pattern_ok = pattern_ok || missing;

    // Not a number, and not one of the missing-value spellings either.
    bool textual = !is_numeric(value) != missing;

    bool type_ok = true;
    switch (type) {
    case ValueType::INTEGER:
        type_ok = value.find('.') == std::string::npos && !textual;
        break;
    case ValueType::NUMERIC:
        type_ok = !textual;
        break;
    case ValueType::NON_NUMERIC:
        type_ok = textual || missing;
        break;
    case ValueType::ANY:
        break;
    }
    return pattern_ok && type_ok;
}

// ----------------------------------------------------------------------------
// Standard columns
// ----------------------------------------------------------------------------

namespace {
using namespace patterns;

const std::string LIST_OF_NUMS = make_list_regex(NUMS, ",");
const std::string PARENTHESIZED_LIST_OF_NUMS = R"re(\()re" + LIST_OF_NUMS + R"re(\))re";
const std::string LIST_OF_NUMS_UNDERSCORE = make_list_regex(NUMS, "_");
const std::string LIST_OF_NUMS_SLASH = make_list_regex(NUMS, "/");
const std::string POSITIVE_NUMS = replace_all(NUMS, "-?", "");
const std::string LIST_OF_POS_INTS = make_list_regex(POSITIVE_INTS, ",");
const std::string LIST_OF_POS_INTS_OR = make_list_regex(POSITIVE_INTS, "or");
const std::string LIST_OF_POS_INTS_SLASH = make_list_regex(POSITIVE_INTS, "/");
const std::string LIST_OF_POS_INTS_SEMICOLON = make_list_regex(POSITIVE_INTS, ";");
const std::string LIST_OF_POS_INTS_SPACE = make_list_regex(POSITIVE_INTS, " ");
const std::string POSITIVE_FLOATS = R"re(\d*.\d+)re";
const std::string POSITIVE_SCIENTIFIC_NOTATION = R"re(\d*\.\d*E(-|\+)?\d+)re";
const std::string POSITIVE_FLOAT_RANGE = POSITIVE_FLOATS + R"re(\s*(_|-)\s*)re" + POSITIVE_FLOATS;
const std::string LIST_OF_POS_FLOATS_UNDERSCORE = make_list_regex(POSITIVE_FLOATS, "_");
const std::string POS_FLOAT_PAIRS = "(" + POSITIVE_FLOATS + "(_|@)" + POSITIVE_FLOATS + ")";
const std::string POS_INT_FLOAT_PAIR = "(" + POSITIVE_INTS + "_" + POSITIVE_FLOATS + ")";

const std::string ELEMENT_SYMBOL =
    "([BCFHIKNOPSUVWY]|[ISZ][nr]|[ACELP][ru]|A[cglmst]|B[aehikr]|"
    "C[adeflos]|D[bsy]|Es|F[elmr]|G[ade]|H[efgos]|Kr|L[aiv]|M[cdgnot]|"
    "N[abdehiop]|O[gs]|P[abdmot]|R[abe-hnu]|S[bcegim]|T[abcehilms]|Xe|Yb)";
const std::string ELEMENT_COUNT = R"re(([1-9]\d*)*)re";
const std::string FORMULA_ELEMENT = ELEMENT_SYMBOL + ELEMENT_COUNT;
const std::string FORMULA = "(" + FORMULA_ELEMENT + ")+";
const std::string BRACKETED_LIST_OF_FORMULAS = R"re(\[)re" + make_list_regex(FORMULA, ",", true) + R"re(\])re";

// Deuterium joins the element symbols for isotopic formulas.
const std::string ISOTOPIC_NUM = R"re(\d+)re";
const std::string ISOTOPIC_SYMBOL = ELEMENT_SYMBOL.substr(0, ELEMENT_SYMBOL.size() - 1) + "|D)";
const std::string ISOTOPIC_ELEMENT = ISOTOPIC_SYMBOL + ELEMENT_COUNT;
const std::string ISOTOPIC_FORMULA = "(" + ISOTOPIC_ELEMENT + "|"
    + R"re(\[)re" + ISOTOPIC_NUM + ISOTOPIC_SYMBOL + R"re(\])re" + ELEMENT_COUNT + "|"
    + R"re(\[)re" + ISOTOPIC_NUM + R"re(\])re" + ISOTOPIC_ELEMENT + "|"
    + R"re(\[)re" + ISOTOPIC_SYMBOL + ISOTOPIC_NUM + R"re(\])re" + ELEMENT_COUNT + "|"
    + ISOTOPIC_SYMBOL + R"re(\()re" + ISOTOPIC_NUM + R"re(\))re" + ELEMENT_COUNT + "|"
    + make_list_regex(ISOTOPIC_NUM + ISOTOPIC_SYMBOL + ELEMENT_COUNT, R"re(\+)re") + ")+";
const std::string BRACKETED_LIST_OF_ISOTOPIC_FORMULAS =
    R"re(\[)re" + make_list_regex(ISOTOPIC_FORMULA, ",", true) + R"re(\])re";
const std::string CHARGE_FORMULA = R"re((\[)re" + FORMULA + R"re(\](-|\+)|)re" + FORMULA + R"re((-|\+)))re";
const std::string GROUP_FORMULA = "(" + FORMULA_ELEMENT + "|" + R"re(\()re" + FORMULA + R"re(\)\d+)+)re";
const std::string ORGANIC_FORMULA = R"re((([CHNOPS]))re" + ELEMENT_COUNT + "){4,}";

const std::string SMILES =
    R"re((\[?\d?[a-zA-Z][a-z]?[0-9@+\-\[\]()\\/%=#$.*]*)+( \|[0-9:&,w]+\|)?)re";

const std::string INCHIKEY = R"re((InChIKey=)?[a-zA-Z]{14}-[a-zA-Z]{10}-[a-zA-Z]?)re";
const std::string INCHIKEY_OR_NULL = "(" + INCHIKEY + "|null|No record)";
const std::string LIST_OF_INCHIKEYS_SLASH =
    "(" + INCHIKEY + R"re(\s*/\s*)+)re" + "(" + INCHIKEY + R"re(\s*|\s*))re";
const std::string CHEAP_INCHI = R"re(\s*(InChI=)?\d+S?((/c|/h|/i|/t|/m|/s|/q|/f|/p|/b|/[A-Z])(\S)+)+\s*)re";

// M+H, [M+H]+, -H(-), M+AGN+H, M+Acid, (M-H)/2, [M-2H](2-)
const std::string ION_ELEMENTS = R"re((\d?(m|M)|(-|\+)?\d*)re" + FORMULA + R"re(\d*(\((-|\+)\))?|)re"
    + R"re([ \[a-zA-Z]*(A|a)cid|Cat|Chol-head|Hac|\di|FA|NA|A))re";
const std::string ION_BASE = "(" + make_list_regex(ION_ELEMENTS, R"re((-|\+)?)re") + ")";
const std::string ION = "(" + ION_BASE + "|"
    + R"re(\[)re" + ION_BASE + R"re(\]\(?\d?\s?(-|\+)?\d?\)?|)re"
    + ION_BASE + R"re(\](-|\+)?|)re"
    + R"re(\()re" + ION_BASE + R"re(\)((/\d)|(-|\+))?))re";
const std::string LIST_OF_IONS = make_list_regex(ION, ",");
const std::string LIST_OF_IONS_SPACE = make_list_regex(ION, " ");
const std::string LIST_OF_IONS_UNDERSCORE = make_list_regex(ION, "_");

// Includes values like CA1511 that appear often without being confirmed KEGG ids.
const std::string KEGG = R"re(((cpd:)?[CDMGKRZU]0?\d{5}\?{0,2}|(DG|ko)\d{5}|(CA|CE|UP|C)\d{4}|(NA|n/a)))re";
const std::string HMDB = R"re(((HMDB|HDMB|YMDB|HMBD)\d+(\*|\?)?|n/a))re";
const std::string HMDB_INT = R"re(\d{0,5})re";
const std::string LIPID_MAPS =
    R"re((LM(PK|ST|GL|FA|SP|GP|PR|SL)[0-9A-Z]{8,10}\*?|(ST|FA|PR|GP|PK|GL|SP)\d{4,6}-)re" + FORMULA + ")";
// Spreadsheet software can turn a CAS number into a date.
const std::string CAS = R"re((CAS: ?)?\d+-\d\d-0?\d|\d{1,2}/\d{1,2}/(\d{4}|\d{2}))re";

std::string any_expression(const std::vector<std::string>& alternatives) {
    return "(" + join(alternatives, "|") + ")";
}

std::vector<ColumnFinder> build_column_finders() {
    const std::string num_pair = NUMS + R"re(\s*\(\s*)re" + NUMS + R"re(\s*\))re";
    const std::string num_compare = NUMS + R"re((\s*>\s*|\s*<\s*))re" + NUMS;
    const std::string ids = any_expression({
        POSITIVE_INTS + "[&?]?", LIST_OF_POS_INTS, LIST_OF_POS_INTS_OR, LIST_OF_POS_INTS_SLASH,
        LIST_OF_POS_INTS_SPACE, LIST_OF_POS_INTS_SEMICOLON, R"re(Sum \(\d+ \+ \d+\))re", "CID" + POSITIVE_INTS,
    });
    const std::string times = any_expression({
        POSITIVE_FLOATS, R"re(\d)re", POSITIVE_SCIENTIFIC_NOTATION, POSITIVE_FLOAT_RANGE,
        LIST_OF_POS_FLOATS_UNDERSCORE,
    });

    std::vector<ColumnFinder> finders;
    auto add = [&](std::string name, NameCriteria criteria, ValueMatcher values) {
        finders.push_back({std::move(name), NameMatcher(std::move(criteria)), std::move(values)});
    };

    add("moverz_quant",
        {.regex_search_strings = {"m/z", "mz", "moverz", "mx"},
         .not_regex_search_strings = {"id"},
         .in_strings = {"m.z", "calcmz", "medmz", "m_z", "obsmz", "mass to charge", "mass over z"},
         .not_in_strings = {"spec", "pectrum", "structure", "regno", "retention"}},
        ValueMatcher(ValueType::ANY, any_expression({
            NUMS, LIST_OF_NUMS, LIST_OF_NUMS_UNDERSCORE, NUMS + R"re(\s*/\s*)re" + NUMS,
            "(" + NUMS + R"re(\s*\()re" + NUMS + R"re(\)\s*;\s*)+()re" + NUMS + R"re(\s*\()re" + NUMS
                + R"re(\)\s*|\s*))re",
            num_compare, "(" + NUMS + R"re(\s*)+)re", num_pair, NUMS + R"re(\s*-\s*)re" + NUMS,
        })));
    add("mass",
        {.regex_search_strings = {"mass", "quantmass", "masses", "mw", "weight"},
         .not_regex_search_strings = {"id"},
         .in_strings = {"exactmass", "obsmass", "calcmass", "monoisotopicmass", "molwt"},
         .not_in_strings = {"spec", "pectrum", "structure", "regno", "charge", "over z", "rsd", "m/z"},
         .exact_strings = {"m meas."}},
        ValueMatcher(ValueType::ANY, any_expression({
            NUMS, LIST_OF_NUMS, NUMS + R"re(\s*/\s*)re" + NUMS + R"re((\s*Da)?)re", NUMS + R"re(\s*-\s*)re" + NUMS,
        })));
    add("parent_moverz_quant", {.exact_strings = {"parent"}}, ValueMatcher(ValueType::NUMERIC));
    add("mass_spectrum",
        {.in_strings = {"spec", "pectrum"}, .not_in_strings = {"species", "composite"}},
        ValueMatcher(ValueType::ANY, any_expression({
            "(" + NUMS + ":" + NUMS + R"re((_|\s+|$))+)re", NUMS, LIST_OF_NUMS,
        })));
    add("composite_mass_spectrum",
        {.not_in_strings = {"species"}, .in_string_sets = {{"composite", "spectrum"}}},
        ValueMatcher(ValueType::ANY, "((" + PARENTHESIZED_LIST_OF_NUMS + R"re(\s*)+))re"));
    add("inchi_key",
        {.in_strings = {"inchikey", "inchi-key", "inchi_key", "inchi key"}},
        ValueMatcher(ValueType::ANY, any_expression({
            INCHIKEY + R"re((\*?|\?*))re",
            INCHIKEY_OR_NULL + R"re((\s*or\s*|\s*;\s*|\s*_\s*|\s*&\s*))re" + INCHIKEY_OR_NULL,
            R"re(Sum\s*\(\s*)re" + INCHIKEY + R"re((\s*\+\s*))re" + INCHIKEY + R"re(\s*\))re",
            LIST_OF_INCHIKEYS_SLASH,
        })));
    add("inchi",
        {.in_strings = {"inchi"}, .not_in_strings = {"key"}},
        ValueMatcher(ValueType::ANY, any_expression({
            CHEAP_INCHI, R"re(\[)re" + make_list_regex(CHEAP_INCHI, ",", true) + R"re(\])re",
        })));
    add("smiles", {.in_strings = {"smile"}},
        ValueMatcher(ValueType::ANY, any_expression({SMILES, make_list_regex(SMILES, ";")})));
    add("formula", {.in_strings = {"formula"}},
        ValueMatcher(ValueType::NON_NUMERIC, any_expression({
            replace_all(ISOTOPIC_FORMULA, R"re(\d*)re", R"re(\d*\s*)re"), CHARGE_FORMULA, GROUP_FORMULA,
            BRACKETED_LIST_OF_FORMULAS, BRACKETED_LIST_OF_ISOTOPIC_FORMULAS,
        })));
    add("compound",
        {.in_strings = {"compound", "compund"},
         .not_in_strings = {"kegg", "formula", "pubchem", "mass", "rt", "algo", "id", "name"}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("name",
        {.in_strings = {"name"},
         .not_in_strings = {"adduct", "named", "internal", "ion", "metabolite_name"},
         .in_string_sets = {{"name", "refmet"}}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("refmet", {.in_strings = {"refmet"}, .not_in_strings = {"name", "in"}},
        ValueMatcher(ValueType::ANY, "(" + POSITIVE_INTS + ")"));
    add("class", {.in_strings = {"class"}},
        ValueMatcher(ValueType::NON_NUMERIC, "", "(" + ORGANIC_FORMULA + ")"));
    add("pathway", {.in_strings = {"pathway"}, .not_in_strings = {"sort"}}, ValueMatcher(ValueType::NON_NUMERIC));
    add("pathway_sortorder", {.in_string_sets = {{"pathway", "sort"}}}, ValueMatcher(ValueType::INTEGER));
    add("ion",
        {.regex_search_strings = {"ion", "ions"}, .not_in_strings = {"adduct", "m/z", "mass"}},
        ValueMatcher(ValueType::ANY, any_expression({
            ION, LIST_OF_IONS, LIST_OF_IONS_SPACE, NUMS, LIST_OF_NUMS, num_compare, LIST_OF_NUMS_SLASH,
        })));
    add("adduct", {.in_strings = {"adduct"}, .not_in_strings = {"formula"}},
        ValueMatcher(ValueType::ANY, any_expression({
            ION, LIST_OF_IONS, LIST_OF_IONS_SPACE, LIST_OF_IONS_UNDERSCORE, make_list_regex(ION, "(_| )"),
            make_list_regex(ION, ""), R"re(\[)re" + make_list_regex(ION, ",", true) + R"re(\])re",
        })));
    add("species", {.in_strings = {"species"}, .not_in_strings = {"is_species", "ion"}},
        ValueMatcher(ValueType::ANY, any_expression({ION, LIST_OF_IONS, LIST_OF_IONS_UNDERSCORE})));
    add("pubchem_id",
        {.regex_search_strings = {"cid"}, .in_strings = {"pubchem"}, .not_in_strings = {"formula", "kegg"}},
        ValueMatcher(ValueType::ANY, ids));
    add("kegg_id", {.in_strings = {"kegg"}, .not_in_strings = {"name"}},
        ValueMatcher(ValueType::ANY, any_expression({
            KEGG, make_list_regex(KEGG, ","), make_list_regex(KEGG, ";"), make_list_regex(KEGG, "/"),
            make_list_regex(KEGG, "//"), make_list_regex(KEGG, "_"), make_list_regex(KEGG, "-"),
            make_list_regex(KEGG, "(/|,)"), make_list_regex(KEGG, " "), make_list_regex(KEGG, R"re((\|))re"),
            KEGG + "-" + FORMULA, KEGG + R"re(;\d+)re",
        })));
    add("hmdb_id",
        {.in_strings = {"hmdb", "human metabolome"}, .not_in_strings = {"class"}, .in_string_sets = {{"hmp", "id"}}},
        ValueMatcher(ValueType::ANY, any_expression({
            HMDB, HMDB_INT, make_list_regex(HMDB, ","), make_list_regex(HMDB, "/"), make_list_regex(HMDB_INT, ","),
            make_list_regex(HMDB_INT, "/"), R"re(Sum \(HMDB\d+ \+ HMDB\d+\))re", make_list_regex(HMDB, "&"),
            make_list_regex(HMDB, ";"), make_list_regex(HMDB, " "), R"re(METPA\d+)re", make_list_regex(HMDB, "_"),
        })));
    add("lm_id",
        {.in_strings = {"lipidmaps", "lmid"}, .in_string_sets = {{"lmp", "id"}, {"lipid", "map"}, {"lm", "id"}}},
        ValueMatcher(ValueType::ANY, any_expression({
            LIPID_MAPS, make_list_regex(LIPID_MAPS, "_"), make_list_regex(LIPID_MAPS, ","),
            make_list_regex(LIPID_MAPS, "/"), POSITIVE_INTS,
        })));
    add("chemspider_id", {.in_strings = {"chemspider"}},
        ValueMatcher(ValueType::ANY, any_expression({
            ids, "CSID" + POSITIVE_INTS, R"re([CD]\d{5})re", make_list_regex(R"re([CD]\d{5})re", R"re(\|)re"),
        })));
    add("metlin_id", {.in_strings = {"metlin"}},
        ValueMatcher(ValueType::ANY, any_expression({POSITIVE_INTS, "METLIN:" + POSITIVE_INTS})));
    add("cas_number", {.regex_search_strings = {"cas"}},
        ValueMatcher(ValueType::ANY, any_expression({CAS, make_list_regex(CAS, ","), make_list_regex(CAS, ";")})));
    add("binbase_id", {.regex_search_strings = {"bb"}, .in_strings = {"binbase"}},
        ValueMatcher(ValueType::ANY, "(" + POSITIVE_INTS + ")"));
    add("chebi_id", {.in_strings = {"chebi"}}, ValueMatcher(ValueType::ANY, "(" + POSITIVE_INTS + ")"));
    add("mw_regno", {.in_strings = {"regno"}, .in_string_sets = {{"mw", "structure"}}},
        ValueMatcher(ValueType::ANY, any_expression({POSITIVE_INTS, LIST_OF_POS_INTS})));
    add("mzcloud_id", {.in_string_sets = {{"mz", "cloud", "id"}}},
        ValueMatcher(ValueType::ANY, "(((Reference|Autoprocessed)-)?" + POSITIVE_INTS + ")"));
    add("identifier",
        {.in_strings = {"identifier", "retention time_m/z", "feature@rt"},
         .not_in_strings = {"pubchem", "study", "database"}},
        ValueMatcher(ValueType::ANY, any_expression({
            POS_FLOAT_PAIRS + "(n|m/z)?", POS_INT_FLOAT_PAIR, make_list_regex(POS_FLOAT_PAIRS, "_"),
            make_list_regex(POS_FLOAT_PAIRS, ""), make_list_regex(POS_FLOAT_PAIRS, "(//|,)"), R"re(CHEBI:\d+)re",
        })));
    add("other_id",
        {.not_regex_search_strings = {"cas"},
         .in_strings = {"other"},
         .not_in_strings = {"type", "pubchem", "chemspider", "kegg"},
         .in_string_sets = {{"database", "identifier"}, {"chemical", "id"}, {"cmpd", "id"}, {"database", "id"},
                            {"database", "match"}, {"local", "id"}, {"row", "id"}, {"comp", "id"}, {"chem", "id"},
                            {"chro", "lib", "id"}, {"lib", "id"}},
         .exact_strings = {"id"}},
        ValueMatcher(ValueType::ANY, "", any_expression({FLOAT, SCIENTIFIC_NOTATION})));
    add("other_id_type", {.in_string_sets = {{"other", "type"}, {"source", "database"}}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("retention_time",
        {.regex_search_strings = {"rt"},
         .regex_search_sets = {{"ret", "time"}},
         .in_strings = {"rtimes", "r.t.", "medrt", "rtsec", "bestrt", "compoundrt", "rtmed"},
         .not_in_strings = {"type", "error", "index", "delta", "feature", "m/z"},
         .in_string_sets = {{"retention", "time"}, {"rentetion", "time"}, {"retension", "time"}}},
        ValueMatcher(ValueType::ANY, times));
    add("delta_rt",
        {.in_strings = {"deltart"}, .not_in_strings = {"type", "error", "index"}, .in_string_sets = {{"delta", "rt"}}},
        ValueMatcher(ValueType::ANY, FLOAT + "|0"));
    add("retention_index",
        {.regex_search_strings = {"ri"},
         .regex_search_sets = {{"ret", "ind"}, {"ret", "index"}},
         .in_strings = {"rindex"},
         .not_in_strings = {"type", "error"},
         .in_string_sets = {{"retention", "index"}, {"rentetion", "index"}, {"reten", "index"}}},
        ValueMatcher(ValueType::ANY, times));
    add("retention_index_type",
        {.not_in_strings = {"error"}, .in_string_sets = {{"retention", "index", "type"}, {"ri", "type"}}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("abbreviation", {.in_strings = {"abbreviation"}}, ValueMatcher(ValueType::NON_NUMERIC));
    add("assignment_certainty", {.in_string_sets = {{"assignment", "certainty"}}},
        ValueMatcher(ValueType::ANY, "(" + POSITIVE_INTS + ")"));
    add("comment", {.in_strings = {"comment"}},
        ValueMatcher(ValueType::ANY, "", any_expression({FLOAT, SCIENTIFIC_NOTATION, R"re(\d{2,})re"})));
    add("assignment_method", {.in_string_sets = {{"assignment", "method"}}}, ValueMatcher(ValueType::NON_NUMERIC));
    add("isotopologue",
        {.in_strings = {"isotopologue"}, .not_in_strings = {"type"}, .in_string_sets = {{"isotope", "count"}}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("isotopologue_type", {.in_strings = {"isotopologue%type", "isotope"}, .not_in_strings = {"count"}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("peak_description", {.in_string_sets = {{"peak", "description"}}}, ValueMatcher(ValueType::NON_NUMERIC));
    add("peak_pattern", {.in_string_sets = {{"peak", "pattern"}}}, ValueMatcher(ValueType::NON_NUMERIC));
    add("transient_peak", {.not_in_strings = {"type"}, .in_string_sets = {{"transient", "peak"}}},
        ValueMatcher(ValueType::ANY, "(" + POSITIVE_INTS + ")"));
    add("transient_peak_type", {.in_string_sets = {{"transient", "peak", "type"}}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("fish_coverage", {.in_string_sets = {{"fish", "coverage"}}},
        ValueMatcher(ValueType::ANY, "(" + POSITIVE_NUMS + ")"));
    add("msi_category", {.in_strings = {"msicategory"}}, ValueMatcher(ValueType::ANY, "1"));
    add("annotations",
        {.not_regex_search_strings = {"id"},
         .in_strings = {"annotation"},
         .not_in_strings = {"source", "approach", "confidence", "level"}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("istd", {.in_strings = {"internal"}, .exact_strings = {"istd"}}, ValueMatcher(ValueType::NON_NUMERIC));
    add("platform", {.in_strings = {"platform"}}, ValueMatcher(ValueType::NON_NUMERIC));
    add("ms_method", {.in_strings = {"method"}, .not_in_strings = {"assignment"}},
        ValueMatcher(ValueType::NON_NUMERIC));
    add("polarity", {.in_strings = {"polarity"}},
        ValueMatcher(ValueType::ANY, R"re((?i)((neg|pos|1|-1|\+|positive|negative)|\[M\+H\]\+|\[M-H\]-|5MM\+|5MM-))re"));
    add("esi_mode", {.in_strings = {"esi"}},
        ValueMatcher(ValueType::ANY,
                     R"re((neg|pos|1|-1|(ESI )?\(\+\)( ESI)?|(ESI )?\(-\)( ESI| ES\))?|positive|negative))re"));
    add("ionization_mode",
        {.regex_search_sets = {{"pos", "neg"}},
         .in_strings = {"ionization", "ionisation"},
         .not_in_strings = {"confirmed"},
         .exact_strings = {"mode", "ms mode"}},
        ValueMatcher(ValueType::ANY, R"re((?i)((neg|pos|1|-1|(ES)?\+|(ES)?-|positive|negative|TOF|Splitless|Split30)))re"));
    add("frequency", {.in_strings = {"frequency"}}, ValueMatcher(ValueType::ANY, "(" + POSITIVE_INTS + ")"));
    return finders;
}
} // namespace

const std::vector<ColumnFinder>& column_finders() {
    static const std::vector<ColumnFinder> finders = build_column_finders();
    return finders;
}

const ColumnFinder* find_column_finder(std::string_view standard_name) {
    for (const auto& finder : column_finders()) {
        if (finder.standard_name == standard_name) return &finder;
    }
    return nullptr;
}

const std::vector<std::pair<std::string, std::vector<std::string>>>& implied_pairs() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> pairs = {
        {"other_id", {"other_id_type"}},
        {"retention_index", {"retention_index_type"}},
    };
    return pairs;
}

} // namespace mwtab
