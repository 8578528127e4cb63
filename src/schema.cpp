#include "schema.hpp"
#include "column_matching.hpp"
#include "text.hpp"
#include <algorithm>
#include <array>
#include <re2/re2.h>

namespace mwtab {

namespace {
// Includes both the ASCII hyphen and U+2212.
constexpr std::array<std::string_view, 21> NA_VALUES = {
    "", "-", "−", "--", "---",
    "NA", "na", "n.a.", "N.A.", "n/a", "N/A", "#N/A", "NaN", "nan",
    "null", "Null", "NULL", "none", "None",
    "unspecified", "Unspecified",
};

const std::string ID_MESSAGE = R"( must be the letters "%s" followed by 6 numbers. Ex. "%s001405".)";
const std::string NUMERIC_MESSAGE = R"( must be a positive integer. Ex. "1" or "2051".)";
const std::string IGNORE_SUFFIX = " Ignore this when more complicated descriptions are required.";
} // namespace

bool is_na_value(std::string_view value) {
    return std::find(NA_VALUES.begin(), NA_VALUES.end(), value) != NA_VALUES.end();
}

bool is_metabolite_na_value(std::string_view value) {
    return value != "NA" && is_na_value(value);
}

std::string units_pattern(const std::vector<std::string>& units, bool can_be_range) {
    std::string number = can_be_range ? "(" + patterns::NUM_RANGE + "|" + patterns::NUMS + ")" : patterns::NUMS;
    return "^" + number + " (" + join(units, "|") + ")$";
}

std::string units_message(const std::vector<std::string>& units, bool can_be_range) {
    std::string range = can_be_range ? R"( or range (ex. "5-6") )" : " ";
    return " should be a number" + range + R"(followed by a space with a unit (ex. "5 V") from the following list: )"
         + bracket_list(units) + "." + IGNORE_SUFFIX;
}

const FieldRule* SectionSchema::field(std::string_view key) const {
    for (const auto& rule : fields) {
        if (rule.key == key) return &rule;
    }
    return nullptr;
}

bool SectionSchema::is_required(std::string_view key) const {
    return std::find(required.begin(), required.end(), key) != required.end();
}

const SectionSchema* SchemaTable::find(std::string_view name) const {
    for (const auto& section : sections) {
        if (section.name == name) return &section;
    }
    return nullptr;
}

// ----------------------------------------------------------------------------
// Schema tables
// ----------------------------------------------------------------------------

namespace {
FieldRule plain(std::string key) {
    FieldRule rule;
    rule.key = std::move(key);
    return rule;
}

FieldRule text(std::string key) {
    FieldRule rule = plain(std::move(key));
    rule.reject_na = true;
    return rule;
}

FieldRule matching(std::string key, const std::string& pattern, std::string message) {
    FieldRule rule = plain(std::move(key));
    rule.pattern = compile_pattern(pattern);
    rule.pattern_message = std::move(message);
    return rule;
}

FieldRule id(std::string key, const std::string& letters) {
    std::string message = ID_MESSAGE;
    for (size_t pos; (pos = message.find("%s")) != std::string::npos;) message.replace(pos, 2, letters);
    return matching(std::move(key), "^" + letters + R"(\d{6}$)", message);
}

FieldRule units(std::string key, const std::vector<std::string>& unit_list, bool can_be_range = false) {
    return matching(std::move(key), units_pattern(unit_list, can_be_range), units_message(unit_list, can_be_range));
}

FieldRule unitless(std::string key, const std::string& pattern) {
    return matching(std::move(key), pattern, " should be a unitless number." + IGNORE_SUFFIX);
}

FieldRule email(std::string key) {
    FieldRule rule = plain(std::move(key));
    rule.email = true;
    return rule;
}

FieldRule composite(std::string key) {
    FieldRule rule = plain(std::move(key));
    rule.composite = true;
    return rule;
}

SectionSchema items(std::string name, std::vector<FieldRule> fields, std::vector<std::string> required) {
    SectionSchema section;
    section.name = std::move(name);
    section.fields = std::move(fields);
    section.required = std::move(required);
    return section;
}

SectionSchema header_schema() {
    return items(std::string(HEADER_SECTION),
                 {id("STUDY_ID", "ST"), id("ANALYSIS_ID", "AN"),
                  matching("VERSION", R"(^\d+$)", NUMERIC_MESSAGE), text("CREATED_ON"), id("PROJECT_ID", "PR"),
                  text("HEADER"), matching("DATATRACK_ID", R"(^\d+$)", NUMERIC_MESSAGE), plain("filename")},
                 {"VERSION", "CREATED_ON"});
}

SectionSchema project_schema() {
    return items("PROJECT",
                 {text("PROJECT_TITLE"), text("PROJECT_TYPE"), text("PROJECT_SUMMARY"), text("INSTITUTE"),
                  text("DEPARTMENT"), text("LABORATORY"), text("LAST_NAME"), text("FIRST_NAME"), text("ADDRESS"),
                  email("EMAIL"), text("PHONE"), text("FUNDING_SOURCE"), text("PROJECT_COMMENTS"),
                  text("PUBLICATIONS"), text("CONTRIBUTORS"),
                  matching("DOI", R"(10\.\d{4,9}/[-._;()/:a-z0-9A-Z]+)", " does not appear to be a valid DOI.")},
                 {"PROJECT_TITLE", "PROJECT_SUMMARY", "INSTITUTE", "LAST_NAME", "FIRST_NAME", "ADDRESS", "EMAIL",
                  "PHONE"});
}

SectionSchema study_schema() {
    return items("STUDY",
                 {text("STUDY_TITLE"), text("STUDY_TYPE"), text("STUDY_SUMMARY"), text("INSTITUTE"),
                  text("DEPARTMENT"), text("LABORATORY"), text("LAST_NAME"), text("FIRST_NAME"), text("ADDRESS"),
                  email("EMAIL"), text("PHONE"), text("SUBMIT_DATE"), text("NUM_GROUPS"), text("TOTAL_SUBJECTS"),
                  text("NUM_MALES"), text("NUM_FEMALES"), text("STUDY_COMMENTS"), text("PUBLICATIONS")},
                 {"STUDY_TITLE", "STUDY_SUMMARY", "INSTITUTE", "LAST_NAME", "FIRST_NAME", "ADDRESS", "EMAIL",
                  "PHONE"});
}

SectionSchema subject_schema() {
    FieldRule taxonomy = matching("TAXONOMY_ID", make_list_regex(R"(\d+)", R"((,|;|\||/))", false, true),
                                  " must be a number or list of numbers.");
    taxonomy.reject_na = true;
    return items("SUBJECT",
                 {text("SUBJECT_TYPE"), text("SUBJECT_SPECIES"), taxonomy, text("GENOTYPE_STRAIN"),
                  units("AGE_OR_AGE_RANGE", {"weeks", "days", "months", "years"}, true),
                  units("WEIGHT_OR_WEIGHT_RANGE", {"g", "mg", "kg", "lbs"}, true),
                  units("HEIGHT_OR_HEIGHT_RANGE", {"cm", "in"}, true),
                  matching("GENDER", R"(^((?i:male)|(?i:female)|(?i:male, female)|(?i:hermaphrodite)|N/A)$)",
                           R"( should be one of "Male", "Female", "Male, Female", "Hermaphrodite", or "N/A".)"
                               + IGNORE_SUFFIX),
                  text("HUMAN_RACE"), text("HUMAN_ETHNICITY"), text("HUMAN_TRIAL_TYPE"),
                  text("HUMAN_LIFESTYLE_FACTORS"), text("HUMAN_MEDICATIONS"), text("HUMAN_PRESCRIPTION_OTC"),
                  text("HUMAN_SMOKING_STATUS"), text("HUMAN_ALCOHOL_DRUG_USE"), text("HUMAN_NUTRITION"),
                  text("HUMAN_INCLUSION_CRITERIA"), text("HUMAN_EXCLUSION_CRITERIA"), text("ANIMAL_ANIMAL_SUPPLIER"),
                  text("ANIMAL_HOUSING"), text("ANIMAL_LIGHT_CYCLE"), text("ANIMAL_FEED"), text("ANIMAL_WATER"),
                  text("ANIMAL_INCLUSION_CRITERIA"), text("CELL_BIOSOURCE_OR_SUPPLIER"), text("CELL_STRAIN_DETAILS"),
                  text("SUBJECT_COMMENTS"), text("CELL_PRIMARY_IMMORTALIZED"), text("CELL_PASSAGE_NUMBER"),
                  text("CELL_COUNTS"), text("SPECIES_GROUP")},
                 {"SUBJECT_TYPE", "SUBJECT_SPECIES"});
}

SectionSchema factors_schema() {
    SectionSchema section = items(std::string(SSF_SECTION), {plain("Subject ID"), text("Sample ID")},
                                  {"Subject ID", "Sample ID", "Factors"});
    section.kind = SectionKind::FACTORS;
    section.additional_fields = {text("RAW_FILE_NAME")};
    return section;
}

SectionSchema collection_schema() {
    return items("COLLECTION",
                 {text("COLLECTION_SUMMARY"), text("COLLECTION_PROTOCOL_ID"), text("COLLECTION_PROTOCOL_FILENAME"),
                  text("COLLECTION_PROTOCOL_COMMENTS"), text("SAMPLE_TYPE"), text("COLLECTION_METHOD"),
                  text("COLLECTION_LOCATION"), text("COLLECTION_FREQUENCY"), text("COLLECTION_DURATION"),
                  text("COLLECTION_TIME"), text("VOLUMEORAMOUNT_COLLECTED"), text("STORAGE_CONDITIONS"),
                  text("COLLECTION_VIALS"), text("STORAGE_VIALS"), text("COLLECTION_TUBE_TEMP"), text("ADDITIVES"),
                  matching("BLOOD_SERUM_OR_PLASMA", "(?i)^(blood|plasma|serum)$",
                           R"( should be one of "Blood", "Plasma", or "Serum".)" + IGNORE_SUFFIX),
                  text("TISSUE_CELL_IDENTIFICATION"), text("TISSUE_CELL_QUANTITY_TAKEN")},
                 {"COLLECTION_SUMMARY"});
}

SectionSchema treatment_schema() {
    return items("TREATMENT",
                 {text("TREATMENT_SUMMARY"), text("TREATMENT_PROTOCOL_ID"), text("TREATMENT_PROTOCOL_FILENAME"),
                  text("TREATMENT_PROTOCOL_COMMENTS"), text("TREATMENT"), text("TREATMENT_COMPOUND"),
                  text("TREATMENT_ROUTE"), text("TREATMENT_DOSE"), text("TREATMENT_DOSEVOLUME"),
                  units("TREATMENT_DOSEDURATION", {"h", "weeks", "days"}, true), text("TREATMENT_VEHICLE"),
                  text("ANIMAL_VET_TREATMENTS"), text("ANIMAL_ANESTHESIA"), text("ANIMAL_ACCLIMATION_DURATION"),
                  text("ANIMAL_FASTING"), text("ANIMAL_ENDP_EUTHANASIA"), text("ANIMAL_ENDP_TISSUE_COLL_LIST"),
                  text("ANIMAL_ENDP_TISSUE_PROC_METHOD"), text("ANIMAL_ENDP_CLINICAL_SIGNS"), text("HUMAN_FASTING"),
                  text("HUMAN_ENDP_CLINICAL_SIGNS"), text("CELL_STORAGE"), text("CELL_GROWTH_CONTAINER"),
                  text("CELL_GROWTH_CONFIG"), text("CELL_GROWTH_RATE"), text("CELL_INOC_PROC"), text("CELL_MEDIA"),
                  text("CELL_ENVIR_COND"), text("CELL_HARVESTING"), text("PLANT_GROWTH_SUPPORT"),
                  text("PLANT_GROWTH_LOCATION"), text("PLANT_PLOT_DESIGN"), text("PLANT_LIGHT_PERIOD"),
                  text("PLANT_HUMIDITY"), units("PLANT_TEMP", {"°C", "C"}, true), text("PLANT_WATERING_REGIME"),
                  text("PLANT_NUTRITIONAL_REGIME"), text("PLANT_ESTAB_DATE"), text("PLANT_HARVEST_DATE"),
                  text("PLANT_GROWTH_STAGE"), text("PLANT_METAB_QUENCH_METHOD"), text("PLANT_HARVEST_METHOD"),
                  text("PLANT_STORAGE"), text("CELL_PCT_CONFLUENCE"), text("CELL_MEDIA_LASTCHANGED")},
                 {"TREATMENT_SUMMARY"});
}

SectionSchema sampleprep_schema() {
    return items("SAMPLEPREP",
                 {text("SAMPLEPREP_SUMMARY"), text("SAMPLEPREP_PROTOCOL_ID"), text("SAMPLEPREP_PROTOCOL_FILENAME"),
                  text("SAMPLEPREP_PROTOCOL_COMMENTS"), text("PROCESSING_METHOD"),
                  text("PROCESSING_STORAGE_CONDITIONS"), text("EXTRACTION_METHOD"),
                  text("EXTRACT_CONCENTRATION_DILUTION"), text("EXTRACT_ENRICHMENT"), text("EXTRACT_CLEANUP"),
                  text("EXTRACT_STORAGE"), text("SAMPLE_RESUSPENSION"), text("SAMPLE_DERIVATIZATION"),
                  text("SAMPLE_SPIKING"), text("ORGAN"), text("ORGAN_SPECIFICATION"), text("CELL_TYPE"),
                  text("SUBCELLULAR_LOCATION")},
                 {"SAMPLEPREP_SUMMARY"});
}

SectionSchema chromatography_schema() {
    // Injection temperature also accepts "room temperature".
    std::string injection = units_pattern({"°C", "C"}, true);
    injection = "^(" + injection.substr(1, injection.size() - 2) + ")|(?i:room temperature)$";
    std::string injection_message =
        R"( should be a number or range (ex. "5-6") followed by a space with a unit (ex. "5 V") from the following list: ['°C', 'C'] or "room temperature".)"
        + IGNORE_SUFFIX;

    return items("CHROMATOGRAPHY",
                 {text("CHROMATOGRAPHY_SUMMARY"), text("CHROMATOGRAPHY_TYPE"), text("INSTRUMENT_NAME"),
                  text("COLUMN_NAME"), text("FLOW_GRADIENT"), units("FLOW_RATE", {"mL/min", "uL/min", "μL/min"}, true),
                  units("COLUMN_TEMPERATURE", {"°C", "C"}, true), text("METHODS_FILENAME"),
                  units("SAMPLE_INJECTION", {"μL", "uL"}), text("SOLVENT_A"), text("SOLVENT_B"), text("METHODS_ID"),
                  units("COLUMN_PRESSURE", {"psi", "bar"}, true),
                  matching("INJECTION_TEMPERATURE", injection, injection_message), text("INTERNAL_STANDARD"),
                  text("INTERNAL_STANDARD_MT"), text("RETENTION_INDEX"), text("RETENTION_TIME"),
                  text("SAMPLING_CONE"), units("ANALYTICAL_TIME", {"min"}, true),
                  units("CAPILLARY_VOLTAGE", {"V", "kV"}), text("MIGRATION_TIME"), text("OVEN_TEMPERATURE"),
                  text("PRECONDITIONING"), text("RUNNING_BUFFER"), units("RUNNING_VOLTAGE", {"V", "kV"}),
                  text("SHEATH_LIQUID"), text("TIME_PROGRAM"), units("TRANSFERLINE_TEMPERATURE", {"°C", "C"}),
                  text("WASHING_BUFFER"), text("WEAK_WASH_SOLVENT_NAME"), units("WEAK_WASH_VOLUME", {"μL", "uL"}),
                  text("STRONG_WASH_SOLVENT_NAME"), units("STRONG_WASH_VOLUME", {"μL", "uL"}),
                  units("TARGET_SAMPLE_TEMPERATURE", {"°C", "C"}), units("SAMPLE_LOOP_SIZE", {"μL", "uL"}),
                  units("SAMPLE_SYRINGE_SIZE", {"μL", "uL"}), text("RANDOMIZATION_ORDER"),
                  text("CHROMATOGRAPHY_COMMENTS")},
                 {"CHROMATOGRAPHY_TYPE", "INSTRUMENT_NAME", "COLUMN_NAME", "FLOW_GRADIENT", "FLOW_RATE",
                  "COLUMN_TEMPERATURE", "SOLVENT_A", "SOLVENT_B"});
}

SectionSchema analysis_schema() {
    FieldRule type = plain("ANALYSIS_TYPE");
    type.allowed = {"MS", "NMR"};
    return items("ANALYSIS",
                 {type, text("LABORATORY_NAME"), text("ACQUISITION_DATE"), text("SOFTWARE_VERSION"),
                  text("OPERATOR_NAME"), text("DETECTOR_TYPE"), text("ANALYSIS_PROTOCOL_FILE"),
                  text("ACQUISITION_PARAMETERS_FILE"), text("PROCESSING_PARAMETERS_FILE"), text("DATA_FORMAT"),
                  text("ACQUISITION_ID"), text("ACQUISITION_TIME"), text("ANALYSIS_COMMENTS"),
                  text("ANALYSIS_DISPLAY"), text("INSTRUMENT_NAME"), text("INSTRUMENT_PARAMETERS_FILE"),
                  text("NUM_FACTORS"), text("NUM_METABOLITES"), text("PROCESSED_FILE"), text("RANDOMIZATION_ORDER"),
                  text("RAW_FILE")},
                 {"ANALYSIS_TYPE"});
}

SectionSchema results_file_schema() {
    return items("results file", {text("filename"), text("UNITS"), text("Has m/z"), text("Has RT"), text("RT units")},
                 {"filename", "UNITS"});
}

SectionSchema ms_section_schema() {
    FieldRule ionization = text("IONIZATION");
    ionization.rejected = compile_pattern("(?i)^(pos|neg|positive|negative|postive|both)$");
    ionization.rejected_message = R"( should not be "positive" or "negative". "ION_MODE" is where that should be indicated.)";

    return items("MS",
                 {text("INSTRUMENT_NAME"), text("INSTRUMENT_TYPE"), text("MS_TYPE"),
                  matching("ION_MODE", "(?i)^(positive|negative|positive, negative|unspecified)$",
                           R"( should be one of "Positive", "Negative", "Positive, Negative", or "Unspecified".)"
                               + IGNORE_SUFFIX),
                  units("CAPILLARY_TEMPERATURE", {"°C", "C"}, true), units("CAPILLARY_VOLTAGE", {"V", "kV"}),
                  text("COLLISION_ENERGY"),
                  matching("COLLISION_GAS", "(?i)^(nitrogen|argon)$",
                           R"( should be one of "Nitrogen" or "Argon".)" + IGNORE_SUFFIX),
                  units("DRY_GAS_FLOW", {"L/hr", "L/min"}), units("DRY_GAS_TEMP", {"°C", "C"}),
                  units("FRAGMENT_VOLTAGE", {"V"}), text("FRAGMENTATION_METHOD"),
                  units("GAS_PRESSURE", {"psi", "psig", "bar", "kPa"}), units("HELIUM_FLOW", {"mL/min"}),
                  units("ION_SOURCE_TEMPERATURE", {"°C", "C"}), units("ION_SPRAY_VOLTAGE", {"V", "kV"}), ionization,
                  units("IONIZATION_ENERGY", {"eV"}), text("IONIZATION_POTENTIAL"), text("MASS_ACCURACY"),
                  text("PRECURSOR_TYPE"), text("REAGENT_GAS"), units("SOURCE_TEMPERATURE", {"°C", "C"}),
                  units("SPRAY_VOLTAGE", {"kV"}), text("ACTIVATION_PARAMETER"), units("ACTIVATION_TIME", {"ms"}),
                  text("ATOM_GUN_CURRENT"), text("AUTOMATIC_GAIN_CONTROL"), text("BOMBARDMENT"),
                  text("CDL_SIDE_OCTOPOLES_BIAS_VOLTAGE"), text("CDL_TEMPERATURE"), text("DATAFORMAT"),
                  units("DESOLVATION_GAS_FLOW", {"L/hr", "L/min"}), units("DESOLVATION_TEMPERATURE", {"°C", "C"}),
                  text("INTERFACE_VOLTAGE"), text("IT_SIDE_OCTOPOLES_BIAS_VOLTAGE"), text("LASER"), text("MATRIX"),
                  text("NEBULIZER"), units("OCTPOLE_VOLTAGE", {"V"}), text("PROBE_TIP"), text("RESOLUTION_SETTING"),
                  text("SAMPLE_DRIPPING"), text("SCAN_RANGE_MOVERZ"), text("SCANNING"), text("SCANNING_CYCLE"),
                  text("SCANNING_RANGE"), units("SKIMMER_VOLTAGE", {"V"}), text("TUBE_LENS_VOLTAGE"),
                  text("MS_COMMENTS"), composite("MS_RESULTS_FILE")},
                 {"INSTRUMENT_NAME", "INSTRUMENT_TYPE", "MS_TYPE", "ION_MODE"});
}

SectionSchema nmr_section_schema() {
    return items("NM",
                 {text("INSTRUMENT_NAME"), text("INSTRUMENT_TYPE"), text("NMR_EXPERIMENT_TYPE"), text("NMR_COMMENTS"),
                  text("FIELD_FREQUENCY_LOCK"), units("STANDARD_CONCENTRATION", {"mM"}),
                  units("SPECTROMETER_FREQUENCY", {"MHz"}), text("NMR_PROBE"), text("NMR_SOLVENT"),
                  text("NMR_TUBE_SIZE"), text("SHIMMING_METHOD"), text("PULSE_SEQUENCE"), text("WATER_SUPPRESSION"),
                  text("PULSE_WIDTH"), units("POWER_LEVEL", {"W", "dB"}),
                  unitless("RECEIVER_GAIN", R"(^((\d+)|(\d*\.\d+))$)"), units("OFFSET_FREQUENCY", {"ppm", "Hz"}),
                  units("PRESATURATION_POWER_LEVEL", {"W", "dB"}), text("CHEMICAL_SHIFT_REF_CPD"),
                  units("TEMPERATURE", {"°C", "C", "K"}), unitless("NUMBER_OF_SCANS", R"(^\d+$)"),
                  text("DUMMY_SCANS"), units("ACQUISITION_TIME", {"s"}),
                  units("RELAXATION_DELAY", {"s", "ms", "us", "μs"}), units("SPECTRAL_WIDTH", {"ppm", "Hz"}),
                  unitless("NUM_DATA_POINTS_ACQUIRED", R"(^\d+$)"), text("REAL_DATA_POINTS"),
                  units("LINE_BROADENING", {"Hz"}), text("ZERO_FILLING"), text("APODIZATION"),
                  text("BASELINE_CORRECTION_METHOD"), text("CHEMICAL_SHIFT_REF_STD"),
                  units("BINNED_INCREMENT", {"ppm"}), text("BINNED_DATA_NORMALIZATION_METHOD"),
                  text("BINNED_DATA_PROTOCOL_FILE"), text("BINNED_DATA_CHEMICAL_SHIFT_RANGE"),
                  text("BINNED_DATA_EXCLUDED_RANGE"), composite("NMR_RESULTS_FILE")},
                 {"INSTRUMENT_NAME", "INSTRUMENT_TYPE", "NMR_EXPERIMENT_TYPE", "SPECTROMETER_FREQUENCY"});
}

SectionSchema data_schema(std::string name, bool annotation_tables) {
    SectionSchema section = items(std::move(name), {text("Units")}, {"Units", "Data"});
    section.kind = SectionKind::DATA;
    section.annotation_tables = annotation_tables;
    return section;
}

SchemaTable base_table() {
    SchemaTable table;
    table.sections = {header_schema(), project_schema(), study_schema(), subject_schema(), factors_schema(),
                      collection_schema(), treatment_schema(), sampleprep_schema(), analysis_schema()};
    table.required_sections = {std::string(HEADER_SECTION), "PROJECT", "STUDY", "SUBJECT", std::string(SSF_SECTION),
                               "COLLECTION", "TREATMENT", "SAMPLEPREP", "ANALYSIS"};
    table.results_file = results_file_schema();
    return table;
}
} // namespace

const SchemaTable& ms_schema() {
    static const SchemaTable table = [] {
        SchemaTable t = base_table();
        t.analysis_section = "MS";
        t.sections.push_back(ms_section_schema());
        t.sections.push_back(data_schema("MS_METABOLITE_DATA", true));
        t.sections.push_back(chromatography_schema());
        t.required_sections.push_back("MS");
        t.result_sections = {"MS_METABOLITE_DATA"};
        t.results_key = "MS_RESULTS_FILE";
        t.missing_results_message = R"(Error: There must be either a "MS_METABOLITE_DATA" section or a "MS_RESULTS_FILE" subsection in the "MS" section. Neither were found.)";
        return t;
    }();
    return table;
}

const SchemaTable& nmr_schema() {
    static const SchemaTable table = [] {
        SchemaTable t = base_table();
        t.analysis_section = "NM";
        t.sections.push_back(nmr_section_schema());
        t.sections.push_back(data_schema("NMR_METABOLITE_DATA", true));
        t.sections.push_back(data_schema("NMR_BINNED_DATA", false));
        t.required_sections.push_back("NM");
        t.result_sections = {"NMR_METABOLITE_DATA", "NMR_BINNED_DATA"};
        t.results_key = "NMR_RESULTS_FILE";
        t.missing_results_message = R"(Error: There must be either a "NMR_METABOLITE_DATA" section, a "NMR_BINNED_DATA" section or a "NMR_RESULTS_FILE" subsection in the "NM" section. Neither were found.)";
        return t;
    }();
    return table;
}

// ----------------------------------------------------------------------------
// Checking
// ----------------------------------------------------------------------------

namespace {
class SchemaChecker
{
public:
    SchemaChecker(const Document& d, const SchemaTable& s, Report& r)
        : doc(d), schema(s), report(r), text_form(d.input_format == Format::MWTAB) {}

    void run();

private:
    const Document& doc;
    const SchemaTable& schema;
    Report& report;
    bool text_form;

    void checkSection(const std::string& name, const Section& section, const SectionSchema& rules);
    void checkItems(const std::string& name, const ItemSection& section, const SectionSchema& rules);
    void checkField(const FieldRule& rule, const std::string& value, const std::string& location, bool required,
                    const std::string& section, const std::string& sub_section);
    void checkResultsFile(const std::string& name, const ResultsFile& file);
    void checkFactors(const ListSection& section, const SectionSchema& rules);
    void checkData(const std::string& name, const DataSection& section, const SectionSchema& rules);
    void checkTopLevel();

    void valueError(const std::string& value, const std::string& location, const std::string& message,
                    const std::string& check, const std::string& section, const std::string& sub_section,
                    Severity severity = Severity::ERROR);
    void missingRequired(const std::string& key, const std::string& location, const std::string& section);
    void unknownKeys(const std::vector<std::string>& keys, const std::string& location, const std::string& section);

    std::string itemLocation(const std::string& section, const std::string& key) const;
    std::string sectionLocation(const std::string& section) const;
    std::string entryLocation(size_t index) const;
    std::string entryKeyLocation(size_t index, const std::string& key) const;
    std::string entryNestedLocation(size_t index, const std::string& group, const std::string& key) const;
};

void SchemaChecker::run() {
    for (const auto& rules : schema.sections) {
        if (const auto* section = doc.find(rules.name)) checkSection(rules.name, *section, rules);
    }
    checkTopLevel();
}

void SchemaChecker::checkSection(const std::string& name, const Section& section, const SectionSchema& rules) {
    switch (rules.kind) {
    case SectionKind::ITEMS:
        if (const auto* item = std::get_if<ItemSection>(&section)) return checkItems(name, *item, rules);
        break;
    case SectionKind::FACTORS:
        if (const auto* list = std::get_if<ListSection>(&section)) return checkFactors(*list, rules);
        break;
    case SectionKind::DATA:
        if (const auto* data = std::get_if<DataSection>(&section)) return checkData(name, *data, rules);
        break;
    }
    std::string type = rules.kind == SectionKind::FACTORS ? "array" : "object";
    report.add(Severity::ERROR, 24, "Schema Error: type", {Tag::FORMAT}, name, "",
               "The value " + sectionLocation(name) + " is not of type \"" + type + "\".");
}

void SchemaChecker::checkItems(const std::string& name, const ItemSection& section, const SectionSchema& rules) {
    for (const auto& rule : rules.fields) {
        if (rule.composite && section.results_file && section.results_file->key == rule.key) {
            checkResultsFile(name, *section.results_file);
            continue;
        }
        for (const auto& value : section.items.all(rule.key)) {
            checkField(rule, value, itemLocation(name, rule.key), rules.is_required(rule.key), name, rule.key);
        }
    }

    for (const auto& key : rules.required) {
        if (!section.items.contains(key)) missingRequired(key, sectionLocation(name), name);
    }

    std::vector<std::string> unknown;
    for (const auto& key : section.items.keys()) {
        if (!rules.field(key)) unknown.push_back(key);
    }
    unknownKeys(unknown, sectionLocation(name), name);
}

void SchemaChecker::checkField(const FieldRule& rule, const std::string& value, const std::string& location,
                               bool required, const std::string& section, const std::string& sub_section) {
    if (rule.pattern && !re2::RE2::PartialMatch(value, *rule.pattern)) {
        valueError(value, location, rule.pattern_message, "pattern", section, sub_section);
    }
    if (rule.rejected && !is_na_value(value) && re2::RE2::PartialMatch(value, *rule.rejected)) {
        valueError(value, location, rule.rejected_message, "pattern", section, sub_section);
    }
    if (!rule.allowed.empty() && std::find(rule.allowed.begin(), rule.allowed.end(), value) == rule.allowed.end()) {
        valueError(value, location, " is not one of " + bracket_list(rule.allowed) + ".", "enum", section,
                   sub_section);
    }
    if (rule.email && value.find('@') == std::string::npos) {
        valueError(value, location, " is not a valid email.", "format", section, sub_section);
    }
    if (rule.reject_na && is_na_value(value)) {
        std::string noun = text_form ? "subsection" : "key";
        std::string body = "An empty value or a null value was detected " + location + ".";
        if (required) {
            body += " A legitimate value should be provided for this required " + noun + ".";
        } else {
            body += " Either a legitimate value should be provided for this " + noun
                  + ", or it should be removed altogether.";
        }
        report.add(Severity::ERROR, 24, "Schema Error: not", {Tag::VALUE}, section, sub_section, body);
    }
}

void SchemaChecker::checkResultsFile(const std::string& name, const ResultsFile& file) {
    const auto& rules = schema.results_file;
    auto fields = file.fields();
    for (const auto& rule : rules.fields) {
        for (const auto& [attribute, value] : fields) {
            if (attribute != rule.key) continue;
            std::string location = text_form
                ? "for the subsection, \"" + file.key + "\", in the \"" + name + "\" section, for the \"" + attribute
                      + "\" attribute"
                : "in [\"" + name + "\"][\"" + file.key + "\"][\"" + attribute + "\"]";
            checkField(rule, value, location, rules.is_required(attribute), name, file.key);
        }
    }
    for (const auto& key : rules.required) {
        bool present = std::any_of(fields.begin(), fields.end(), [&](const auto& field) { return field.first == key; });
        if (!present) missingRequired(key, itemLocation(name, file.key), name);
    }
}

void SchemaChecker::checkFactors(const ListSection& section, const SectionSchema& rules) {
    const std::string name(SSF_SECTION);
    for (size_t i = 0; i < section.rows.size(); ++i) {
        const auto& row = section.rows[i];

        std::vector<std::pair<std::string, const std::optional<std::string>*>> fields = {
            {"Subject ID", &row.subject_id}, {"Sample ID", &row.sample_id}};
        for (const auto& [key, value] : fields) {
            const auto* rule = rules.field(key);
            if (rule && value->has_value()) {
                checkField(*rule, **value, entryKeyLocation(i, key), rules.is_required(key), name, "");
            }
        }

        for (const auto& entry : row.factors) {
            if (entry.value.empty()) {
                valueError(entry.value, entryNestedLocation(i, "Factors", entry.key), " is missing a value.",
                           "minLength", name, "", Severity::WARNING);
            }
        }

        if (row.additional_data) {
            for (const auto& entry : *row.additional_data) {
                std::string location = entryNestedLocation(i, "Additional sample data", entry.key);
                auto rule = std::find_if(rules.additional_fields.begin(), rules.additional_fields.end(),
                                         [&](const FieldRule& r) { return r.key == entry.key; });
                if (rule != rules.additional_fields.end()) {
                    checkField(*rule, entry.value, location, false, name, "");
                } else if (entry.value.empty()) {
                    valueError(entry.value, location, " is missing a value.", "minLength", name, "",
                               Severity::WARNING);
                }
            }
        }

        if (!row.subject_id) missingRequired("Subject ID", entryLocation(i), name);
        if (!row.sample_id) missingRequired("Sample ID", entryLocation(i), name);
        if (!row.has_factors) missingRequired("Factors", entryLocation(i), name);

        unknownKeys(row.other.keys(), entryLocation(i), name);
    }
}

void SchemaChecker::checkData(const std::string& name, const DataSection& section, const SectionSchema& rules) {
    const auto* units_rule = rules.field("Units");
    if (section.units && units_rule) {
        checkField(*units_rule, *section.units, itemLocation(name, "Units"), true, name, "Units");
    }

    if (!section.units) missingRequired("Units", sectionLocation(name), name);
    if (!section.data) missingRequired("Data", sectionLocation(name), name);

    std::vector<std::string> unknown;
    if (!rules.annotation_tables) {
        if (section.metabolites) unknown.push_back("Metabolites");
        if (section.extended) unknown.push_back("Extended");
    }
    if (section.results_file) unknown.push_back(section.results_file->key);
    for (const auto& key : section.items.keys()) unknown.push_back(key);
    unknownKeys(unknown, sectionLocation(name), name);
}

void SchemaChecker::checkTopLevel() {
    for (const auto& name : schema.required_sections) {
        if (!doc.contains(name)) missingRequired(name, "", "");
    }

    std::vector<std::string> unknown;
    for (const auto& name : doc.section_names()) {
        if (!schema.find(name)) unknown.push_back(name);
    }
    unknownKeys(unknown, "", "");

    bool has_results_section = std::any_of(schema.result_sections.begin(), schema.result_sections.end(),
                                           [&](const std::string& name) { return doc.contains(name); });
    const auto* analysis = doc.get<ItemSection>(schema.analysis_section);
    if (!has_results_section && analysis && !analysis->items.contains(schema.results_key)) {
        report.findings.push_back({Severity::ERROR, schema.missing_results_message, {Tag::FORMAT},
                                   schema.analysis_section, schema.results_key, 24, "Schema Error: required"});
    }
}

void SchemaChecker::valueError(const std::string& value, const std::string& location, const std::string& message,
                               const std::string& check, const std::string& section, const std::string& sub_section,
                               Severity severity) {
    std::string body = utf8_length(value) < 50 ? "The value, \"" + value + "\", " + location + message
                                                : "The value " + location + message;
    report.add(severity, 24, "Schema Error: " + check, {Tag::VALUE}, section, sub_section, body);
}

void SchemaChecker::missingRequired(const std::string& key, const std::string& location, const std::string& section) {
    std::string where = location.empty() ? "" : location + " ";
    report.add(Severity::ERROR, 24, "Schema Error: required", {Tag::FORMAT}, section, key,
               "The required property, \"" + key + "\", " + where + "is missing.");
}

void SchemaChecker::unknownKeys(const std::vector<std::string>& keys, const std::string& location,
                                const std::string& section) {
    if (keys.empty()) return;
    std::string noun = location.empty() ? "section" : "subsection";
    if (keys.size() > 1) noun += "s";
    std::string body = "Unknown or invalid " + noun + ", " + join_quoted(keys, ", ");
    body += location.empty() ? "." : ", " + location + ".";
    report.add(Severity::ERROR, 24, "Schema Error: additionalProperties", {Tag::FORMAT}, section, "", body);
}

std::string SchemaChecker::itemLocation(const std::string& section, const std::string& key) const {
    if (!text_form) return "in [\"" + section + "\"][\"" + key + "\"]";
    if (section == HEADER_SECTION) return "for \"" + key + "\" in the file header";
    return "for the subsection, \"" + key + "\", in the \"" + section + "\" section";
}

std::string SchemaChecker::sectionLocation(const std::string& section) const {
    return text_form ? "in the \"" + section + "\" section" : "in [\"" + section + "\"]";
}

std::string SchemaChecker::entryLocation(size_t index) const {
    if (!text_form) return "in [\"" + std::string(SSF_SECTION) + "\"][" + std::to_string(index) + "]";
    return "in entry " + std::to_string(index + 1) + " of the \"" + std::string(SSF_SECTION) + "\" section";
}

std::string SchemaChecker::entryKeyLocation(size_t index, const std::string& key) const {
    if (!text_form) return "in [\"" + std::string(SSF_SECTION) + "\"][" + std::to_string(index) + "][\"" + key + "\"]";
    return "for the \"" + key + "\" " + entryLocation(index);
}

std::string SchemaChecker::entryNestedLocation(size_t index, const std::string& group, const std::string& key) const {
    if (!text_form) {
        return "in [\"" + std::string(SSF_SECTION) + "\"][" + std::to_string(index) + "][\"" + group + "\"][\"" + key
             + "\"]";
    }
    return "for the \"" + key + "\" in \"" + group + "\" " + entryLocation(index);
}
} // namespace

void check_schema(const Document& doc, const SchemaTable& schema, Report& report) {
    SchemaChecker(doc, schema, report).run();
}

} // namespace mwtab
