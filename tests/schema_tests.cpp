#include <gtest/gtest.h>
#include "../src/schema.hpp"
#include "../src/structured.hpp"
#include "test_helpers.hpp"
#include <re2/re2.h>
#include <string>
#include <vector>

using namespace mwtab;

namespace {

Report schemaReport(const Document& doc, const SchemaTable& schema = ms_schema()) {
    Report report;
    check_schema(doc, schema, report);
    return report;
}

bool unitsMatch(const std::string& value, const std::vector<std::string>& units, bool can_be_range) {
    re2::RE2 pattern(units_pattern(units, can_be_range));
    return re2::RE2::PartialMatch(value, pattern);
}

} // namespace

TEST(SchemaTests, RecognizesMissingValueSpellings) {
    for (const char* value : {"", "-", "NA", "n/a", "N/A", "#N/A", "null", "None", "Unspecified"}) {
        EXPECT_TRUE(is_na_value(value)) << value;
    }
    EXPECT_FALSE(is_na_value("0"));
    EXPECT_FALSE(is_na_value("Not applicable"));

    EXPECT_FALSE(is_metabolite_na_value("NA"));
    EXPECT_TRUE(is_metabolite_na_value("n/a"));
}

TEST(SchemaTests, UnitsPatternRequiresNumberSpaceUnit) {
    EXPECT_TRUE(unitsMatch("5 V", {"V", "kV"}, false));
    EXPECT_TRUE(unitsMatch("-0.5 kV", {"V", "kV"}, false));
    EXPECT_FALSE(unitsMatch("5V", {"V", "kV"}, false));
    EXPECT_FALSE(unitsMatch("5 mV", {"V", "kV"}, false));
    EXPECT_FALSE(unitsMatch("5-6 V", {"V", "kV"}, false));

    EXPECT_TRUE(unitsMatch("5-6 weeks", {"weeks", "days"}, true));
    EXPECT_TRUE(unitsMatch("5 to 6 days", {"weeks", "days"}, true));
    EXPECT_TRUE(unitsMatch("8 weeks", {"weeks", "days"}, true));
}

TEST(SchemaTests, UnitsMessageListsUnits) {
    EXPECT_EQ(units_message({"V", "kV"}, false),
              R"( should be a number followed by a space with a unit (ex. "5 V") from the following list: ['V', 'kV'].)"
              " Ignore this when more complicated descriptions are required.");
}

TEST(SchemaTests, TablesDescribeAnalysisKinds) {
    EXPECT_EQ(ms_schema().analysis_section, "MS");
    EXPECT_EQ(nmr_schema().analysis_section, "NM");
    ASSERT_NE(ms_schema().find("CHROMATOGRAPHY"), nullptr);
    EXPECT_EQ(nmr_schema().find("CHROMATOGRAPHY"), nullptr);
    ASSERT_NE(nmr_schema().find("NMR_BINNED_DATA"), nullptr);
    EXPECT_FALSE(nmr_schema().find("NMR_BINNED_DATA")->annotation_tables);
    EXPECT_TRUE(ms_schema().find("PROJECT")->is_required("EMAIL"));
    EXPECT_NE(ms_schema().find("MS")->field("MS_RESULTS_FILE"), nullptr);
}

TEST(SchemaTests, PassingDocumentsHaveNoSchemaFindings) {
    EXPECT_TRUE(schemaReport(buildText(msDocumentText())).passing());
    EXPECT_TRUE(schemaReport(buildText(nmrDocumentText()), nmr_schema()).passing());
}

TEST(SchemaTests, ReportsMissingRequiredItem) {
    auto doc = buildText(replaceOnce(msDocumentText(), "PR:EMAIL\tjane.smith@example.edu\n", ""));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    const auto& finding = report.findings[0];
    EXPECT_EQ(finding.message, R"(Error: The required property, "EMAIL", in the "PROJECT" section is missing.)");
    EXPECT_EQ(finding.severity, Severity::ERROR);
    EXPECT_EQ(finding.id, 24);
    EXPECT_EQ(finding.name, "Schema Error: required");
    EXPECT_EQ(finding.section, "PROJECT");
    EXPECT_EQ(finding.tags, (std::vector<Tag>{Tag::FORMAT}));
}

TEST(SchemaTests, ReportsMissingRequiredSection) {
    auto doc = buildText(msDocumentText());
    doc.erase("TREATMENT");
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message, R"(Error: The required property, "TREATMENT", is missing.)");
}

TEST(SchemaTests, ReportsInvalidEmail) {
    auto doc = buildText(replaceOnce(msDocumentText(), "PR:EMAIL\tjane.smith@example.edu", "PR:EMAIL\tjane.smith"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message,
              R"(Error: The value, "jane.smith", for the subsection, "EMAIL", in the "PROJECT" section is not a valid email.)");
    EXPECT_EQ(report.findings[0].tags, (std::vector<Tag>{Tag::VALUE}));
}

TEST(SchemaTests, ReportsNullRequiredValue) {
    auto doc = buildText(replaceOnce(msDocumentText(), "PR:PROJECT_TITLE\tGlucose turnover in mouse liver",
                                     "PR:PROJECT_TITLE\tN/A"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message,
              R"(Error: An empty value or a null value was detected for the subsection, "PROJECT_TITLE", in the "PROJECT" section. A legitimate value should be provided for this required subsection.)");
}

TEST(SchemaTests, ReportsNullOptionalValue) {
    auto doc = buildText(replaceOnce(msDocumentText(), "SU:TAXONOMY_ID\t10090", "SU:GENOTYPE_STRAIN\tnull"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_TRUE(containsMessage(report, "Either a legitimate value should be provided for this subsection, or it "
                                        "should be removed altogether."));
}

TEST(SchemaTests, ReportsUnitsPatternMismatch) {
    auto doc = buildText(replaceOnce(msDocumentText(), "CH:FLOW_RATE\t0.3 mL/min", "CH:FLOW_RATE\tfast"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].name, "Schema Error: pattern");
    EXPECT_TRUE(report.findings[0].message.starts_with(
        R"(Error: The value, "fast", for the subsection, "FLOW_RATE", in the "CHROMATOGRAPHY" section should be a number or range)"));
}

TEST(SchemaTests, RejectsPolarityInIonization) {
    auto doc = buildText(replaceOnce(msDocumentText(), "MS:ION_MODE\tPOSITIVE", "MS:ION_MODE\tPOSITIVE\nMS:IONIZATION\tPositive"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_TRUE(containsMessage(report, R"("ION_MODE" is where that should be indicated.)"));
}

TEST(SchemaTests, ReportsEnumerationMismatch) {
    auto doc = buildText(replaceOnce(msDocumentText(), "AN:ANALYSIS_TYPE\tMS", "AN:ANALYSIS_TYPE\tGC-MS"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message,
              R"(Error: The value, "GC-MS", for the subsection, "ANALYSIS_TYPE", in the "ANALYSIS" section is not one of ['MS', 'NMR'].)");
}

TEST(SchemaTests, ReportsHeaderIdFormat) {
    auto doc = buildText(replaceOnce(msDocumentText(), "STUDY_ID:ST000001", "STUDY_ID:ST1"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message,
              R"(Error: The value, "ST1", for "STUDY_ID" in the file header must be the letters "ST" followed by 6 numbers. Ex. "ST001405".)");
}

TEST(SchemaTests, ReportsUnknownKeysAndSections) {
    auto text = replaceOnce(msDocumentText(), "#COLLECTION\n", "#COLLECTION\nCO:COLOR\tblue\nCO:SHAPE\tround\n");
    auto doc = buildText(text + "#EXTRAS\nEX:ANYTHING\tvalue\n");
    auto report = schemaReport(doc);

    EXPECT_TRUE(containsMessage(report,
                                R"(Error: Unknown or invalid subsections, "COLOR", "SHAPE", in the "COLLECTION" section.)"))
        << describe(report);
    EXPECT_TRUE(containsMessage(report, R"(Error: Unknown or invalid section, "EXTRAS".)")) << describe(report);
}

TEST(SchemaTests, ReportsEmptyFactorValueAsWarning) {
    auto doc = buildText(replaceOnce(msDocumentText(), "\tTreatment:Drug\t", "\tTreatment:\t"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].severity, Severity::WARNING);
    EXPECT_EQ(report.findings[0].message,
              R"(Warning: The value, "", for the "Treatment" in "Factors" in entry 2 of the "SUBJECT_SAMPLE_FACTORS" section is missing a value.)");
}

TEST(SchemaTests, ReportsMissingResultsLocation) {
    auto doc = buildText(msDocumentText());
    doc.erase("MS_METABOLITE_DATA");
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message, ms_schema().missing_results_message);
}

TEST(SchemaTests, ResultsFileSatisfiesResultsLocation) {
    auto doc = buildText(msDocumentText());
    doc.erase("MS_METABOLITE_DATA");
    doc.get<ItemSection>("MS")->set_results_file(ResultsFile::parse("MS_RESULTS_FILE", "results.txt UNITS:Peak area"));

    EXPECT_TRUE(schemaReport(doc).passing()) << describe(schemaReport(doc));
}

TEST(SchemaTests, ChecksResultsFileAttributes) {
    auto doc = buildText(msDocumentText());
    doc.get<ItemSection>("MS")->set_results_file(ResultsFile::parse("MS_RESULTS_FILE", "results.txt"));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message,
              R"(Error: The required property, "UNITS", for the subsection, "MS_RESULTS_FILE", in the "MS" section is missing.)");
}

TEST(SchemaTests, StructuredDocumentsUsePathLocations) {
    auto text = replaceOnce(msDocumentText(), "PR:EMAIL\tjane.smith@example.edu", "PR:EMAIL\tjane.smith");
    auto doc = from_structured("fixture.json", to_structured(buildText(text)));
    auto report = schemaReport(doc);

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message, R"(Error: The value, "jane.smith", in ["PROJECT"]["EMAIL"] is not a valid email.)");
}

TEST(SchemaTests, ReportsMissingFactorsMember) {
    auto root = to_structured(buildText(msDocumentText()));
    root["SUBJECT_SAMPLE_FACTORS"][1].removeMember("Factors");
    auto report = schemaReport(from_structured("fixture.json", root));

    ASSERT_EQ(report.size(), 1u) << describe(report);
    EXPECT_EQ(report.findings[0].message,
              R"(Error: The required property, "Factors", in ["SUBJECT_SAMPLE_FACTORS"][1] is missing.)");
}

TEST(SchemaTests, DataSectionWithoutUnitsRule) {
    SchemaTable schema = ms_schema();
    for (auto& section : schema.sections) {
        if (section.name == "MS_METABOLITE_DATA") section.fields.clear();
    }
    Report report;

    EXPECT_NO_THROW(check_schema(buildText(msDocumentText()), schema, report));
    EXPECT_TRUE(report.passing()) << describe(report);
}

TEST(SchemaTests, ReportsWrongSectionShape) {
    auto doc = buildText(msDocumentText());
    doc.set("PROJECT", ListSection{});
    auto report = schemaReport(doc);

    EXPECT_TRUE(containsMessage(report, R"(Error: The value in the "PROJECT" section is not of type "object".)"))
        << describe(report);
}
