#pragma once
#include <gtest/gtest.h>
#include "../src/document.hpp"
#include "../src/parser.hpp"
#include "../src/report.hpp"
#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

// ============================================================================
// FIXTURES
// ============================================================================

/**
 * @brief Joins lines with '\n', adding a trailing newline
 */
inline std::string textLines(std::initializer_list<std::string> lines) {
    std::string text;
    for (const auto& line : lines) text += line + "\n";
    return text;
}

inline std::string metadataLines() {
    return textLines({
        "PR:PROJECT_TITLE\tGlucose turnover in mouse liver",
        "PR:PROJECT_SUMMARY\tTargeted profiling of liver extracts.",
        "PR:INSTITUTE\tUniversity of Kentucky",
        "PR:LAST_NAME\tSmith",
        "PR:FIRST_NAME\tJane",
        "PR:ADDRESS\t1 Main Street, Lexington, KY",
        "PR:EMAIL\tjane.smith@example.edu",
        "PR:PHONE\t555-0100",
        "#STUDY",
        "ST:STUDY_TITLE\tGlucose turnover",
        "ST:STUDY_SUMMARY\tTwo groups of mice, control and drug.",
        "ST:INSTITUTE\tUniversity of Kentucky",
        "ST:LAST_NAME\tSmith",
        "ST:FIRST_NAME\tJane",
        "ST:ADDRESS\t1 Main Street, Lexington, KY",
        "ST:EMAIL\tjane.smith@example.edu",
        "ST:PHONE\t555-0100",
        "#SUBJECT",
        "SU:SUBJECT_TYPE\tMammal",
        "SU:SUBJECT_SPECIES\tMus musculus",
        "SU:TAXONOMY_ID\t10090",
        "#SUBJECT_SAMPLE_FACTORS:         \tSUBJECT(optional)[tab]SAMPLE[tab]FACTORS(NAME:VALUE pairs separated by |)[tab]Additional sample data",
        "SUBJECT_SAMPLE_FACTORS           \tSU001\tS001\tTreatment:Control\tRAW_FILE_NAME=S001.raw",
        "SUBJECT_SAMPLE_FACTORS           \tSU002\tS002\tTreatment:Drug\tRAW_FILE_NAME=S002.raw",
        "#COLLECTION",
        "CO:COLLECTION_SUMMARY\tLiver was collected at sacrifice.",
        "#TREATMENT",
        "TR:TREATMENT_SUMMARY\tDrug given orally for two weeks.",
        "#SAMPLEPREP",
        "SP:SAMPLEPREP_SUMMARY\tMethanol extraction.",
    });
}

/**
 * @brief A mass spectrometry document that validates without findings
 */
inline std::string msDocumentText() {
    return textLines({
               "#METABOLOMICS WORKBENCH STUDY_ID:ST000001 ANALYSIS_ID:AN000001 PROJECT_ID:PR000001",
               "VERSION\t1",
               "CREATED_ON\t2016-09-17",
               "#PROJECT",
           })
         + metadataLines()
         + textLines({
               "#CHROMATOGRAPHY",
               "CH:CHROMATOGRAPHY_TYPE\tReversed phase",
               "CH:INSTRUMENT_NAME\tWaters Acquity",
               "CH:COLUMN_NAME\tWaters Acquity HSS T3",
               "CH:FLOW_GRADIENT\t0-100% B over 10 min",
               "CH:FLOW_RATE\t0.3 mL/min",
               "CH:COLUMN_TEMPERATURE\t40 °C",
               "CH:SOLVENT_A\tWater; 0.1% formic acid",
               "CH:SOLVENT_B\tAcetonitrile; 0.1% formic acid",
               "#ANALYSIS",
               "AN:ANALYSIS_TYPE\tMS",
               "#MS",
               "MS:INSTRUMENT_NAME\tThermo Q Exactive",
               "MS:INSTRUMENT_TYPE\tOrbitrap",
               "MS:MS_TYPE\tESI",
               "MS:ION_MODE\tPOSITIVE",
               "#MS_METABOLITE_DATA",
               "MS_METABOLITE_DATA:UNITS\tPeak area",
               "MS_METABOLITE_DATA_START",
               "Samples\tS001\tS002",
               "Factors\tTreatment:Control\tTreatment:Drug",
               "glucose\t1000\t2000",
               "lactate\t1500\t1200",
               "MS_METABOLITE_DATA_END",
               "#METABOLITES",
               "METABOLITES_START",
               "metabolite_name\tpubchem_id\tkegg_id",
               "glucose\t5793\tC00031",
               "lactate\t612\tC00186",
               "METABOLITES_END",
               "#END",
           });
}

/**
 * @brief An NMR document with binned data that validates without findings
 */
inline std::string nmrDocumentText() {
    return textLines({
               "#METABOLOMICS WORKBENCH STUDY_ID:ST000002 ANALYSIS_ID:AN000002 PROJECT_ID:PR000002",
               "VERSION\t1",
               "CREATED_ON\t2017-03-02",
               "#PROJECT",
           })
         + metadataLines()
         + textLines({
               "#ANALYSIS",
               "AN:ANALYSIS_TYPE\tNMR",
               "#NMR",
               "NM:INSTRUMENT_NAME\tBruker Avance III",
               "NM:INSTRUMENT_TYPE\tFT-NMR",
               "NM:NMR_EXPERIMENT_TYPE\t1D-1H",
               "NM:SPECTROMETER_FREQUENCY\t600 MHz",
               "#NMR_BINNED_DATA",
               "NMR_BINNED_DATA:UNITS\tppm",
               "NMR_BINNED_DATA_START",
               "Bin range(ppm)\tS001\tS002",
               "0.50...0.54\t1.25\t2.5",
               "0.54...0.58\t3.75\t4.5",
               "NMR_BINNED_DATA_END",
               "#END",
           });
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Replaces the single occurrence of from, failing the test if it is absent
 */
inline std::string replaceOnce(std::string text, const std::string& from, const std::string& to) {
    size_t pos = text.find(from);
    EXPECT_NE(pos, std::string::npos) << "fixture text does not contain: " << from;
    if (pos != std::string::npos) text.replace(pos, from.size(), to);
    return text;
}

inline mwtab::Document buildText(const std::string& text, const std::string& source = "fixture.txt") {
    return mwtab::build(source, text);
}

inline std::vector<mwtab::Finding> findingsWithId(const mwtab::Report& report, int id) {
    std::vector<mwtab::Finding> found;
    std::copy_if(report.findings.begin(), report.findings.end(), std::back_inserter(found),
                 [&](const mwtab::Finding& f) { return f.id == id; });
    return found;
}

inline bool containsMessage(const mwtab::Report& report, const std::string& text) {
    return std::any_of(report.findings.begin(), report.findings.end(),
                       [&](const mwtab::Finding& f) { return f.message.find(text) != std::string::npos; });
}

/**
 * @brief All messages, one per line, for failure output
 */
inline std::string describe(const mwtab::Report& report) {
    std::string text;
    for (const auto& finding : report.findings) text += finding.message + "\n";
    return text;
}
