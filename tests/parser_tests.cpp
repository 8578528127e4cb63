#include <gtest/gtest.h>
#include "../src/parser.hpp"
#include "test_helpers.hpp"
#include <string>
#include <vector>

using namespace mwtab;

namespace {

const std::string HEADER = "#METABOLOMICS WORKBENCH STUDY_ID:ST000001 ANALYSIS_ID:AN000001\nVERSION\t1\n";

const DataSection& expect_data_section(const Document& doc, const std::string& name) {
    const auto* data = doc.get<DataSection>(name);
    EXPECT_NE(data, nullptr) << "Expected data section " << name;
    static const DataSection empty;
    return data ? *data : empty;
}

} // namespace

TEST(ParserTests, BuildsSectionsInFileOrder) {
    auto doc = buildText(msDocumentText());

    EXPECT_EQ(doc.source, "fixture.txt");
    EXPECT_EQ(doc.input_format, Format::MWTAB);
    EXPECT_EQ(doc.section_names(), (std::vector<std::string>{
        "METABOLOMICS WORKBENCH", "PROJECT", "STUDY", "SUBJECT", "SUBJECT_SAMPLE_FACTORS", "COLLECTION",
        "TREATMENT", "SAMPLEPREP", "CHROMATOGRAPHY", "ANALYSIS", "MS", "MS_METABOLITE_DATA"}));
    EXPECT_EQ(doc.study_id(), "ST000001");
    EXPECT_EQ(doc.analysis_id(), "AN000001");
}

TEST(ParserTests, HeaderCarriesSentinelPairsAndItems) {
    auto doc = buildText(msDocumentText());
    const auto* header = doc.header();

    ASSERT_NE(header, nullptr);
    EXPECT_EQ(header->items.keys(),
              (std::vector<std::string>{"STUDY_ID", "ANALYSIS_ID", "PROJECT_ID", "VERSION", "CREATED_ON"}));
    EXPECT_EQ(header->items.get("CREATED_ON"), "2016-09-17");
}

TEST(ParserTests, ItemSectionsDropKeyPrefixes) {
    auto doc = buildText(msDocumentText());
    const auto* project = doc.get<ItemSection>("PROJECT");

    ASSERT_NE(project, nullptr);
    EXPECT_EQ(project->items.get("PROJECT_TITLE"), "Glucose turnover in mouse liver");
    EXPECT_FALSE(project->results_file.has_value());
}

TEST(ParserTests, BuildsSubjectSampleFactorRows) {
    auto doc = buildText(msDocumentText());
    const auto* ssf = doc.get<ListSection>(SSF_SECTION);

    ASSERT_NE(ssf, nullptr);
    ASSERT_EQ(ssf->rows.size(), 2u);
    const auto& row = ssf->rows[1];
    EXPECT_EQ(row.subject_id, "SU002");
    EXPECT_EQ(row.sample_id, "S002");
    EXPECT_EQ(row.factors, (Multimap{{"Treatment", "Drug"}}));
    ASSERT_TRUE(row.additional_data.has_value());
    EXPECT_EQ(row.additional_data->get("RAW_FILE_NAME"), "S002.raw");
}

TEST(ParserTests, MergesMetabolitesIntoDataSection) {
    auto doc = buildText(msDocumentText());
    const auto& data = expect_data_section(doc, "MS_METABOLITE_DATA");

    EXPECT_FALSE(doc.contains("METABOLITES"));
    EXPECT_FALSE(doc.contains("END"));
    EXPECT_EQ(data.units, "Peak area");

    ASSERT_TRUE(data.data.has_value());
    EXPECT_EQ(data.data->header, (std::vector<std::string>{"Samples", "S001", "S002"}));
    EXPECT_EQ(data.data->labels(), (std::vector<std::string>{"glucose", "lactate"}));
    EXPECT_EQ(data.data->columns(), (std::vector<std::string>{"S001", "S002"}));
    EXPECT_EQ(data.data->rows[0], (Row{{"Metabolite", "glucose"}, {"S001", "1000"}, {"S002", "2000"}}));

    ASSERT_TRUE(data.metabolites.has_value());
    EXPECT_EQ(data.metabolites->rows[1], (Row{{"Metabolite", "lactate"}, {"pubchem_id", "612"}, {"kegg_id", "C00186"}}));
    EXPECT_FALSE(data.extended.has_value());
}

TEST(ParserTests, CapturesFactorsLineOfDataBlock) {
    auto doc = buildText(msDocumentText());

    ASSERT_TRUE(doc.data_factors.has_value());
    EXPECT_EQ(*doc.data_factors, (Multimap{{"S001", "Treatment:Control"}, {"S002", "Treatment:Drug"}}));
}

TEST(ParserTests, NormalizesMultiFactorCells) {
    auto text = replaceOnce(msDocumentText(), "Factors\tTreatment:Control\tTreatment:Drug",
                            "Factors\tTreatment:Control| Time :0h\tTreatment:Drug| Time:2h");
    auto doc = buildText(text);

    ASSERT_TRUE(doc.data_factors.has_value());
    EXPECT_EQ(doc.data_factors->get("S001"), "Treatment:Control | Time:0h");
    EXPECT_EQ(doc.data_factors->get("S002"), "Treatment:Drug | Time:2h");
}

TEST(ParserTests, StoresNmrSectionAsNm) {
    auto doc = buildText(nmrDocumentText());

    EXPECT_TRUE(doc.contains("NM"));
    EXPECT_FALSE(doc.contains("NMR"));
    const auto& data = expect_data_section(doc, "NMR_BINNED_DATA");
    ASSERT_TRUE(data.data.has_value());
    EXPECT_EQ(data.data->labels(), (std::vector<std::string>{"0.50...0.54", "0.54...0.58"}));
    EXPECT_FALSE(doc.data_factors.has_value());
}

TEST(ParserTests, RepeatedKeysAreJoinedWithSpace) {
    auto doc = buildText(HEADER + "#PROJECT\nPR:PROJECT_SUMMARY\tFirst part\nPR:PROJECT_SUMMARY\tsecond part\n");
    const auto* project = doc.get<ItemSection>("PROJECT");

    ASSERT_NE(project, nullptr);
    EXPECT_EQ(project->items.get("PROJECT_SUMMARY"), "First part second part");
    EXPECT_EQ(project->items.size(), 1u);
    EXPECT_TRUE(doc.duplicate_sub_sections.empty());
}

TEST(ParserTests, RecordsIdenticalRepeatedKeys) {
    auto doc = buildText(HEADER + "#PROJECT\nPR:PHONE\t555-0100\nPR:PHONE\t555-0100\n");

    ASSERT_EQ(doc.duplicate_sub_sections.size(), 1u);
    EXPECT_EQ(doc.duplicate_sub_sections[0], (std::pair<std::string, std::string>{"PROJECT", "PHONE"}));
}

TEST(ParserTests, HeaderRepeatsReplaceEarlierValue) {
    auto doc = buildText("#METABOLOMICS WORKBENCH STUDY_ID:ST000001\nVERSION\t1\nVERSION\t2\n");

    EXPECT_EQ(doc.header()->items.get("VERSION"), "2");
}

TEST(ParserTests, RejectsDocumentWithoutHeader) {
    try {
        buildText("#PROJECT\nPR:PROJECT_TITLE\tx\n");
        FAIL() << "Expected a BuildError";
    } catch (const BuildError& err) {
        EXPECT_NE(std::string(err.what()).find("MissingHeaderSection"), std::string::npos);
    }
}

TEST(ParserTests, RejectsContentBeforeFirstSection) {
    EXPECT_THROW(buildText("VERSION\t1\n" + HEADER), BuildError);
}

TEST(ParserTests, RejectsMetabolitesWithoutDataSection) {
    EXPECT_THROW(buildText(HEADER + "#METABOLITES\nMETABOLITES_START\nmetabolite_name\tkegg_id\nMETABOLITES_END\n"),
                 BuildError);
}

TEST(ParserTests, PropagatesTokenizeErrors) {
    EXPECT_THROW(buildText(HEADER + "#SUBJECT_SAMPLE_FACTORS:\nSUBJECT_SAMPLE_FACTORS\tSU001\n"), TokenizeError);
}

TEST(ParserTests, MovesResultsFileToAnalysisSection) {
    auto doc = buildText(HEADER
                         + "#MS\nMS:INSTRUMENT_NAME\tOrbitrap\n"
                           "#MS_METABOLITE_DATA\nMS_METABOLITE_DATA:UNITS\tPeak area\n"
                           "MS:MS_RESULTS_FILE\tST000001_AN000001_Results.txt\tUNITS:Peak area\tHas m/z:Yes\n");

    const auto* ms = doc.get<ItemSection>("MS");
    ASSERT_NE(ms, nullptr);
    ASSERT_TRUE(ms->results_file.has_value());
    EXPECT_EQ(ms->results_file->key, "MS_RESULTS_FILE");
    EXPECT_EQ(ms->results_file->filename, "ST000001_AN000001_Results.txt");
    EXPECT_EQ(ms->results_file->units, "Peak area");
    EXPECT_EQ(ms->results_file->has_mz, "Yes");
    EXPECT_FALSE(ms->results_file->has_rt.has_value());
    EXPECT_TRUE(ms->items.contains("MS_RESULTS_FILE"));

    const auto& data = expect_data_section(doc, "MS_METABOLITE_DATA");
    EXPECT_FALSE(data.results_file.has_value());
    EXPECT_FALSE(data.data.has_value());
}

TEST(ParserTests, ResultsFileWithoutFilename) {
    auto file = ResultsFile::parse("NMR_RESULTS_FILE", "UNITS:ppm Has RT:No RT units:min");

    EXPECT_FALSE(file.filename.has_value());
    EXPECT_EQ(file.units, "ppm");
    EXPECT_EQ(file.has_rt, "No");
    EXPECT_EQ(file.rt_units, "min");
    EXPECT_EQ(file.render(" "), "UNITS:ppm Has RT:No RT units:min");
}

TEST(ParserTests, RecordsRowsLongerThanHeader) {
    auto text = replaceOnce(msDocumentText(), "lactate\t1500\t1200", "lactate\t1500\t1200\t99");
    auto doc = buildText(text);

    EXPECT_EQ(doc.short_headers, (std::vector<std::string>{"MS_METABOLITE_DATA"}));
    const auto& data = expect_data_section(doc, "MS_METABOLITE_DATA");
    ASSERT_TRUE(data.data.has_value());
    EXPECT_EQ(data.data->rows[0].size(), 4u);
    EXPECT_EQ(data.data->rows[1].get(""), "99");
}

TEST(ParserTests, ReadsExtendedTable) {
    auto text = replaceOnce(msDocumentText(), "METABOLITES_END\n",
                            "METABOLITES_END\n"
                            "EXTENDED_MS_METABOLITE_DATA_START\n"
                            "metabolite_name\tsample_id\tisotopologue\n"
                            "glucose\tS001\tM+1\n"
                            "EXTENDED_MS_METABOLITE_DATA_END\n");
    auto doc = buildText(text);
    const auto& data = expect_data_section(doc, "MS_METABOLITE_DATA");

    ASSERT_TRUE(data.extended.has_value());
    EXPECT_EQ(data.extended->rows[0], (Row{{"Metabolite", "glucose"}, {"sample_id", "S001"}, {"isotopologue", "M+1"}}));
}
