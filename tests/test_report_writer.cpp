#include "bench_compare/analysis/report_writer.h"
#include "bench_compare/core/errors.h"
#include "bench_compare/parser/measurement_parser.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace bench_compare {
namespace test {

class ReportWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = "./test_report_data";
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
        fs::create_directories(test_dir_);

        AnalyzerConfig config;
        config["label_a"] = "Stackless";
        config["label_b"] = "Ucontext";
        ComparativeAnalyzer analyzer(config);
        report_ = analyzer.compare(MeasurementSet(45.0, 40.0, 52.0),
                                   MeasurementSet(180.0, 170.0, 195.0));
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    std::string test_dir_;
    ComparisonReport report_;
};

TEST_F(ReportWriterTest, MeasurementSetIsReadableByParser) {
    MeasurementSet set(1.0 / 3.0, 0.1, 123456.789012345);

    std::ostringstream out;
    write_measurement_set(out, set);

    MeasurementParser parser;
    EXPECT_EQ(parser.parse_string(out.str()), set);
}

TEST_F(ReportWriterTest, SubnormalMeasurementSetIsReadableByParser) {
    MeasurementSet set(std::numeric_limits<double>::denorm_min(), 0.0, 1.0);

    std::ostringstream out;
    write_measurement_set(out, set);

    MeasurementParser parser;
    EXPECT_EQ(parser.parse_string(out.str()), set);
}

TEST_F(ReportWriterTest, ReportLines) {
    std::string text = report_to_string(report_);

    EXPECT_EQ(text,
              "label_a=Stackless\n"
              "label_b=Ucontext\n"
              "unit=ns\n"
              "a.mean=45\n"
              "a.min=40\n"
              "a.max=52\n"
              "b.mean=180\n"
              "b.min=170\n"
              "b.max=195\n"
              "range_a=12\n"
              "range_b=25\n"
              "speedup=4\n"
              "absolute_overhead=135\n"
              "relative_overhead_pct=300\n"
              "interpretation=SIGNIFICANT_ADVANTAGE\n");
}

TEST_F(ReportWriterTest, RestoresStreamPrecision) {
    std::ostringstream out;
    out.precision(3);
    write_report(out, report_);
    EXPECT_EQ(out.precision(), 3);
}

TEST_F(ReportWriterTest, SaveReport) {
    std::string path = test_dir_ + "/report.txt";
    save_report(path, report_);

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), report_to_string(report_));
}

TEST_F(ReportWriterTest, SaveReportToMissingDirectoryFails) {
    std::string path = test_dir_ + "/missing/report.txt";
    try {
        save_report(path, report_);
        FAIL() << "Expected SourceUnavailableError";
    } catch (const SourceUnavailableError& e) {
        EXPECT_EQ(e.source(), path);
    }
}

} // namespace test
} // namespace bench_compare
