#include "analysis_printer.h"
#include <gtest/gtest.h>
#include <sstream>

namespace bench_compare {
namespace test {

class AnalysisPrinterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_["label_a"] = "Stackless";
        config_["label_b"] = "Ucontext";
    }

    std::string render(const MeasurementSet& a, const MeasurementSet& b) {
        std::ostringstream out;
        print_analysis(out, ComparativeAnalyzer(config_).compare(a, b));
        return out.str();
    }

    AnalyzerConfig config_;
};

TEST_F(AnalysisPrinterTest, NamesFasterCandidate) {
    auto text = render(MeasurementSet(45.0, 40.0, 52.0),
                       MeasurementSet(180.0, 170.0, 195.0));

    EXPECT_NE(text.find("Speedup:           4.00× (Stackless is faster)"), std::string::npos);
    EXPECT_NE(text.find("Relative overhead: 300.0%"), std::string::npos);
    EXPECT_NE(text.find("Stackless shows SIGNIFICANT performance advantage"), std::string::npos);
}

TEST_F(AnalysisPrinterTest, SlowerBaselineNamesComparisonCandidate) {
    auto text = render(MeasurementSet(180.0, 170.0, 195.0),
                       MeasurementSet(45.0, 40.0, 52.0));

    EXPECT_NE(text.find("(Ucontext is faster)"), std::string::npos);
    EXPECT_NE(text.find("Stackless is slower than Ucontext"), std::string::npos);
}

TEST_F(AnalysisPrinterTest, TieNamesNoFasterCandidate) {
    auto text = render(MeasurementSet(50.0, 40.0, 60.0),
                       MeasurementSet(50.0, 45.0, 55.0));

    EXPECT_EQ(text.find("is faster"), std::string::npos);
    EXPECT_NE(text.find("Speedup:           1.00×\n"), std::string::npos);
    EXPECT_NE(text.find("No difference between Stackless and Ucontext"), std::string::npos);
}

} // namespace test
} // namespace bench_compare
