#pragma once

#include "bench_compare/core/measurement_set.h"
#include "bench_compare/utils/config.h"
#include <string>

namespace bench_compare {

/**
 * @brief Qualitative label for the magnitude of a speedup
 */
enum class InterpretationTier {
    SIGNIFICANT_ADVANTAGE,  // speedup > 2.0
    MODERATE_ADVANTAGE,     // 1.0 < speedup <= 2.0
    NO_DIFFERENCE,          // speedup == 1.0
    A_SLOWER                // speedup < 1.0
};

// Fixed classification thresholds
constexpr double SIGNIFICANT_SPEEDUP_THRESHOLD = 2.0;
constexpr double NEUTRAL_SPEEDUP = 1.0;

/**
 * @brief Analyzer configuration
 *
 * Configuration parameters:
 * - label_a: name of the baseline candidate (default "A")
 * - label_b: name of the comparison candidate (default "B")
 * - unit: time unit of the measurements (default "ns")
 */
using AnalyzerConfig = Config;

/**
 * @brief Result of comparing candidate A against candidate B
 *
 * Plain data handed to renderers and printers. Values are exact, no
 * rounding is applied.
 */
struct ComparisonReport {
    std::string label_a;
    std::string label_b;
    std::string unit;

    MeasurementSet a;
    MeasurementSet b;

    double range_a = 0.0;                // a.max - a.min
    double range_b = 0.0;                // b.max - b.min
    double speedup = 0.0;                // b.mean / a.mean
    double absolute_overhead = 0.0;      // b.mean - a.mean
    double relative_overhead_pct = 0.0;  // (speedup - 1) * 100
    InterpretationTier tier = InterpretationTier::NO_DIFFERENCE;

    /**
     * @brief Label of the candidate with the smaller mean (A on a tie)
     */
    const std::string& faster_label() const {
        return (b.mean < a.mean) ? label_b : label_a;
    }
};

/**
 * @brief Convert interpretation tier to string
 */
std::string tier_to_string(InterpretationTier tier);

/**
 * @brief Classify a speedup ratio, first matching threshold wins
 */
InterpretationTier classify_speedup(double speedup);

/**
 * @brief Check that all fields are finite and 0 <= min <= mean <= max
 * @param set Measurement set to check
 * @param label Name reported if the check fails
 * @throw InvalidMeasurementSetError naming the set and the broken inequality
 */
void validate_measurement_set(const MeasurementSet& set, const std::string& label);

/**
 * @brief Derives comparative metrics from two measurement sets
 *
 * A is the baseline (presumed faster), B the comparison candidate. The
 * analyzer does not assume which one actually wins: a B faster than A
 * yields tier A_SLOWER rather than an error.
 */
class ComparativeAnalyzer {
public:
    explicit ComparativeAnalyzer(const AnalyzerConfig& config = {});

    /**
     * @brief Compare two measurement sets
     * @param a Baseline candidate
     * @param b Comparison candidate
     * @return Derived report
     * @throw InvalidMeasurementSetError if either set is out of order
     * @throw DivisionByZeroError if a.mean is zero or b.mean / a.mean overflows
     */
    ComparisonReport compare(const MeasurementSet& a, const MeasurementSet& b) const;

    const std::string& label_a() const { return label_a_; }
    const std::string& label_b() const { return label_b_; }
    const std::string& unit() const { return unit_; }

private:
    AnalyzerConfig config_;
    std::string label_a_;
    std::string label_b_;
    std::string unit_;
};

} // namespace bench_compare
