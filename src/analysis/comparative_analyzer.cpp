#include "bench_compare/analysis/comparative_analyzer.h"
#include "bench_compare/core/errors.h"
#include <cmath>

namespace bench_compare {

namespace {

enum class Comparison {
    GREATER,
    GREATER_OR_EQUAL
};

struct TierRule {
    double threshold;
    Comparison comparison;
    InterpretationTier tier;
};

// Evaluated top to bottom. Anything that matches no rule is A_SLOWER.
const TierRule TIER_RULES[] = {
    {SIGNIFICANT_SPEEDUP_THRESHOLD, Comparison::GREATER, InterpretationTier::SIGNIFICANT_ADVANTAGE},
    {NEUTRAL_SPEEDUP, Comparison::GREATER, InterpretationTier::MODERATE_ADVANTAGE},
    {NEUTRAL_SPEEDUP, Comparison::GREATER_OR_EQUAL, InterpretationTier::NO_DIFFERENCE},
};

bool matches(const TierRule& rule, double speedup) {
    switch (rule.comparison) {
        case Comparison::GREATER: return speedup > rule.threshold;
        case Comparison::GREATER_OR_EQUAL: return speedup >= rule.threshold;
        default: return false;
    }
}

} // namespace

std::string tier_to_string(InterpretationTier tier) {
    switch (tier) {
        case InterpretationTier::SIGNIFICANT_ADVANTAGE: return "SIGNIFICANT_ADVANTAGE";
        case InterpretationTier::MODERATE_ADVANTAGE: return "MODERATE_ADVANTAGE";
        case InterpretationTier::NO_DIFFERENCE: return "NO_DIFFERENCE";
        case InterpretationTier::A_SLOWER: return "A_SLOWER";
        default: return "UNKNOWN";
    }
}

InterpretationTier classify_speedup(double speedup) {
    for (const auto& rule : TIER_RULES) {
        if (matches(rule, speedup)) {
            return rule.tier;
        }
    }
    return InterpretationTier::A_SLOWER;
}

void validate_measurement_set(const MeasurementSet& set, const std::string& label) {
    if (!std::isfinite(set.mean) || !std::isfinite(set.min) || !std::isfinite(set.max)) {
        throw InvalidMeasurementSetError(label, Violation::NON_FINITE);
    }
    if (!(set.min >= 0.0)) {
        throw InvalidMeasurementSetError(label, Violation::MIN_NEGATIVE);
    }
    if (!(set.min <= set.mean)) {
        throw InvalidMeasurementSetError(label, Violation::MIN_EXCEEDS_MEAN);
    }
    if (!(set.mean <= set.max)) {
        throw InvalidMeasurementSetError(label, Violation::MEAN_EXCEEDS_MAX);
    }
}

ComparativeAnalyzer::ComparativeAnalyzer(const AnalyzerConfig& config)
    : config_(config) {
    label_a_ = get_config(config_, "label_a", "A");
    label_b_ = get_config(config_, "label_b", "B");
    unit_ = get_config(config_, "unit", "ns");
}

ComparisonReport ComparativeAnalyzer::compare(const MeasurementSet& a,
                                              const MeasurementSet& b) const {
    validate_measurement_set(a, label_a_);
    validate_measurement_set(b, label_b_);

    if (a.mean == 0.0) {
        throw DivisionByZeroError(label_a_);
    }

    // A tiny baseline mean can overflow the ratio even though it is nonzero
    double speedup = b.mean / a.mean;
    double relative_overhead_pct = (speedup - 1.0) * 100.0;
    if (!std::isfinite(speedup) || !std::isfinite(relative_overhead_pct)) {
        throw DivisionByZeroError(label_a_);
    }

    ComparisonReport report;
    report.label_a = label_a_;
    report.label_b = label_b_;
    report.unit = unit_;
    report.a = a;
    report.b = b;

    report.range_a = a.range();
    report.range_b = b.range();
    report.speedup = speedup;
    report.absolute_overhead = b.mean - a.mean;
    report.relative_overhead_pct = relative_overhead_pct;
    report.tier = classify_speedup(report.speedup);

    return report;
}

} // namespace bench_compare
