#pragma once

#include "bench_compare/analysis/comparative_analyzer.h"
#include <iomanip>
#include <ostream>
#include <string>

/**
 * @brief Console rendering of a ComparisonReport for the example driver
 */

inline void print_set(std::ostream& out, const std::string& label,
                      const bench_compare::MeasurementSet& set, const std::string& unit) {
    out << "\n📊 " << label << ":\n";
    out << "   Mean:  " << set.mean << " " << unit << "\n";
    out << "   Min:   " << set.min << " " << unit << "\n";
    out << "   Max:   " << set.max << " " << unit << "\n";
    out << "   Range: " << set.range() << " " << unit << "\n";
}

inline void print_interpretation(std::ostream& out,
                                 const bench_compare::ComparisonReport& report) {
    using bench_compare::InterpretationTier;

    out << "\n💡 INTERPRETATION:\n";
    switch (report.tier) {
        case InterpretationTier::SIGNIFICANT_ADVANTAGE:
            out << "   • " << report.label_a << " shows SIGNIFICANT performance advantage\n";
            break;
        case InterpretationTier::MODERATE_ADVANTAGE:
            out << "   • " << report.label_a << " shows moderate performance advantage\n";
            break;
        case InterpretationTier::NO_DIFFERENCE:
            out << "   • No difference between " << report.label_a
                << " and " << report.label_b << "\n";
            break;
        case InterpretationTier::A_SLOWER:
            out << "   • " << report.label_a << " is slower than " << report.label_b << "\n";
            break;
    }
}

inline void print_analysis(std::ostream& out, const bench_compare::ComparisonReport& report) {
    out << std::fixed << std::setprecision(2);
    out << "\n" << std::string(60, '=') << "\n";
    out << " BENCHMARK ANALYSIS SUMMARY\n";
    out << std::string(60, '=') << "\n";

    print_set(out, report.label_a, report.a, report.unit);
    print_set(out, report.label_b, report.b, report.unit);

    out << "\n🚀 PERFORMANCE COMPARISON:\n";
    out << "   Speedup:           " << report.speedup << "×";
    // A tie has no faster candidate
    if (report.tier != bench_compare::InterpretationTier::NO_DIFFERENCE) {
        out << " (" << report.faster_label() << " is faster)";
    }
    out << "\n";
    out << "   Absolute overhead: " << report.absolute_overhead << " " << report.unit << "\n";
    out << std::setprecision(1);
    out << "   Relative overhead: " << report.relative_overhead_pct << "%\n";

    print_interpretation(out, report);
    out << "\n" << std::string(60, '=') << "\n" << std::endl;
}
