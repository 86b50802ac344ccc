#pragma once

#include "bench_compare/analysis/comparative_analyzer.h"
#include "bench_compare/core/measurement_set.h"
#include <ostream>
#include <string>

namespace bench_compare {

/**
 * @brief Write a measurement set as mean=/min=/max= lines
 *
 * The output is readable by MeasurementParser and keeps full double
 * precision.
 */
void write_measurement_set(std::ostream& out, const MeasurementSet& set);

/**
 * @brief Write every report field as a key=value line
 *
 * Keys, in order: label_a, label_b, unit, a.mean, a.min, a.max, b.mean,
 * b.min, b.max, range_a, range_b, speedup, absolute_overhead,
 * relative_overhead_pct, interpretation.
 */
void write_report(std::ostream& out, const ComparisonReport& report);

/**
 * @brief Serialize a report to a key=value string
 */
std::string report_to_string(const ComparisonReport& report);

/**
 * @brief Write a report file
 * @throw SourceUnavailableError if the file cannot be opened or written
 */
void save_report(const std::string& path, const ComparisonReport& report);

} // namespace bench_compare
