#pragma once

#include <vector>

namespace bench_compare {

/**
 * @brief Summary of one candidate's benchmark run
 *
 * All fields are durations in nanoseconds. The ordering
 * min <= mean <= max is expected but not enforced here; the
 * analyzer validates it before deriving anything.
 */
struct MeasurementSet {
    double mean;
    double min;
    double max;

    MeasurementSet() : mean(0.0), min(0.0), max(0.0) {}

    MeasurementSet(double mean_ns, double min_ns, double max_ns)
        : mean(mean_ns), min(min_ns), max(max_ns) {}

    /**
     * @brief max - min
     */
    double range() const {
        return max - min;
    }

    bool operator==(const MeasurementSet& other) const {
        return mean == other.mean && min == other.min && max == other.max;
    }

    bool operator!=(const MeasurementSet& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Fold raw per-sample timings into a MeasurementSet
 * @param samples Per-sample durations (ns)
 * @return Arithmetic mean, minimum and maximum of the samples
 * @throw std::invalid_argument if samples is empty
 */
MeasurementSet summarize_samples(const std::vector<double>& samples);

} // namespace bench_compare
