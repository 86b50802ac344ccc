#include "bench_compare/core/measurement_set.h"
#include <stdexcept>

namespace bench_compare {

MeasurementSet summarize_samples(const std::vector<double>& samples) {
    if (samples.empty()) {
        throw std::invalid_argument("summarize_samples: no samples");
    }

    double sum = 0.0;
    double min_value = samples[0];
    double max_value = samples[0];

    for (double sample : samples) {
        sum += sample;
        if (sample < min_value) min_value = sample;
        if (sample > max_value) max_value = sample;
    }

    return MeasurementSet(sum / static_cast<double>(samples.size()),
                          min_value, max_value);
}

} // namespace bench_compare
