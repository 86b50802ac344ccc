#include "bench_compare/core/errors.h"

namespace bench_compare {

namespace {

std::string join_keys(const std::vector<std::string>& keys) {
    std::string joined;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += keys[i];
    }
    return joined;
}

} // namespace

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SOURCE_UNAVAILABLE: return "SourceUnavailable";
        case ErrorKind::MALFORMED_VALUE: return "MalformedValue";
        case ErrorKind::INCOMPLETE_RECORD: return "IncompleteRecord";
        case ErrorKind::INVALID_MEASUREMENT_SET: return "InvalidMeasurementSet";
        case ErrorKind::DIVISION_BY_ZERO: return "DivisionByZero";
        default: return "Unknown";
    }
}

std::string violation_to_string(Violation violation) {
    switch (violation) {
        case Violation::NON_FINITE: return "finite fields";
        case Violation::MIN_NEGATIVE: return "0 <= min";
        case Violation::MIN_EXCEEDS_MEAN: return "min <= mean";
        case Violation::MEAN_EXCEEDS_MAX: return "mean <= max";
        default: return "unknown";
    }
}

SourceUnavailableError::SourceUnavailableError(const std::string& source)
    : BenchCompareError(ErrorKind::SOURCE_UNAVAILABLE,
                        "Failed to open source: " + source),
      source_(source) {}

MalformedValueError::MalformedValueError(const std::string& source,
                                         int64_t line_number,
                                         const std::string& line)
    : BenchCompareError(ErrorKind::MALFORMED_VALUE,
                        "Malformed value at line " + std::to_string(line_number) +
                        " in " + source + ": '" + line + "'"),
      source_(source),
      line_number_(line_number),
      line_(line) {}

IncompleteRecordError::IncompleteRecordError(
    const std::string& source,
    const std::vector<std::string>& missing_keys)
    : BenchCompareError(ErrorKind::INCOMPLETE_RECORD,
                        "Incomplete record in " + source + ", missing: " +
                        join_keys(missing_keys)),
      source_(source),
      missing_keys_(missing_keys) {}

InvalidMeasurementSetError::InvalidMeasurementSetError(const std::string& set_label,
                                                       Violation violation)
    : BenchCompareError(ErrorKind::INVALID_MEASUREMENT_SET,
                        "Measurement set '" + set_label + "' violates " +
                        violation_to_string(violation)),
      set_label_(set_label),
      violation_(violation) {}

DivisionByZeroError::DivisionByZeroError(const std::string& set_label)
    : BenchCompareError(ErrorKind::DIVISION_BY_ZERO,
                        "Mean of '" + set_label + "' is zero, speedup is undefined"),
      set_label_(set_label) {}

} // namespace bench_compare
