#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace bench_compare {

/**
 * @brief Failure categories reported by the parser and the analyzer
 */
enum class ErrorKind {
    SOURCE_UNAVAILABLE = 0,
    MALFORMED_VALUE = 1,
    INCOMPLETE_RECORD = 2,
    INVALID_MEASUREMENT_SET = 3,
    DIVISION_BY_ZERO = 4
};

/**
 * @brief Ordering inequality of a measurement set that was violated
 */
enum class Violation {
    NON_FINITE,         // every field is finite
    MIN_NEGATIVE,       // 0 <= min
    MIN_EXCEEDS_MEAN,   // min <= mean
    MEAN_EXCEEDS_MAX    // mean <= max
};

/**
 * @brief Convert error kind to string
 */
std::string error_kind_to_string(ErrorKind kind);

/**
 * @brief Convert violation to the inequality it breaks ("min <= mean", ...)
 */
std::string violation_to_string(Violation violation);

/**
 * @brief Base class of every error raised by bench_compare
 */
class BenchCompareError : public std::runtime_error {
public:
    BenchCompareError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Input source could not be opened or found
 */
class SourceUnavailableError : public BenchCompareError {
public:
    explicit SourceUnavailableError(const std::string& source);

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

/**
 * @brief A recognized key carried a non-numeric or non-finite value
 */
class MalformedValueError : public BenchCompareError {
public:
    MalformedValueError(const std::string& source, int64_t line_number,
                        const std::string& line);

    const std::string& source() const { return source_; }
    int64_t line_number() const { return line_number_; }
    const std::string& line() const { return line_; }

private:
    std::string source_;
    int64_t line_number_;
    std::string line_;
};

/**
 * @brief One or more of mean/min/max never appeared in the record
 */
class IncompleteRecordError : public BenchCompareError {
public:
    IncompleteRecordError(const std::string& source,
                          const std::vector<std::string>& missing_keys);

    const std::string& source() const { return source_; }
    const std::vector<std::string>& missing_keys() const { return missing_keys_; }

private:
    std::string source_;
    std::vector<std::string> missing_keys_;
};

/**
 * @brief A measurement set breaks 0 <= min <= mean <= max or has a non-finite field
 */
class InvalidMeasurementSetError : public BenchCompareError {
public:
    InvalidMeasurementSetError(const std::string& set_label, Violation violation);

    const std::string& set_label() const { return set_label_; }
    Violation violation() const { return violation_; }

private:
    std::string set_label_;
    Violation violation_;
};

/**
 * @brief Baseline mean is zero (or so small the ratio overflows), speedup is undefined
 */
class DivisionByZeroError : public BenchCompareError {
public:
    explicit DivisionByZeroError(const std::string& set_label);

    const std::string& set_label() const { return set_label_; }

private:
    std::string set_label_;
};

} // namespace bench_compare
