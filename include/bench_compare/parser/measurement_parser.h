#pragma once

#include "bench_compare/core/measurement_set.h"
#include "bench_compare/utils/config.h"
#include <cstdint>
#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bench_compare {

/**
 * @brief Parser configuration
 *
 * Configuration parameters:
 * - comment_prefix: lines starting with this prefix are skipped (default "#",
 *   empty disables comment handling)
 */
using ParserConfig = Config;

/**
 * @brief Reads a flat key=value measurement record
 *
 * Record format (one measurement set per source, any line order):
 *   mean=<decimal>
 *   min=<decimal>
 *   max=<decimal>
 *
 * Lines without '=' are skipped, unknown keys are ignored, and a repeated
 * recognized key overrides the earlier value. Every parse either returns a
 * complete MeasurementSet or throws; nothing partial is ever exposed.
 */
class MeasurementParser {
public:
    explicit MeasurementParser(const ParserConfig& config = {});

    /**
     * @brief Parse an already split sequence of lines
     * @param lines Record lines, top to bottom
     * @param source_id Identifier used in error messages
     * @throw MalformedValueError, IncompleteRecordError
     */
    MeasurementSet parse_lines(const std::vector<std::string>& lines,
                               const std::string& source_id = "<lines>") const;

    /**
     * @brief Parse a record from a line-oriented stream
     * @throw SourceUnavailableError if the stream fails while reading
     * @throw MalformedValueError, IncompleteRecordError
     */
    MeasurementSet parse_stream(std::istream& input,
                                const std::string& source_id = "<stream>") const;

    /**
     * @brief Parse an in-memory record
     */
    MeasurementSet parse_string(const std::string& text,
                                const std::string& source_id = "<string>") const;

    /**
     * @brief Parse a record file
     * @param path Path of the results file
     * @throw SourceUnavailableError if the file is missing or unreadable
     * @throw MalformedValueError, IncompleteRecordError
     */
    MeasurementSet parse_file(const std::string& path) const;

    /**
     * @brief Statistics of the most recently finished parse
     *
     * Keys: lines_read, lines_skipped, unknown_keys. Counters are
     * accumulated per call and published when the call ends, so a
     * parser may be shared between threads.
     */
    std::map<std::string, int64_t> get_stats() const;

    /**
     * @brief Get parser configuration
     */
    const ParserConfig& get_config() const {
        return config_;
    }

private:
    /**
     * @brief Accumulates recognized fields while lines are consumed
     */
    struct RecordBuilder {
        std::optional<double> mean;
        std::optional<double> min;
        std::optional<double> max;

        int64_t lines_read = 0;
        int64_t lines_skipped = 0;
        int64_t unknown_keys = 0;
    };

    /**
     * @brief Store the counters of a finished (or failed) parse
     */
    void publish_stats(const RecordBuilder& builder) const;

    /**
     * @brief Consume one raw line into the builder
     */
    void consume_line(RecordBuilder& builder,
                      const std::string& raw_line,
                      int64_t line_number,
                      const std::string& source_id) const;

    /**
     * @brief Turn a builder into a MeasurementSet or report missing keys
     */
    MeasurementSet finish(const RecordBuilder& builder,
                          const std::string& source_id) const;

    /**
     * @brief Parse a finite decimal number
     * @return std::nullopt if text is not a complete finite decimal
     */
    static std::optional<double> parse_decimal(const std::string& text);

    ParserConfig config_;
    std::string comment_prefix_;

    // Statistics
    mutable std::mutex stats_mutex_;
    mutable int64_t lines_read_;
    mutable int64_t lines_skipped_;
    mutable int64_t unknown_keys_;
};

} // namespace bench_compare
