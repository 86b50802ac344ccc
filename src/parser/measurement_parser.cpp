#include "bench_compare/parser/measurement_parser.h"
#include "bench_compare/core/errors.h"
#include "bench_compare/utils/common.h"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace bench_compare {

MeasurementParser::MeasurementParser(const ParserConfig& config)
    : config_(config),
      lines_read_(0),
      lines_skipped_(0),
      unknown_keys_(0) {
    comment_prefix_ = bench_compare::get_config(config_, "comment_prefix", "#");
}

MeasurementSet MeasurementParser::parse_lines(const std::vector<std::string>& lines,
                                              const std::string& source_id) const {
    RecordBuilder builder;
    int64_t line_number = 0;
    try {
        for (const auto& line : lines) {
            ++line_number;
            consume_line(builder, line, line_number, source_id);
        }
    } catch (const BenchCompareError&) {
        publish_stats(builder);
        throw;
    }
    publish_stats(builder);

    return finish(builder, source_id);
}

MeasurementSet MeasurementParser::parse_stream(std::istream& input,
                                               const std::string& source_id) const {
    RecordBuilder builder;
    std::string line;
    int64_t line_number = 0;
    try {
        while (std::getline(input, line)) {
            ++line_number;
            consume_line(builder, line, line_number, source_id);
        }
    } catch (const BenchCompareError&) {
        publish_stats(builder);
        throw;
    } catch (const std::ios_base::failure&) {
        publish_stats(builder);
        throw SourceUnavailableError(source_id);
    }
    publish_stats(builder);

    if (input.bad()) {
        throw SourceUnavailableError(source_id);
    }

    return finish(builder, source_id);
}

MeasurementSet MeasurementParser::parse_string(const std::string& text,
                                               const std::string& source_id) const {
    std::istringstream input(text);
    return parse_stream(input, source_id);
}

MeasurementSet MeasurementParser::parse_file(const std::string& path) const {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw SourceUnavailableError(path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw SourceUnavailableError(path);
    }

    return parse_stream(file, path);
}

std::map<std::string, int64_t> MeasurementParser::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return {
        {"lines_read", lines_read_},
        {"lines_skipped", lines_skipped_},
        {"unknown_keys", unknown_keys_}
    };
}

void MeasurementParser::publish_stats(const RecordBuilder& builder) const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    lines_read_ = builder.lines_read;
    lines_skipped_ = builder.lines_skipped;
    unknown_keys_ = builder.unknown_keys;
}

void MeasurementParser::consume_line(RecordBuilder& builder,
                                     const std::string& raw_line,
                                     int64_t line_number,
                                     const std::string& source_id) const {
    ++builder.lines_read;

    std::string line = trim(raw_line);
    if (!comment_prefix_.empty() && line.compare(0, comment_prefix_.size(), comment_prefix_) == 0) {
        ++builder.lines_skipped;
        return;
    }

    auto pos = line.find('=');
    if (pos == std::string::npos) {
        ++builder.lines_skipped;
        return;
    }

    std::string key = trim(line.substr(0, pos));
    std::string value = trim(line.substr(pos + 1));

    std::optional<double>* field = nullptr;
    if (key == "mean") {
        field = &builder.mean;
    } else if (key == "min") {
        field = &builder.min;
    } else if (key == "max") {
        field = &builder.max;
    } else {
        ++builder.unknown_keys;
        return;
    }

    auto parsed = parse_decimal(value);
    if (!parsed) {
        throw MalformedValueError(source_id, line_number, line);
    }
    *field = *parsed;
}

MeasurementSet MeasurementParser::finish(const RecordBuilder& builder,
                                         const std::string& source_id) const {
    std::vector<std::string> missing;
    if (!builder.mean) missing.push_back("mean");
    if (!builder.min) missing.push_back("min");
    if (!builder.max) missing.push_back("max");

    if (!missing.empty()) {
        throw IncompleteRecordError(source_id, missing);
    }

    return MeasurementSet(*builder.mean, *builder.min, *builder.max);
}

std::optional<double> MeasurementParser::parse_decimal(const std::string& text) {
    if (text.empty() || text.find_first_of("xX") != std::string::npos) {
        return std::nullopt;
    }

    // strtod rather than stod: stod throws on subnormal results.
    // Overflow comes back as HUGE_VAL and fails the finiteness check.
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);

    if (end != begin + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace bench_compare
