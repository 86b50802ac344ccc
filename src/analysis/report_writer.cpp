#include "bench_compare/analysis/report_writer.h"
#include "bench_compare/core/errors.h"
#include <fstream>
#include <limits>
#include <sstream>

namespace bench_compare {

namespace {

class PrecisionGuard {
public:
    explicit PrecisionGuard(std::ostream& out)
        : out_(out), precision_(out.precision()) {
        out_.precision(std::numeric_limits<double>::max_digits10);
    }

    ~PrecisionGuard() {
        out_.precision(precision_);
    }

private:
    std::ostream& out_;
    std::streamsize precision_;
};

void write_prefixed_set(std::ostream& out, const std::string& prefix,
                        const MeasurementSet& set) {
    out << prefix << ".mean=" << set.mean << "\n";
    out << prefix << ".min=" << set.min << "\n";
    out << prefix << ".max=" << set.max << "\n";
}

} // namespace

void write_measurement_set(std::ostream& out, const MeasurementSet& set) {
    PrecisionGuard guard(out);
    out << "mean=" << set.mean << "\n";
    out << "min=" << set.min << "\n";
    out << "max=" << set.max << "\n";
}

void write_report(std::ostream& out, const ComparisonReport& report) {
    PrecisionGuard guard(out);
    out << "label_a=" << report.label_a << "\n";
    out << "label_b=" << report.label_b << "\n";
    out << "unit=" << report.unit << "\n";
    write_prefixed_set(out, "a", report.a);
    write_prefixed_set(out, "b", report.b);
    out << "range_a=" << report.range_a << "\n";
    out << "range_b=" << report.range_b << "\n";
    out << "speedup=" << report.speedup << "\n";
    out << "absolute_overhead=" << report.absolute_overhead << "\n";
    out << "relative_overhead_pct=" << report.relative_overhead_pct << "\n";
    out << "interpretation=" << tier_to_string(report.tier) << "\n";
}

std::string report_to_string(const ComparisonReport& report) {
    std::ostringstream ss;
    write_report(ss, report);
    return ss.str();
}

void save_report(const std::string& path, const ComparisonReport& report) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw SourceUnavailableError(path);
    }

    write_report(file, report);
    file.flush();
    if (!file) {
        throw SourceUnavailableError(path);
    }
}

} // namespace bench_compare
