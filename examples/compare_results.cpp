#include "bench_compare/analysis/comparative_analyzer.h"
#include "bench_compare/analysis/report_writer.h"
#include "bench_compare/core/errors.h"
#include "bench_compare/parser/measurement_parser.h"
#include "bench_compare/utils/common.h"
#include "analysis_printer.h"
#include <iostream>
#include <string>

using namespace bench_compare;

struct DriverConfig {
    std::string a_file = "stackless_results.txt";
    std::string b_file = "ucontext_results.txt";
    std::string label_a = "Stackless";
    std::string label_b = "Ucontext";
    std::string out_file;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --a FILE        Results of candidate A (default: stackless_results.txt)\n"
              << "  --b FILE        Results of candidate B (default: ucontext_results.txt)\n"
              << "  --label-a NAME  Name of candidate A (default: Stackless)\n"
              << "  --label-b NAME  Name of candidate B (default: Ucontext)\n"
              << "  --out FILE      Also write the report as key=value lines\n"
              << "  --help          Show this message\n";
}

int main(int argc, char** argv) {
    DriverConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--a" && i + 1 < argc) {
            config.a_file = argv[++i];
        } else if (arg == "--b" && i + 1 < argc) {
            config.b_file = argv[++i];
        } else if (arg == "--label-a" && i + 1 < argc) {
            config.label_a = argv[++i];
        } else if (arg == "--label-b" && i + 1 < argc) {
            config.label_b = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            config.out_file = argv[++i];
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::cout << "bench_compare " << BENCH_COMPARE_VERSION << std::endl;
    std::cout << "Reading benchmark results..." << std::endl;

    try {
        MeasurementParser parser;
        MeasurementSet a = parser.parse_file(config.a_file);
        MeasurementSet b = parser.parse_file(config.b_file);
        std::cout << "✓ Results loaded successfully" << std::endl;

        AnalyzerConfig analyzer_config;
        analyzer_config["label_a"] = config.label_a;
        analyzer_config["label_b"] = config.label_b;
        ComparativeAnalyzer analyzer(analyzer_config);

        ComparisonReport report = analyzer.compare(a, b);
        print_analysis(std::cout, report);

        if (!config.out_file.empty()) {
            save_report(config.out_file, report);
            std::cout << "✓ Report saved as '" << config.out_file << "'" << std::endl;
        }
    } catch (const BenchCompareError& e) {
        std::cerr << "❌ " << error_kind_to_string(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
