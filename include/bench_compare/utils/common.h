#pragma once

#include <string>

namespace bench_compare {

/**
 * @brief Common utilities
 */

// Version information
constexpr const char* BENCH_COMPARE_VERSION = "0.1.0";
constexpr int BENCH_COMPARE_VERSION_MAJOR = 0;
constexpr int BENCH_COMPARE_VERSION_MINOR = 1;
constexpr int BENCH_COMPARE_VERSION_PATCH = 0;

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trim(const std::string& str);

} // namespace bench_compare
