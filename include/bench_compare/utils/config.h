#pragma once

#include <map>
#include <string>

namespace bench_compare {

/**
 * @brief Component configuration (string key-value pairs)
 */
using Config = std::map<std::string, std::string>;

/**
 * @brief Get configuration parameter
 */
inline std::string get_config(const Config& config,
                              const std::string& key,
                              const std::string& default_value = "") {
    auto it = config.find(key);
    return (it != config.end()) ? it->second : default_value;
}

} // namespace bench_compare
