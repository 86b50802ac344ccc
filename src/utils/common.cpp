#include "bench_compare/utils/common.h"

namespace bench_compare {

std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n\f\v";
    auto begin = str.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(whitespace);
    return str.substr(begin, end - begin + 1);
}

} // namespace bench_compare
