#include "util/elapsed_time.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace kubuild {

std::string format_elapsed(double seconds) {
    if (!(seconds > 0)) seconds = 0;

    // Work in whole milliseconds so "59.9996" cannot print as "60.000s".
    uint64_t total_ms = static_cast<uint64_t>(std::llround(seconds * 1000.0));
    uint64_t ms = total_ms % 1000;
    uint64_t sec = total_ms / 1000;
    uint64_t min = sec / 60;
    sec %= 60;
    uint64_t hr = min / 60;
    min %= 60;

    std::string out;
    char buf[64];
    if (hr) {
        std::snprintf(buf, sizeof(buf), "%luh", static_cast<unsigned long>(hr));
        out += buf;
    }
    if (min || hr) {
        std::snprintf(buf, sizeof(buf), "%lum", static_cast<unsigned long>(min));
        out += buf;
    }
    std::snprintf(buf, sizeof(buf), "%lu.%03lus",
                  static_cast<unsigned long>(sec), static_cast<unsigned long>(ms));
    out += buf;
    return out;
}

} // namespace kubuild
