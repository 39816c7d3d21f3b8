#pragma once

#include <chrono>
#include <string>

namespace kubuild {

// Render a duration as "[Hh][Mm]S.sss" + "s": hours only when non-zero,
// minutes when non-zero or hours are shown, seconds always with
// millisecond precision. Negative durations render as "0.000s".
std::string format_elapsed(double seconds);

// Wall-clock timer started at construction.
class ElapsedTimer {
public:
    ElapsedTimer() : start_(std::chrono::steady_clock::now()) {}

    double seconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_).count();
    }

    std::string elapsed() const { return format_elapsed(seconds()); }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace kubuild
