#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/config.hpp"

namespace kubuild {

// Database size budget in GiB, held as an exact decimal:
// value = numerator / 10^scale.
struct SizeBudget {
    uint64_t numerator = 0;
    int scale = 0;

    uint64_t denominator() const {
        uint64_t d = 1;
        for (int i = 0; i < scale; i++) d *= 10;
        return d;
    }

    // Render back as decimal text, e.g. {1225, 2} -> "12.25"
    std::string to_string() const {
        std::string digits = std::to_string(numerator);
        if (scale == 0) return digits;
        if (digits.size() <= static_cast<size_t>(scale))
            digits.insert(0, static_cast<size_t>(scale) - digits.size() + 1, '0');
        digits.insert(digits.size() - static_cast<size_t>(scale), 1, '.');
        return digits;
    }
};

// Parse a GiB budget such as "4", "0.5" or "12.25" without going through
// floating point. Trailing zeros after the point are dropped.
// Returns empty optional on a sign, suffix, empty string, more than
// MAX_BUDGET_SCALE fractional digits, or overflow.
inline std::optional<SizeBudget> parse_size_budget(const std::string& s) {
    if (s.empty()) return std::nullopt;

    SizeBudget budget;
    bool seen_point = false;
    bool seen_digit = false;
    for (char c : s) {
        if (c == '.') {
            if (seen_point) return std::nullopt;
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') return std::nullopt;
        seen_digit = true;
        if (seen_point) {
            if (budget.scale == MAX_BUDGET_SCALE) return std::nullopt;
            budget.scale++;
        }
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (budget.numerator > (UINT64_MAX - d) / 10) return std::nullopt;
        budget.numerator = budget.numerator * 10 + d;
    }
    if (!seen_digit) return std::nullopt;

    while (budget.scale > 0 && budget.numerator % 10 == 0) {
        budget.numerator /= 10;
        budget.scale--;
    }
    return budget;
}

} // namespace kubuild
