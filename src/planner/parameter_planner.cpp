#include "planner/parameter_planner.hpp"
#include "core/config.hpp"

#include <limits>

namespace kubuild {

using u128 = unsigned __int128;

uint64_t estimate_hash_size(uint64_t total_library_bytes) {
    u128 scaled = static_cast<u128>(total_library_bytes) * HASH_SIZE_FACTOR_PERCENT;
    u128 est = (scaled + 99) / 100;
    if (est > std::numeric_limits<uint64_t>::max())
        return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(est);
}

uint64_t index_size_bytes(int minimizer_len) {
    return 8 * ((uint64_t(1) << (2 * minimizer_len)) + 2);
}

bool reduction_needed(uint64_t kdb_size, uint64_t idx_size,
                      const SizeBudget& budget) {
    // (kdb + idx) / 2^30 > n / 10^s  <=>  (kdb + idx) * 10^s > n * 2^30
    u128 lhs = (static_cast<u128>(kdb_size) + idx_size) * budget.denominator();
    u128 rhs = static_cast<u128>(budget.numerator) * GIB;
    return lhs > rhs;
}

bool target_record_count(const SizeBudget& budget, uint64_t idx_size,
                         uint64_t record_len, uint64_t& count) {
    if (record_len == 0) return false;

    // budget * 2^30 - idx = (n * 2^30 - idx * 10^s) / 10^s
    u128 budget_scaled = static_cast<u128>(budget.numerator) * GIB;
    u128 idx_scaled = static_cast<u128>(idx_size) * budget.denominator();
    if (budget_scaled < idx_scaled) return false;

    u128 records = (budget_scaled - idx_scaled) /
                   (static_cast<u128>(budget.denominator()) * record_len);
    if (records > std::numeric_limits<uint64_t>::max())
        records = std::numeric_limits<uint64_t>::max();
    count = static_cast<uint64_t>(records);
    return true;
}

int64_t kdb_byte_allowance(const SizeBudget& budget, uint64_t idx_size) {
    u128 budget_scaled = static_cast<u128>(budget.numerator) * GIB;
    u128 idx_scaled = static_cast<u128>(idx_size) * budget.denominator();
    if (budget_scaled < idx_scaled) return -1;
    u128 bytes = (budget_scaled - idx_scaled) / budget.denominator();
    if (bytes > static_cast<u128>(std::numeric_limits<int64_t>::max()))
        return std::numeric_limits<int64_t>::max();
    return static_cast<int64_t>(bytes);
}

} // namespace kubuild
