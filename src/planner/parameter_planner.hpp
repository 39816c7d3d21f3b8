#pragma once

#include <cstdint>

#include "util/size_parser.hpp"

namespace kubuild {

// ceil(1.15 * total_library_bytes), exact. Saturates at UINT64_MAX.
uint64_t estimate_hash_size(uint64_t total_library_bytes);

// Minimizer index size in bytes: 8 * (4^minimizer_len + 2).
// minimizer_len must be in [0, MAX_MINIMIZER_LEN].
uint64_t index_size_bytes(int minimizer_len);

// True iff (kdb_size + idx_size) / 2^30 > budget GiB, decided in exact
// integer arithmetic.
bool reduction_needed(uint64_t kdb_size, uint64_t idx_size,
                      const SizeBudget& budget);

// Number of k-mer records that fit next to the index in the budget:
// floor((budget * 2^30 - idx_size) / record_len).
// Returns false if the index alone exceeds the budget (or record_len is 0);
// count is left untouched then.
bool target_record_count(const SizeBudget& budget, uint64_t idx_size,
                         uint64_t record_len, uint64_t& count);

// Bytes available to the k-mer table, floor(budget * 2^30 - idx_size),
// or -1 if the index alone exceeds the budget. Used for diagnostics.
int64_t kdb_byte_allowance(const SizeBudget& budget, uint64_t idx_size);

} // namespace kubuild
