#pragma once

#include <cstdint>

namespace kubuild {

// k-mer length limits (jellyfish canonical counting, 2 bits per base)
inline constexpr int MIN_K = 1;
inline constexpr int MAX_K = 31;

// Minimizer length limit keeps 8 * (4^m + 2) within 64 bits
inline constexpr int MAX_MINIMIZER_LEN = 29;

inline constexpr int DEFAULT_K = 31;
inline constexpr int DEFAULT_MINIMIZER_LEN = 15;
inline constexpr int DEFAULT_THREADS = 1;

// Hash size estimate: HASH_SIZE_FACTOR_PERCENT / 100 * library bytes
inline constexpr uint64_t HASH_SIZE_FACTOR_PERCENT = 115;

inline constexpr uint64_t GIB = uint64_t(1) << 30;

// Decimal digits accepted after the point in a size budget
inline constexpr int MAX_BUDGET_SCALE = 9;

// Library sequence file extensions
inline constexpr const char* LIBRARY_EXTENSIONS[] = {".fna", ".fa", ".ffn"};

// Per-file seqid -> taxid sidecar extension
inline constexpr const char* MAP_EXTENSION = ".map";

inline constexpr const char* TAXONOMY_ARCHIVE_URL =
    "ftp://ftp.ncbi.nih.gov/pub/taxonomy/taxdump.tar.gz";

} // namespace kubuild
