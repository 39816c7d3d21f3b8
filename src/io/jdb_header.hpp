#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace kubuild {

// Byte offsets of the geometry fields in a jellyfish 1.x hash-table
// (database.jdb) header. Each field is a little-endian uint64_t.
inline constexpr uint64_t JDB_KEY_BITS_OFFSET  = 8;
inline constexpr uint64_t JDB_VALUE_LEN_OFFSET = 16;
inline constexpr uint64_t JDB_KEY_COUNT_OFFSET = 48;
inline constexpr uint64_t JDB_HEADER_MIN_SIZE  = 56;

struct JdbHeader {
    uint64_t key_bits = 0;
    uint64_t value_len = 0;
    uint64_t key_count = 0;

    // ceil(key_bits / 8), in integers
    uint64_t key_len() const { return (key_bits + 7) / 8; }
    uint64_t record_len() const { return key_len() + value_len; }
};

// Read the header fields without mapping or reading the table body.
// Returns empty optional (after printing to stderr) if the file cannot be
// opened or is shorter than JDB_HEADER_MIN_SIZE.
std::optional<JdbHeader> read_jdb_header(const std::string& path);

} // namespace kubuild
