#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kubuild {

// Numeric value of a 1-based tab-separated field, read like sort -n: leading
// blanks skipped, optional '-', then digits up to the first non-digit.
// Missing or non-numeric fields read as 0.
int64_t taxdb_numeric_field(const std::string& line, int field);

// Order taxonomy records by field 6 descending, then field 5 descending,
// then whole line descending (bytewise). Parallel (TBB).
void sort_taxdb_records(std::vector<std::string>& lines);

// Sort the build_taxdb output file into output. Lines keep their content;
// every output line ends with '\n'. Returns false with error set on I/O
// failure.
bool sort_taxdb_file(const std::string& input, const std::string& output,
                     std::string& error);

} // namespace kubuild
