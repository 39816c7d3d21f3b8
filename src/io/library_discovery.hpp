#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kubuild {

class Logger;

// Ordered list of library sequence files. Never empty once returned by
// load_or_discover_manifest().
struct LibraryManifest {
    std::vector<std::string> files;

    size_t size() const { return files.size(); }
    bool empty() const { return files.empty(); }
};

// Recursively find regular files under each root whose name ends with one
// of the given extensions. Symbolic links to files and directories are
// followed, like find -L: a directory that is one of its own ancestors is
// reported as a loop and not entered. Results are sorted and de-duplicated.
std::vector<std::string> find_files_with_extensions(
    const std::vector<std::string>& roots,
    const std::vector<std::string>& extensions,
    const Logger& logger);

// Same as above for the library sequence extensions (.fna, .fa, .ffn).
std::vector<std::string> discover_library_files(
    const std::vector<std::string>& roots, const Logger& logger);

// Read a manifest file (one path per line, blank lines ignored).
// Returns empty optional if the file is missing or lists no paths.
std::optional<LibraryManifest> read_manifest(const std::string& path);

// Write a manifest via <path>.tmp + rename.
bool write_manifest(const std::string& path, const LibraryManifest& manifest);

// Return the cached manifest at manifest_path if it exists and is
// non-empty; otherwise discover library files under roots and persist them.
// Returns empty optional (after logging) if discovery finds no files; no
// manifest is written in that case.
std::optional<LibraryManifest> load_or_discover_manifest(
    const std::string& manifest_path,
    const std::vector<std::string>& roots,
    const Logger& logger);

// Sum of the sizes of all manifest files (stat, links followed), computed
// in parallel. Missing files count as 0 bytes.
uint64_t total_library_bytes(const LibraryManifest& manifest);

} // namespace kubuild
