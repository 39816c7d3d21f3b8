#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kubuild {

// stat(2)-based probes; symlinks are followed.
bool file_exists(const std::string& path);
bool file_nonempty(const std::string& path);
bool dir_exists(const std::string& path);

// Size in bytes, or 0 if the file does not exist.
uint64_t file_size(const std::string& path);

std::string read_file_string(const std::string& path);
bool write_file_string(const std::string& path, const std::string& content);

// rename(2); atomic within one filesystem. Logs nothing, sets errno.
bool rename_file(const std::string& from, const std::string& to);

// unlink(2), ignoring a missing file. Returns false on other errors.
bool remove_file(const std::string& path);

// Join a directory and a file name ("dir" + "x" -> "dir/x").
std::string path_join(const std::string& dir, const std::string& name);

// Final path component with trailing slashes ignored ("/a/b/" -> "b").
std::string basename_of(const std::string& path);

// Names of the entries of a directory (not recursive, "." and ".." skipped).
std::vector<std::string> list_directory(const std::string& dir);

} // namespace kubuild
