#pragma once

#include <cstdint>
#include <string>

namespace kubuild {

struct FetchOptions {
    uint32_t retries = 3;          // max retry count
    uint32_t timeout_sec = 0;      // whole-transfer timeout, 0 = none
    uint32_t connect_timeout_sec = 60;
};

// names.dmp / nodes.dmp locations inside a taxonomy directory.
std::string names_dmp_path(const std::string& taxonomy_dir);
std::string nodes_dmp_path(const std::string& taxonomy_dir);

// True iff both dump files exist in taxonomy_dir.
bool taxonomy_dumps_present(const std::string& taxonomy_dir);

// Download url to dest (via dest.tmp + rename), retrying transient
// failures with exponential backoff. On failure returns false and
// describes the problem in error. Always fails when built without
// KUBUILD_ENABLE_REMOTE.
bool download_file(const std::string& url, const std::string& dest,
                   const FetchOptions& opts, std::string& error);

// Whether this build can download (libcurl support compiled in).
bool remote_fetch_enabled();

} // namespace kubuild
