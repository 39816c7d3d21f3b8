#pragma once

#include <string>

namespace kubuild {

// SHA256 utilities (using OpenSSL EVP). Hex-encoded lowercase digests.
// sha256_file returns "" if the file cannot be read.
std::string sha256_file(const std::string& path);
std::string sha256_string(const std::string& data);

} // namespace kubuild
