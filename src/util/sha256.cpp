#include "util/sha256.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace kubuild {

static std::string bytes_to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; i++)
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    return oss.str();
}

std::string sha256_string(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &hash_len,
                   EVP_sha256(), nullptr) != 1) {
        return "";
    }
    return bytes_to_hex(hash, hash_len);
}

std::string sha256_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return "";

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    // Large buffer: artifacts are multi-gigabyte hash tables.
    std::string buf(1 << 20, '\0');
    while (in.read(&buf[0], static_cast<std::streamsize>(buf.size())) || in.gcount() > 0) {
        EVP_DigestUpdate(ctx, buf.data(), static_cast<size_t>(in.gcount()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    int rc = EVP_DigestFinal_ex(ctx, hash, &hash_len);
    EVP_MD_CTX_free(ctx);
    if (rc != 1) return "";

    return bytes_to_hex(hash, hash_len);
}

} // namespace kubuild
