#include "io/jdb_header.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace kubuild {

static bool pread_u64(int fd, uint64_t offset, uint64_t& value) {
    uint8_t buf[8];
    size_t done = 0;
    while (done < sizeof(buf)) {
        ssize_t n = ::pread(fd, buf + done, sizeof(buf) - done,
                            static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false; // short file
        done += static_cast<size_t>(n);
    }
    value = 0;
    for (int i = 7; i >= 0; i--) value = (value << 8) | buf[i];
    return true;
}

std::optional<JdbHeader> read_jdb_header(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        std::fprintf(stderr, "JdbHeader: cannot open '%s': %s\n",
                     path.c_str(), std::strerror(errno));
        return std::nullopt;
    }

    JdbHeader hdr;
    bool ok = pread_u64(fd, JDB_KEY_BITS_OFFSET, hdr.key_bits) &&
              pread_u64(fd, JDB_VALUE_LEN_OFFSET, hdr.value_len) &&
              pread_u64(fd, JDB_KEY_COUNT_OFFSET, hdr.key_count);
    ::close(fd);

    if (!ok) {
        std::fprintf(stderr, "JdbHeader: '%s' is too small for a hash table header\n",
                     path.c_str());
        return std::nullopt;
    }
    return hdr;
}

} // namespace kubuild
