#include "io/sequence_stream.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace kubuild {

SequenceStream::SequenceStream(std::vector<std::string> files)
    : files_(std::move(files)) {}

SequenceStream::~SequenceStream() {
    close_current();
}

void SequenceStream::close_current() {
    if (cur_) {
        std::fclose(cur_);
        cur_ = nullptr;
    }
}

void SequenceStream::reset() {
    close_current();
    next_file_ = 0;
    error_.clear();
}

bool SequenceStream::open_next() {
    close_current();
    if (next_file_ >= files_.size()) return false;

    const std::string& path = files_[next_file_++];
    cur_ = std::fopen(path.c_str(), "rb");
    if (!cur_) {
        error_ = "cannot open '" + path + "': " + std::strerror(errno);
        return false;
    }
    return true;
}

size_t SequenceStream::read(char* buf, size_t n) {
    if (failed() || n == 0) return 0;

    for (;;) {
        if (!cur_ && !open_next()) return 0;

        size_t got = std::fread(buf, 1, n, cur_);
        if (got > 0) return got;

        if (std::ferror(cur_)) {
            error_ = "read error in '" + files_[next_file_ - 1] + "'";
            close_current();
            return 0;
        }
        // EOF on this file; move on.
        close_current();
    }
}

bool SequenceStream::write_all(int fd) {
    char buf[1 << 16];
    for (;;) {
        size_t got = read(buf, sizeof(buf));
        if (got == 0) return !failed();

        size_t off = 0;
        while (off < got) {
            ssize_t w = ::write(fd, buf + off, got - off);
            if (w < 0) {
                if (errno == EINTR) continue;
                error_ = std::string("write to engine failed: ") + std::strerror(errno);
                return false;
            }
            off += static_cast<size_t>(w);
        }
    }
}

} // namespace kubuild
