#pragma once

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace kubuild {

// Lazy, restartable concatenation of the library files: reading yields the
// bytes of files[0], then files[1], ... Files are opened one at a time on
// demand. reset() rewinds to the start of the first file so the same stream
// can be handed to several engines in one run.
class SequenceStream {
public:
    explicit SequenceStream(std::vector<std::string> files);
    ~SequenceStream();

    SequenceStream(const SequenceStream&) = delete;
    SequenceStream& operator=(const SequenceStream&) = delete;

    void reset();

    // Read up to n bytes. Returns 0 at end of stream or on error
    // (check failed()).
    size_t read(char* buf, size_t n);

    // Copy the rest of the stream to a file descriptor. Returns false on a
    // read error or a write error (EPIPE when the reader went away).
    bool write_all(int fd);

    bool failed() const { return !error_.empty(); }
    const std::string& error() const { return error_; }

    size_t num_files() const { return files_.size(); }
    const std::vector<std::string>& files() const { return files_; }

private:
    std::vector<std::string> files_;
    size_t next_file_ = 0;
    FILE* cur_ = nullptr;
    std::string error_;

    bool open_next();
    void close_current();
};

} // namespace kubuild
