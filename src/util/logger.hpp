#pragma once

#include <cstdarg>
#include <cstdio>

namespace kubuild {

// Build progress logger. Lines go to stderr unless another sink is given
// (tests pass a tmpfile() to inspect them), formatted "[TAG] message".
// Each line is flushed so progress interleaves correctly with the output
// of the engines, which share the terminal.
class Logger {
public:
    enum Level { kQuiet = -1, kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* sink = nullptr)
        : level_(level), sink_(sink) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        write(kError, fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        write(kWarn, fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        write(kInfo, fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        write(kDebug, fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::FILE* sink_;

    void write(Level at, const char* fmt, va_list ap) const {
        if (level_ < at) return;
        static const char* const tags[] = {"ERROR", "WARN", "INFO", "DEBUG"};
        std::FILE* out = sink_ ? sink_ : stderr;
        std::fprintf(out, "[%s] ", tags[at]);
        std::vfprintf(out, fmt, ap);
        std::fputc('\n', out);
        std::fflush(out);
    }
};

} // namespace kubuild
