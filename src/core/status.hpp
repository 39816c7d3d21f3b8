#pragma once

#include <string>
#include <utility>

namespace kubuild {

enum class ErrorKind {
    kOk = 0,
    kUsage,          // missing or malformed option values
    kFatalInput,     // missing db dir, empty library, missing engine binary
    kFatalBudget,    // minimizer index alone exceeds the size budget
    kEngineFailure,  // an external engine returned a failure status
    kIoError,        // a local file operation of the driver itself failed
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kOk:            return "ok";
        case ErrorKind::kUsage:         return "usage";
        case ErrorKind::kFatalInput:    return "fatal input";
        case ErrorKind::kFatalBudget:   return "fatal budget";
        case ErrorKind::kEngineFailure: return "engine failure";
        case ErrorKind::kIoError:       return "I/O error";
    }
    return "unknown";
}

// Outcome of a pipeline stage. Every non-OK status is terminal for the run.
struct Status {
    ErrorKind kind = ErrorKind::kOk;
    std::string message;

    bool ok() const { return kind == ErrorKind::kOk; }

    static Status success() { return {}; }
    static Status usage(std::string msg) {
        return {ErrorKind::kUsage, std::move(msg)};
    }
    static Status fatal_input(std::string msg) {
        return {ErrorKind::kFatalInput, std::move(msg)};
    }
    static Status fatal_budget(std::string msg) {
        return {ErrorKind::kFatalBudget, std::move(msg)};
    }
    static Status engine_failure(std::string msg) {
        return {ErrorKind::kEngineFailure, std::move(msg)};
    }
    static Status io_error(std::string msg) {
        return {ErrorKind::kIoError, std::move(msg)};
    }
};

} // namespace kubuild
