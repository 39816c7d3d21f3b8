#pragma once

#include <string>
#include <vector>

#include "engine/external_engine.hpp"

namespace kubuild {

class Logger;
class SequenceStream;

// One child process invocation.
struct ProcessSpec {
    // argv[0] is the executable path (or a name resolved through $PATH).
    // An element equal to ProcessRunner::kStreamArg is replaced by a
    // /dev/fd/N path from which the child reads the sequence stream.
    std::vector<std::string> argv;
    std::string working_dir;     // "" = inherit
    std::string stdout_path;     // "" = inherit; otherwise truncated and written
    SequenceStream* stream = nullptr;
};

// fork/exec/waitpid runner. Single-threaded use only.
class ProcessRunner {
public:
    static constexpr const char* kStreamArg = "@sequence-stream";

    explicit ProcessRunner(const Logger& logger) : logger_(logger) {}

    // Run to completion. The stream (if any) is rewound and written into the
    // child's pipe from this process, then the child is reaped.
    EngineResult run(const ProcessSpec& spec) const;

private:
    const Logger& logger_;
};

// Join argv for log output, e.g. "db_sort -z -t 4 ...".
std::string format_command(const std::vector<std::string>& argv);

// Search dirs, then $PATH, for an executable file named name.
// Returns "" if not found. A name containing '/' is checked as is.
std::string find_executable(const std::string& name,
                            const std::vector<std::string>& search_dirs);

} // namespace kubuild
