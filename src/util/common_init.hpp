#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <optional>

// KUBUILD_VERSION comes from the generated core/version.hpp, which must be
// included first.

namespace kubuild {

using UsagePrinter = void (*)(const char* prog);

// --version and -h / --help end the program before any option is resolved.
// Returns the exit status when one of them was given.
inline std::optional<int> handle_info_flags(const CliParser& cli, const char* prog,
                                            UsagePrinter usage) {
    if (cli.has("--version")) {
        std::fprintf(stdout, "kubuild %s\n", KUBUILD_VERSION);
        return 0;
    }
    if (cli.has("-h") || cli.has("--help")) {
        usage(prog);
        return 0;
    }
    return std::nullopt;
}

// -q keeps warnings and errors, -v adds engine command lines.
// -v wins when both are given.
inline Logger::Level log_level_from(const CliParser& cli) {
    if (cli.has("-v") || cli.has("--verbose")) return Logger::kDebug;
    if (cli.has("-q") || cli.has("--quiet")) return Logger::kWarn;
    return Logger::kInfo;
}

} // namespace kubuild
