#include "util/cli_parser.hpp"

#include <cerrno>
#include <cstdlib>

namespace kubuild {

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // --key=value
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            if (i + 1 < argc && argv[i + 1][0] != '-') {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back("1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                   const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

bool parse_uint64(const std::string& s, uint64_t& value) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno == ERANGE || end == s.c_str() || *end != '\0') return false;
    value = static_cast<uint64_t>(v);
    return true;
}

} // namespace kubuild
