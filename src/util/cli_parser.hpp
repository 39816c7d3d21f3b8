#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace kubuild {

// Command-line parser for -key value style arguments.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Get string value for a key. Returns default_val if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Get all values given for a repeatable key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    const std::string& program() const { return program_; }

    // Positional arguments (those not preceded by a -key).
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

// Parse a non-negative decimal integer with no sign, suffix or whitespace.
bool parse_uint64(const std::string& s, uint64_t& value);

} // namespace kubuild
