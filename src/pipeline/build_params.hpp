#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/status.hpp"
#include "util/size_parser.hpp"

namespace kubuild {

class CliParser;

// Taxid augmentation flags passed to set_lcas (-a / -A).
struct TaxidFlags {
    bool for_seq = false;
    bool for_genome = false;

    bool any() const { return for_seq || for_genome; }
};

// Resolved configuration of one run. Immutable after resolve_build_params().
struct BuildParameters {
    std::string db_dir;                     // absolute, canonical
    std::vector<std::string> library_dirs;  // absolute
    std::string taxonomy_dir;               // absolute
    std::string bin_dir;                    // engine search dir, "" = $PATH only
    std::string jellyfish_bin;              // explicit counter, "" = search

    int k = 0;
    int minimizer_len = 0;
    uint64_t hash_size = 0;                 // 0 = estimate from library size
    int threads = 1;
    std::optional<SizeBudget> max_db_size;  // GiB; unset = no reduction

    bool work_on_disk = false;              // false = minimize disk writes (-M)
    bool rebuild = false;
    bool add_taxids_for_seq = false;
    bool add_taxids_for_genome = false;
    bool lca_database = true;
    bool uid_database = true;
    bool verify_artifacts = false;

    bool in_memory() const { return !work_on_disk; }

    // Flags for the LCA sub-pipeline: as requested.
    TaxidFlags lca_taxid_flags() const;

    // Flags for the UID sub-pipeline: as requested when the LCA sub-pipeline
    // is disabled, none otherwise (the LCA run already augmented the map).
    TaxidFlags uid_taxid_flags() const;

    // Canonical "key=value" lines, used to detect changed options on resume.
    std::string to_text() const;
};

// Source of KRAKEN_* settings; the default reads the process environment.
class EnvSource {
public:
    virtual ~EnvSource() = default;
    // Returns "" for unset variables.
    virtual std::string get(const std::string& name) const;
};

// Resolve parameters from the environment, then command-line overrides.
// Returns empty optional and sets status on invalid or missing settings:
// FatalInput for a missing database directory, Usage otherwise.
std::optional<BuildParameters> resolve_build_params(const CliParser& cli,
                                                    const EnvSource& env,
                                                    Status& status);

} // namespace kubuild
