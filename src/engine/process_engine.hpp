#pragma once

#include <string>
#include <vector>

#include "engine/external_engine.hpp"
#include "engine/process_runner.hpp"

namespace kubuild {

class Logger;

struct ProcessEngineConfig {
    std::vector<std::string> search_dirs;  // checked before $PATH
    std::string working_dir;               // database directory
    std::string jellyfish_bin;             // explicit counter path, "" = search
    std::string shrink_bin   = "db_shrink";
    std::string sort_bin     = "db_sort";
    std::string taxdb_bin    = "build_taxdb";
    std::string lca_bin      = "set_lcas";
    std::string classify_bin = "krakenu";
    std::string tar_bin      = "tar";
    std::string taxonomy_url;              // taxdump archive location
};

// ExternalEngine backed by child processes.
class ProcessEngine : public ExternalEngine {
public:
    ProcessEngine(const ProcessEngineConfig& cfg, const Logger& logger);

    bool counter_available() const override { return !jellyfish_.empty(); }
    const std::string& counter_path() const { return jellyfish_; }

    EngineResult count(const CountRequest& req, SequenceStream& seqs) override;
    EngineResult merge(const std::vector<std::string>& shards,
                       const std::string& output) override;
    EngineResult reduce(const std::string& input, const std::string& output,
                        uint64_t record_count) override;
    EngineResult sort(const SortRequest& req) override;
    EngineResult build_taxdb(const std::string& names_dmp,
                             const std::string& nodes_dmp,
                             const std::string& output) override;
    EngineResult set_lcas(const LcaRequest& req, SequenceStream& seqs) override;
    EngineResult classify(const ClassifyRequest& req, SequenceStream& seqs) override;
    EngineResult fetch_taxonomy(const std::string& taxonomy_dir) override;

private:
    ProcessEngineConfig cfg_;
    const Logger& logger_;
    ProcessRunner runner_;
    std::string jellyfish_;

    // Resolve a tool name against the search dirs and $PATH; falls back to
    // the bare name so the runner reports it as not found.
    std::string tool_path(const std::string& name) const;
    EngineResult run(std::vector<std::string> argv,
                     const std::string& stdout_path = {},
                     SequenceStream* stream = nullptr);
};

// Locate the jellyfish 1.x counter: explicit path, else jellyfish1, else
// jellyfish in search_dirs / $PATH. Returns "" if none is found.
std::string locate_jellyfish(const std::string& explicit_path,
                             const std::vector<std::string>& search_dirs);

} // namespace kubuild
