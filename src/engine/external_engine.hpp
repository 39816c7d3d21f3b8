#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kubuild {

class SequenceStream;

// Outcome of one external engine invocation.
struct EngineResult {
    std::string tool;         // binary or capability that ran
    int exit_code = 0;        // exit status when the process exited
    int term_signal = 0;      // signal number when it was killed, else 0
    std::string message;      // launch or I/O failure detail, else empty

    bool ok() const { return exit_code == 0 && term_signal == 0 && message.empty(); }

    // e.g. "db_sort exited with status 2", "set_lcas killed by signal 9"
    std::string describe() const;

    static EngineResult success(std::string tool) {
        EngineResult r;
        r.tool = std::move(tool);
        return r;
    }
    static EngineResult failure(std::string tool, std::string message) {
        EngineResult r;
        r.tool = std::move(tool);
        r.exit_code = -1;
        r.message = std::move(message);
        return r;
    }
};

struct CountRequest {
    int k = 0;
    uint64_t hash_size = 0;
    int threads = 1;
    std::string output_prefix;   // shards are written as <prefix>_0, _1, ...
};

struct SortRequest {
    std::string input;           // raw hash table
    std::string output;          // sorted table
    std::string index;           // minimizer index
    int minimizer_len = 0;
    int threads = 1;
    bool in_memory = true;
};

struct LcaRequest {
    std::string sorted_db;
    std::string index;
    std::string taxdb;
    std::string seqid_map;
    std::string output_db;
    std::string kmer_count;
    std::string uid_map;         // non-empty for the UID-indexed variant
    std::string stdout_path;     // receives the augmented seqid map; "" = inherit
    bool add_taxids_for_seq = false;
    bool add_taxids_for_genome = false;
    int threads = 1;
    bool in_memory = true;
};

struct ClassifyRequest {
    std::string db_dir;
    std::string report_path;
    std::string output_path;     // classification output (stdout)
    int threads = 1;
};

// Capability interface over the external build engines. Every method
// blocks until the engine finishes. Implementations must not leave output
// at a path the caller treats as canonical; callers pass temporary paths.
class ExternalEngine {
public:
    virtual ~ExternalEngine() = default;

    // Whether the k-mer counter can be run at all.
    virtual bool counter_available() const = 0;

    virtual EngineResult count(const CountRequest& req, SequenceStream& seqs) = 0;
    virtual EngineResult merge(const std::vector<std::string>& shards,
                               const std::string& output) = 0;
    virtual EngineResult reduce(const std::string& input, const std::string& output,
                                uint64_t record_count) = 0;
    virtual EngineResult sort(const SortRequest& req) = 0;
    virtual EngineResult build_taxdb(const std::string& names_dmp,
                                     const std::string& nodes_dmp,
                                     const std::string& output) = 0;
    virtual EngineResult set_lcas(const LcaRequest& req, SequenceStream& seqs) = 0;
    virtual EngineResult classify(const ClassifyRequest& req, SequenceStream& seqs) = 0;

    // Download and unpack names.dmp / nodes.dmp into taxonomy_dir.
    virtual EngineResult fetch_taxonomy(const std::string& taxonomy_dir) = 0;
};

} // namespace kubuild
