#pragma once

#include <string>
#include <vector>

namespace kubuild {

class Logger;

// Canonical artifact locations inside a database directory.
class ArtifactPaths {
public:
    explicit ArtifactPaths(const std::string& db_dir);

    const std::string& db_dir() const { return db_dir_; }

    std::string library_manifest() const { return at("library-files.txt"); }
    std::string shard_prefix() const { return at("database"); }   // database_N
    std::string raw_db() const { return at("database.jdb"); }
    std::string raw_db_small() const { return at("database.jdb.small"); }
    std::string raw_db_big() const { return at("database.jdb.big"); }
    std::string sorted_db() const { return at("database0.kdb"); }
    std::string index() const { return at("database.idx"); }
    std::string seqid_map() const { return at("seqid2taxid.map"); }
    std::string seqid_map_orig() const { return at("seqid2taxid.map.orig"); }
    std::string seqid_map_plus() const { return at("seqid2taxid-plus.map"); }
    std::string taxdb() const { return at("taxDB"); }
    std::string taxdb_unsorted() const { return at("taxDB.unsorted"); }
    std::string lca_db() const { return at("database.kdb"); }
    std::string lca_kmer_count() const { return at("database.kmer_count"); }
    std::string uid_db() const { return at("uid_database.kdb"); }
    std::string uid_kmer_count() const { return at("uid_database.kmer_count"); }
    std::string uid_map() const { return at("uid_to_taxid.map"); }
    std::string uid_sentinel() const { return at("uid_database.complete"); }
    std::string params_file() const { return at("build_params.txt"); }

    // Reports are named after the database directory, e.g. "/dbs/refseq"
    // -> refseq.report, refseq.kraken, refseq.uid_report, refseq.uid_kraken
    std::string report_base() const;
    std::string lca_report() const { return at(report_base() + ".report"); }
    std::string lca_classification() const { return at(report_base() + ".kraken"); }
    std::string uid_report() const { return at(report_base() + ".uid_report"); }
    std::string uid_classification() const { return at(report_base() + ".uid_kraken"); }

    // Shards left by the counter (database_0, database_1, ...), ordered by
    // shard number.
    std::vector<std::string> count_shards() const;

    static std::string tmp(const std::string& path) { return path + ".tmp"; }
    static std::string sidecar(const std::string& path) { return path + ".sha256"; }

private:
    std::string db_dir_;
    std::string at(const std::string& name) const;
};

// Which stages are already complete, probed once at startup and then
// updated by the stages as they finish.
struct PipelineState {
    bool raw_table = false;      // database.jdb
    bool reduced = false;        // database.jdb.big
    bool sorted_table = false;   // database0.kdb (+ database.idx)
    bool seqid_map = false;      // seqid2taxid.map, non-empty
    bool taxdb = false;          // taxDB, non-empty
    bool lca_db = false;         // database.kdb
    bool uid_db = false;         // uid_database.complete
    bool lca_report = false;     // <name>.report, non-empty
    bool uid_report = false;     // <name>.uid_report, non-empty
};

// Probe artifact presence. With verify set, an artifact whose .sha256
// sidecar does not match its content is deleted and reported as absent.
// Renames left half done by an interrupted reduction are settled first.
PipelineState probe_state(const ArtifactPaths& paths, bool verify, const Logger& logger);

// Rename tmp to canonical. With seal set, write canonical's .sha256 sidecar;
// otherwise remove any stale sidecar. Returns false (after logging) on
// failure.
bool commit_artifact(const std::string& tmp, const std::string& canonical,
                     bool seal, const Logger& logger);

// Compare a file with its sidecar. A file without a sidecar passes.
// A mismatching file and its sidecar are deleted.
bool verify_artifact(const std::string& path, const Logger& logger);

// Delete every artifact a full rebuild must regenerate: database.*,
// database0.kdb, database_N shards, *.map (+ .orig), lca.complete,
// library-files.txt, uid_database.*, taxDB*, reports, *.tmp and .sha256 sidecars.
// Returns the number of files removed.
size_t remove_build_artifacts(const ArtifactPaths& paths, const Logger& logger);

} // namespace kubuild
