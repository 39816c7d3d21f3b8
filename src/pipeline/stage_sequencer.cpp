#include "pipeline/stage_sequencer.hpp"
#include "core/config.hpp"
#include "engine/external_engine.hpp"
#include "io/jdb_header.hpp"
#include "io/sequence_stream.hpp"
#include "planner/parameter_planner.hpp"
#include "pipeline/report_trigger.hpp"
#include "taxonomy/taxdb_sort.hpp"
#include "taxonomy/taxonomy_fetcher.hpp"
#include "util/elapsed_time.hpp"
#include "util/file_util.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace kubuild {

StageSequencer::StageSequencer(const BuildParameters& params, ExternalEngine& engine,
                               const Logger& logger)
    : params_(params), engine_(engine), logger_(logger), paths_(params.db_dir) {}

StageSequencer::~StageSequencer() = default;

Status StageSequencer::run() {
    ElapsedTimer total;

    Status st = prepare();
    if (!st.ok()) return st;

    using StageFn = Status (StageSequencer::*)();
    static const StageFn stages[] = {
        &StageSequencer::count_kmers,
        &StageSequencer::reduce_database,
        &StageSequencer::sort_kmers,
        &StageSequencer::build_seqid_map,
        &StageSequencer::build_taxdb,
        &StageSequencer::build_lca_database,
        &StageSequencer::build_uid_database,
    };
    for (StageFn fn : stages) {
        st = (this->*fn)();
        if (!st.ok()) return st;
    }

    logger_.info("Database construction complete. [Total: %s]", total.elapsed().c_str());
    logger_.info("You can delete all files but database.{kdb,idx} and taxDB now, if you want");
    return Status::success();
}

Status StageSequencer::prepare() {
    if (params_.in_memory())
        logger_.info("Kraken build set to minimize disk writes.");
    else
        logger_.info("Kraken build set to minimize RAM usage.");

    if (params_.rebuild) {
        size_t n = remove_build_artifacts(paths_, logger_);
        logger_.info("Rebuilding database from scratch (%zu old files removed)", n);
    }

    manifest_ = load_or_discover_manifest(paths_.library_manifest(),
                                          params_.library_dirs, logger_);
    if (!manifest_) {
        std::string dirs;
        for (const auto& d : params_.library_dirs) dirs += (dirs.empty() ? "" : " ") + d;
        return Status::fatal_input("no library sequence files found in " + dirs);
    }
    logger_.info("Found %zu sequence files (*.{fna,fa,ffn}) in the library directory.",
                 manifest_->size());
    stream_.reset(new SequenceStream(manifest_->files));

    check_params_file();

    state_ = probe_state(paths_, params_.verify_artifacts, logger_);
    return Status::success();
}

void StageSequencer::check_params_file() {
    const std::string path = paths_.params_file();
    const std::string text = params_.to_text();
    if (file_exists(path) && read_file_string(path) != text) {
        logger_.warn("Build options differ from the previous run (%s); "
                     "finished stages are kept", path.c_str());
    }
    std::string tmp = ArtifactPaths::tmp(path);
    if (!write_file_string(tmp, text) || !rename_file(tmp, path))
        logger_.warn("Cannot write %s", path.c_str());
}

Status StageSequencer::commit(const std::string& tmp, const std::string& canonical) {
    if (!commit_artifact(tmp, canonical, params_.verify_artifacts, logger_))
        return Status::io_error("cannot put " + canonical + " in place");
    return Status::success();
}

// ---------------------------------------------------------------------------
// Step 1: count k-mers
// ---------------------------------------------------------------------------

Status StageSequencer::count_kmers() {
    if (state_.raw_table || state_.sorted_table) {
        logger_.info("Skipping step 1, k-mer set already exists.");
        return Status::success();
    }

    logger_.info("Creating k-mer set (step 1 of 6)...");
    ElapsedTimer timer;

    if (!engine_.counter_available())
        return Status::fatal_input("jellyfish 1.x not found, cannot count k-mers");

    // Stale shards from an interrupted run would be merged in.
    for (const auto& shard : paths_.count_shards()) remove_file(shard);

    uint64_t hash_size = params_.hash_size;
    if (hash_size == 0) {
        hash_size = estimate_hash_size(total_library_bytes(*manifest_));
        logger_.info("Hash size not specified, using '%lu'",
                     static_cast<unsigned long>(hash_size));
    }

    CountRequest req;
    req.k = params_.k;
    req.hash_size = hash_size;
    req.threads = params_.threads;
    req.output_prefix = paths_.shard_prefix();

    EngineResult r = engine_.count(req, *stream_);
    if (!r.ok()) return Status::engine_failure(r.describe());

    std::vector<std::string> shards = paths_.count_shards();
    if (shards.empty())
        return Status::engine_failure(r.tool + " produced no hash table");

    const std::string tmp = ArtifactPaths::tmp(paths_.raw_db());
    if (shards.size() > 1) {
        logger_.info("Merging %zu hash table shards", shards.size());
        r = engine_.merge(shards, tmp);
        if (!r.ok()) return Status::engine_failure(r.describe());
        for (const auto& shard : shards) remove_file(shard);
    } else if (!rename_file(shards[0], tmp)) {
        return Status::io_error("cannot rename " + shards[0] + ": " + std::strerror(errno));
    }

    Status st = commit(tmp, paths_.raw_db());
    if (!st.ok()) return st;
    state_.raw_table = true;

    logger_.info("K-mer set created. [%s]", timer.elapsed().c_str());
    return Status::success();
}

// ---------------------------------------------------------------------------
// Step 2: shrink the k-mer table to the size budget
// ---------------------------------------------------------------------------

Status StageSequencer::reduce_database() {
    if (!params_.max_db_size) {
        logger_.info("Skipping step 2, no database reduction requested.");
        return Status::success();
    }
    if (state_.reduced) {
        logger_.info("Skipping step 2, database reduction already done.");
        return Status::success();
    }
    if (state_.sorted_table) {
        logger_.info("Skipping step 2, k-mer set already sorted.");
        return Status::success();
    }
    if (!state_.raw_table)
        return Status::fatal_input("cannot reduce: " + paths_.raw_db() + " is missing");

    const SizeBudget& budget = *params_.max_db_size;
    const uint64_t kdb_size = file_size(paths_.raw_db());
    const uint64_t idx_size = index_size_bytes(params_.minimizer_len);

    if (!reduction_needed(kdb_size, idx_size, budget)) {
        logger_.info("Skipping step 2, database reduction unnecessary.");
        return Status::success();
    }

    logger_.info("Reducing database size (step 2 of 6)...");
    ElapsedTimer timer;

    int64_t allowance = kdb_byte_allowance(budget, idx_size);
    if (allowance < 0) {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "Maximum database size too small - index alone needs %.2f GB. "
                      "Aborting reduction.",
                      static_cast<double>(idx_size) / static_cast<double>(GIB));
        return Status::fatal_budget(buf);
    }

    auto hdr = read_jdb_header(paths_.raw_db());
    if (!hdr) return Status::io_error("cannot read header of " + paths_.raw_db());
    if (hdr->record_len() == 0)
        return Status::io_error("invalid hash table header in " + paths_.raw_db() +
                                " (zero-length records)");

    uint64_t new_count = 0;
    if (!target_record_count(budget, idx_size, hdr->record_len(), new_count)) {
        return Status::fatal_budget("cannot fit any k-mer record (" +
                                    std::to_string(hdr->record_len()) +
                                    " bytes) in the size budget");
    }
    logger_.debug("Budget %s GiB: %ld bytes for k-mers, record length %lu",
                  budget.to_string().c_str(), static_cast<long>(allowance),
                  static_cast<unsigned long>(hdr->record_len()));
    logger_.info("Shrinking DB to use only %lu of the %lu k-mers",
                 static_cast<unsigned long>(new_count),
                 static_cast<unsigned long>(hdr->key_count));

    EngineResult r = engine_.reduce(paths_.raw_db(), paths_.raw_db_small(), new_count);
    if (!r.ok()) return Status::engine_failure(r.describe());

    // database.jdb -> .big.tmp, .small -> database.jdb, .big.tmp -> .big
    const std::string big_tmp = ArtifactPaths::tmp(paths_.raw_db_big());
    if (!rename_file(paths_.raw_db(), big_tmp))
        return Status::io_error("cannot rename " + paths_.raw_db() + ": " + std::strerror(errno));
    Status st = commit(paths_.raw_db_small(), paths_.raw_db());
    if (!st.ok()) return st;
    st = commit(big_tmp, paths_.raw_db_big());
    if (!st.ok()) return st;
    state_.reduced = true;

    logger_.info("Database reduced. [%s]", timer.elapsed().c_str());
    return Status::success();
}

// ---------------------------------------------------------------------------
// Step 3: sort k-mers and build the minimizer index
// ---------------------------------------------------------------------------

Status StageSequencer::sort_kmers() {
    if (state_.sorted_table) {
        logger_.info("Skipping step 3, k-mer set already sorted.");
        return Status::success();
    }
    if (!state_.raw_table)
        return Status::fatal_input("cannot sort: " + paths_.raw_db() + " is missing");

    logger_.info("Sorting k-mer set (step 3 of 6)...");
    ElapsedTimer timer;

    SortRequest req;
    req.input = paths_.raw_db();
    req.output = ArtifactPaths::tmp(paths_.sorted_db());
    req.index = ArtifactPaths::tmp(paths_.index());
    req.minimizer_len = params_.minimizer_len;
    req.threads = params_.threads;
    req.in_memory = params_.in_memory();

    EngineResult r = engine_.sort(req);
    if (!r.ok()) return Status::engine_failure(r.describe());

    Status st = commit(req.index, paths_.index());
    if (!st.ok()) return st;
    st = commit(req.output, paths_.sorted_db());
    if (!st.ok()) return st;
    state_.sorted_table = true;

    logger_.info("K-mer set sorted. [%s]", timer.elapsed().c_str());
    return Status::success();
}

// ---------------------------------------------------------------------------
// Step 4: seqid -> taxid map from the library's .map sidecars
// ---------------------------------------------------------------------------

Status StageSequencer::build_seqid_map() {
    if (state_.seqid_map) {
        logger_.info("Skipping step 4, seqID to taxID map already complete.");
        return Status::success();
    }

    logger_.info("Creating seqID to taxID map (step 4 of 6)..");
    ElapsedTimer timer;

    std::vector<std::string> maps =
        find_files_with_extensions(params_.library_dirs, {MAP_EXTENSION}, logger_);

    const std::string tmp = ArtifactPaths::tmp(paths_.seqid_map());
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return Status::io_error("cannot open " + tmp + " for writing");

    uint64_t line_ct = 0;
    for (const auto& m : maps) {
        std::string content = read_file_string(m);
        if (content.empty()) continue;
        if (content.back() != '\n') content.push_back('\n');
        for (char c : content)
            if (c == '\n') line_ct++;
        out << content;
    }
    out.close();
    if (out.fail()) return Status::io_error("write error in " + tmp);

    Status st = commit(tmp, paths_.seqid_map());
    if (!st.ok()) return st;
    state_.seqid_map = line_ct > 0;

    if (line_ct == 0)
        logger_.warn("No .map files with seqID to taxID entries found in the library");
    logger_.info("%lu sequences mapped to taxa. [%s]",
                 static_cast<unsigned long>(line_ct), timer.elapsed().c_str());
    return Status::success();
}

// ---------------------------------------------------------------------------
// Step 5: taxonomy records
// ---------------------------------------------------------------------------

Status StageSequencer::build_taxdb() {
    if (state_.taxdb) {
        logger_.info("Skipping step 5, taxDB exists.");
        return Status::success();
    }

    logger_.info("Creating taxDB (step 5 of 6)... ");
    ElapsedTimer timer;

    const std::string& tax_dir = params_.taxonomy_dir;
    if (!taxonomy_dumps_present(tax_dir)) {
        logger_.info("%s or %s does not exist - downloading it ...",
                     names_dmp_path(tax_dir).c_str(), nodes_dmp_path(tax_dir).c_str());
        EngineResult r = engine_.fetch_taxonomy(tax_dir);
        if (!r.ok()) return Status::engine_failure(r.describe());
    }

    const std::string unsorted = ArtifactPaths::tmp(paths_.taxdb_unsorted());
    EngineResult r = engine_.build_taxdb(names_dmp_path(tax_dir), nodes_dmp_path(tax_dir),
                                         unsorted);
    if (!r.ok()) return Status::engine_failure(r.describe());

    const std::string tmp = ArtifactPaths::tmp(paths_.taxdb());
    std::string error;
    if (!sort_taxdb_file(unsorted, tmp, error)) return Status::io_error(error);
    remove_file(unsorted);

    Status st = commit(tmp, paths_.taxdb());
    if (!st.ok()) return st;
    state_.taxdb = file_nonempty(paths_.taxdb());

    logger_.info("taxDB construction finished. [%s]", timer.elapsed().c_str());
    return Status::success();
}

// ---------------------------------------------------------------------------
// Step 6: LCA and UID databases
// ---------------------------------------------------------------------------

Status StageSequencer::check_final_inputs() const {
    std::string missing;
    for (const auto& p : {paths_.sorted_db(), paths_.index(), paths_.taxdb(),
                          paths_.seqid_map()}) {
        if (!file_exists(p)) missing += (missing.empty() ? "" : ", ") + p;
    }
    if (!missing.empty()) return Status::fatal_input("missing build inputs: " + missing);
    return Status::success();
}

Status StageSequencer::restore_original_map() {
    if (!file_exists(paths_.seqid_map_orig())) return Status::success();
    logger_.info("Restoring %s from an interrupted build", paths_.seqid_map().c_str());
    return commit(paths_.seqid_map_orig(), paths_.seqid_map());
}

Status StageSequencer::install_augmented_map(const std::string& plus_tmp) {
    if (!rename_file(paths_.seqid_map(), paths_.seqid_map_orig())) {
        return Status::io_error("cannot rename " + paths_.seqid_map() + ": " +
                                std::strerror(errno));
    }
    return commit(plus_tmp, paths_.seqid_map());
}

static void log_taxid_flags(const TaxidFlags& flags, const Logger& logger) {
    if (flags.for_seq) logger.info(" Adding taxonomy IDs for sequences");
    if (flags.for_genome) logger.info(" Adding taxonomy IDs for genomes");
}

Status StageSequencer::build_lca_database() {
    if (!params_.lca_database) return Status::success();

    if (state_.lca_db) {
        logger_.info("Skipping step 6, LCAs already set.");
    } else {
        Status st = check_final_inputs();
        if (!st.ok()) return st;

        logger_.info("Building standard Kraken LCA database (step 6 of 6)...");
        ElapsedTimer timer;

        const TaxidFlags flags = params_.lca_taxid_flags();
        log_taxid_flags(flags, logger_);
        if (flags.any()) {
            st = restore_original_map();
            if (!st.ok()) return st;
        }

        LcaRequest req;
        req.sorted_db = paths_.sorted_db();
        req.index = paths_.index();
        req.taxdb = paths_.taxdb();
        req.seqid_map = paths_.seqid_map();
        req.output_db = ArtifactPaths::tmp(paths_.lca_db());
        req.kmer_count = ArtifactPaths::tmp(paths_.lca_kmer_count());
        req.stdout_path = ArtifactPaths::tmp(paths_.seqid_map_plus());
        req.add_taxids_for_seq = flags.for_seq;
        req.add_taxids_for_genome = flags.for_genome;
        req.threads = params_.threads;
        req.in_memory = params_.in_memory();

        EngineResult r = engine_.set_lcas(req, *stream_);
        if (!r.ok()) return Status::engine_failure(r.describe());

        if (flags.any()) {
            st = install_augmented_map(req.stdout_path);
            if (!st.ok()) return st;
        } else {
            remove_file(req.stdout_path);
        }
        if (file_exists(req.kmer_count)) {
            st = commit(req.kmer_count, paths_.lca_kmer_count());
            if (!st.ok()) return st;
        } else {
            logger_.warn("%s did not write k-mer counts", r.tool.c_str());
        }
        // The database goes in place last: it marks the step as done.
        st = commit(req.output_db, paths_.lca_db());
        if (!st.ok()) return st;
        state_.lca_db = true;

        logger_.info("LCA database created. [%s]", timer.elapsed().c_str());
    }

    ReportTarget target;
    target.label = "LCA";
    target.db_dir = paths_.db_dir();
    target.report_path = paths_.lca_report();
    target.classification = paths_.lca_classification();
    return trigger_report(target, params_.threads, params_.verify_artifacts,
                          state_.lca_report, engine_, *stream_, logger_);
}

Status StageSequencer::build_uid_database() {
    if (!params_.uid_database) return Status::success();

    if (state_.uid_db) {
        logger_.info("Skipping step 6.3, UID database already generated.");
    } else {
        Status st = check_final_inputs();
        if (!st.ok()) return st;

        logger_.info("Building UID database (step 6.3 of 6)...");
        ElapsedTimer timer;

        // Resolved once with the LCA flags: empty when the LCA run augmented.
        const TaxidFlags flags = params_.uid_taxid_flags();
        log_taxid_flags(flags, logger_);
        if (flags.any()) {
            st = restore_original_map();
            if (!st.ok()) return st;
        }

        LcaRequest req;
        req.sorted_db = paths_.sorted_db();
        req.index = paths_.index();
        req.taxdb = paths_.taxdb();
        req.seqid_map = paths_.seqid_map();
        req.uid_map = ArtifactPaths::tmp(paths_.uid_map());
        req.output_db = ArtifactPaths::tmp(paths_.uid_db());
        req.kmer_count = ArtifactPaths::tmp(paths_.uid_kmer_count());
        if (flags.any()) req.stdout_path = ArtifactPaths::tmp(paths_.seqid_map_plus());
        req.add_taxids_for_seq = flags.for_seq;
        req.add_taxids_for_genome = flags.for_genome;
        req.threads = params_.threads;
        req.in_memory = params_.in_memory();

        EngineResult r = engine_.set_lcas(req, *stream_);
        if (!r.ok()) return Status::engine_failure(r.describe());

        if (flags.any()) {
            st = install_augmented_map(req.stdout_path);
            if (!st.ok()) return st;
        }
        for (const auto& pair : {std::make_pair(req.uid_map, paths_.uid_map()),
                                 std::make_pair(req.kmer_count, paths_.uid_kmer_count())}) {
            if (!file_exists(pair.first)) {
                logger_.warn("%s did not write %s", r.tool.c_str(), pair.second.c_str());
                continue;
            }
            st = commit(pair.first, pair.second);
            if (!st.ok()) return st;
        }
        st = commit(req.output_db, paths_.uid_db());
        if (!st.ok()) return st;

        const std::string sentinel_tmp = ArtifactPaths::tmp(paths_.uid_sentinel());
        if (!write_file_string(sentinel_tmp, ""))
            return Status::io_error("cannot write " + sentinel_tmp);
        // The sentinel itself is never verified; the database is.
        st = commit(sentinel_tmp, paths_.uid_sentinel());
        if (!st.ok()) return st;
        state_.uid_db = true;

        logger_.info("UID database created. [%s]", timer.elapsed().c_str());
    }

    ReportTarget target;
    target.label = "UID";
    target.db_dir = paths_.db_dir();
    target.report_path = paths_.uid_report();
    target.classification = paths_.uid_classification();
    return trigger_report(target, params_.threads, params_.verify_artifacts,
                          state_.uid_report, engine_, *stream_, logger_);
}

} // namespace kubuild
