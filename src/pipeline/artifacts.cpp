#include "pipeline/artifacts.hpp"
#include "util/file_util.hpp"
#include "util/logger.hpp"
#include "util/sha256.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <regex>
#include <utility>

namespace kubuild {

ArtifactPaths::ArtifactPaths(const std::string& db_dir) : db_dir_(db_dir) {}

std::string ArtifactPaths::at(const std::string& name) const {
    return path_join(db_dir_, name);
}

std::string ArtifactPaths::report_base() const {
    return basename_of(db_dir_);
}

static const std::regex& shard_pattern() {
    static const std::regex re("database_(\\d+)");
    return re;
}

std::vector<std::string> ArtifactPaths::count_shards() const {
    std::vector<std::pair<unsigned long, std::string>> shards;
    for (const auto& name : list_directory(db_dir_)) {
        std::smatch m;
        if (std::regex_match(name, m, shard_pattern()))
            shards.emplace_back(std::stoul(m[1].str()), at(name));
    }
    std::sort(shards.begin(), shards.end());

    std::vector<std::string> out;
    out.reserve(shards.size());
    for (auto& s : shards) out.push_back(std::move(s.second));
    return out;
}

bool verify_artifact(const std::string& path, const Logger& logger) {
    std::string side = ArtifactPaths::sidecar(path);
    if (!file_exists(side)) {
        logger.debug("No checksum for %s, trusting it", path.c_str());
        return true;
    }

    std::string expected = read_file_string(side);
    while (!expected.empty() && (expected.back() == '\n' || expected.back() == '\r'))
        expected.pop_back();
    std::string actual = sha256_file(path);
    if (!actual.empty() && actual == expected) return true;

    logger.warn("%s does not match its checksum, discarding it", path.c_str());
    remove_file(path);
    remove_file(side);
    return false;
}

// Stage 2 moves database.jdb aside as database.jdb.big.tmp, puts the reduced
// table in its place, then commits database.jdb.big. An interruption between
// those renames is settled here so the state below reflects a whole step.
static void recover_interrupted_reduction(const ArtifactPaths& paths, bool verify,
                                          const Logger& logger) {
    const std::string big_tmp = ArtifactPaths::tmp(paths.raw_db_big());
    if (!file_exists(big_tmp)) return;

    if (!file_exists(paths.raw_db())) {
        // Reduced table never reached its place: put the full one back.
        if (!rename_file(big_tmp, paths.raw_db())) {
            logger.error("Cannot restore %s: %s", paths.raw_db().c_str(), std::strerror(errno));
            return;
        }
        remove_file(paths.raw_db_small());
        logger.warn("Restored %s from an interrupted reduction", paths.raw_db().c_str());
    } else if (!file_exists(paths.raw_db_big())) {
        // Reduced table already in place: finish moving the full one.
        if (commit_artifact(big_tmp, paths.raw_db_big(), verify, logger))
            logger.warn("Completed an interrupted reduction (%s)", paths.raw_db_big().c_str());
    }
}

PipelineState probe_state(const ArtifactPaths& paths, bool verify, const Logger& logger) {
    recover_interrupted_reduction(paths, verify, logger);

    auto present = [&](const std::string& path, bool need_nonempty) {
        bool ok = need_nonempty ? file_nonempty(path) : file_exists(path);
        if (ok && verify) ok = verify_artifact(path, logger);
        return ok;
    };

    PipelineState s;
    s.raw_table = present(paths.raw_db(), false);
    s.reduced = present(paths.raw_db_big(), false);
    s.sorted_table = present(paths.sorted_db(), false);
    if (s.sorted_table && verify && file_exists(paths.index()) &&
        !verify_artifact(paths.index(), logger)) {
        // Sorted table and index are produced together.
        remove_file(paths.sorted_db());
        remove_file(ArtifactPaths::sidecar(paths.sorted_db()));
        s.sorted_table = false;
    }
    s.seqid_map = present(paths.seqid_map(), true);
    s.taxdb = present(paths.taxdb(), true);
    s.lca_db = present(paths.lca_db(), false);
    s.uid_db = present(paths.uid_sentinel(), false);
    if (s.uid_db && verify && !verify_artifact(paths.uid_db(), logger)) {
        remove_file(paths.uid_sentinel());
        s.uid_db = false;
    }
    s.lca_report = file_nonempty(paths.lca_report());
    s.uid_report = file_nonempty(paths.uid_report());
    return s;
}

bool commit_artifact(const std::string& tmp, const std::string& canonical,
                     bool seal, const Logger& logger) {
    if (!rename_file(tmp, canonical)) {
        logger.error("Cannot rename %s to %s: %s", tmp.c_str(), canonical.c_str(),
                     std::strerror(errno));
        return false;
    }

    std::string side = ArtifactPaths::sidecar(canonical);
    if (!seal) {
        remove_file(side);
        return true;
    }

    std::string sha = sha256_file(canonical);
    if (sha.empty() || !write_file_string(side, sha + "\n")) {
        // An unsealed artifact is still valid; it is trusted unverified.
        logger.warn("Cannot write checksum %s", side.c_str());
        remove_file(side);
    }
    return true;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

size_t remove_build_artifacts(const ArtifactPaths& paths, const Logger& logger) {
    const std::string base = paths.report_base();
    const std::vector<std::string> reports = {
        base + ".report", base + ".kraken", base + ".uid_report", base + ".uid_kraken"};

    size_t removed = 0;
    for (const auto& name : list_directory(paths.db_dir())) {
        bool doomed =
            starts_with(name, "database.") ||
            starts_with(name, "database0.kdb") ||
            std::regex_match(name, shard_pattern()) ||
            ends_with(name, ".map") || ends_with(name, ".map.orig") ||
            name == "lca.complete" ||
            name == "library-files.txt" ||
            starts_with(name, "uid_database.") ||
            starts_with(name, "taxDB") ||
            ends_with(name, ".tmp") ||
            ends_with(name, ".sha256") ||
            std::find(reports.begin(), reports.end(), name) != reports.end();
        if (!doomed) continue;

        std::string full = path_join(paths.db_dir(), name);
        if (!dir_exists(full) && remove_file(full)) {
            logger.debug("Removed %s", full.c_str());
            removed++;
        }
    }
    return removed;
}

} // namespace kubuild
