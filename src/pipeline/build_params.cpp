#include "pipeline/build_params.hpp"
#include "core/config.hpp"
#include "util/cli_parser.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace kubuild {

TaxidFlags BuildParameters::lca_taxid_flags() const {
    return {add_taxids_for_seq, add_taxids_for_genome};
}

TaxidFlags BuildParameters::uid_taxid_flags() const {
    if (lca_database) return {};
    return {add_taxids_for_seq, add_taxids_for_genome};
}

std::string BuildParameters::to_text() const {
    std::ostringstream oss;
    oss << "k=" << k << "\n";
    oss << "minimizer_len=" << minimizer_len << "\n";
    oss << "hash_size=" << hash_size << "\n";
    oss << "max_db_size=" << (max_db_size ? max_db_size->to_string() : "") << "\n";
    oss << "work_on_disk=" << (work_on_disk ? 1 : 0) << "\n";
    oss << "add_taxids_for_seq=" << (add_taxids_for_seq ? 1 : 0) << "\n";
    oss << "add_taxids_for_genome=" << (add_taxids_for_genome ? 1 : 0) << "\n";
    oss << "lca_database=" << (lca_database ? 1 : 0) << "\n";
    oss << "uid_database=" << (uid_database ? 1 : 0) << "\n";
    for (const auto& d : library_dirs) oss << "library_dir=" << d << "\n";
    oss << "taxonomy_dir=" << taxonomy_dir << "\n";
    return oss.str();
}

std::string EnvSource::get(const std::string& name) const {
    const char* v = std::getenv(name.c_str());
    return v ? std::string(v) : std::string();
}

// Split on blanks, as the shell does for an unquoted $KRAKEN_LIBRARY_DIRS.
static std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

static std::string resolve_against(const std::string& base, const std::string& p) {
    std::filesystem::path path(p);
    if (path.is_absolute()) return path.lexically_normal().string();
    return (std::filesystem::path(base) / path).lexically_normal().string();
}

static std::string absolute_from_cwd(const std::string& p) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(p, ec);
    if (ec) return p;
    std::string out = abs.lexically_normal().string();
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

// Integer setting: CLI value wins over the environment variable.
static bool resolve_uint(const CliParser& cli, const EnvSource& env,
                         const std::string& key, const std::string& var,
                         uint64_t& value, std::string& error) {
    std::string text = cli.has(key) ? cli.get_string(key) : env.get(var);
    if (text.empty()) return true;
    if (!parse_uint64(text, value)) {
        error = "invalid " + key + " / " + var + " value '" + text + "'";
        return false;
    }
    return true;
}

// Toggle that is on unless set to "0" (LCA / UID database switches).
static bool resolve_enabled(const CliParser& cli, const EnvSource& env,
                            const std::string& key, const std::string& var) {
    std::string text = cli.has(key) ? cli.get_string(key) : env.get(var);
    return text != "0";
}

// Toggle that is on only when set to "1" (or given as a bare CLI flag).
static bool resolve_flag(const CliParser& cli, const EnvSource& env,
                         const std::string& key, const std::string& var) {
    if (cli.has(key)) return cli.get_string(key) == "1";
    return env.get(var) == "1";
}

std::optional<BuildParameters> resolve_build_params(const CliParser& cli,
                                                    const EnvSource& env,
                                                    Status& status) {
    namespace fs = std::filesystem;
    BuildParameters p;
    std::string error;

    std::string db = cli.has("-db") ? cli.get_string("-db") : env.get("KRAKEN_DB_NAME");
    if (db.empty()) {
        status = Status::usage("database directory not given (-db or KRAKEN_DB_NAME)");
        return std::nullopt;
    }
    std::error_code ec;
    fs::path canon = fs::canonical(db, ec);
    if (ec || !fs::is_directory(canon, ec)) {
        status = Status::fatal_input("Can't find Kraken DB directory \"" + db + "\"");
        return std::nullopt;
    }
    p.db_dir = canon.string();

    std::vector<std::string> libs = cli.get_strings("-library");
    if (libs.empty()) libs = split_words(env.get("KRAKEN_LIBRARY_DIRS"));
    if (libs.empty()) libs.push_back("library");
    for (const auto& l : libs) p.library_dirs.push_back(resolve_against(p.db_dir, l));

    std::string tax = cli.has("-taxonomy") ? cli.get_string("-taxonomy")
                                           : env.get("KRAKEN_TAXONOMY_DIR");
    if (tax.empty()) tax = "taxonomy";
    p.taxonomy_dir = resolve_against(p.db_dir, tax);

    uint64_t k = DEFAULT_K;
    uint64_t m = DEFAULT_MINIMIZER_LEN;
    uint64_t threads = DEFAULT_THREADS;
    if (!resolve_uint(cli, env, "-k", "KRAKEN_KMER_LEN", k, error) ||
        !resolve_uint(cli, env, "-minimizer", "KRAKEN_MINIMIZER_LEN", m, error) ||
        !resolve_uint(cli, env, "-threads", "KRAKEN_THREAD_CT", threads, error) ||
        !resolve_uint(cli, env, "-hash_size", "KRAKEN_HASH_SIZE", p.hash_size, error)) {
        status = Status::usage(error);
        return std::nullopt;
    }

    if (k < static_cast<uint64_t>(MIN_K) || k > static_cast<uint64_t>(MAX_K)) {
        status = Status::usage("k-mer length must be between " + std::to_string(MIN_K) +
                               " and " + std::to_string(MAX_K));
        return std::nullopt;
    }
    uint64_t max_m = std::min<uint64_t>(k, MAX_MINIMIZER_LEN);
    if (m < 1 || m > max_m) {
        status = Status::usage("minimizer length must be between 1 and " +
                               std::to_string(max_m));
        return std::nullopt;
    }
    if (threads < 1 || threads > 4096) {
        status = Status::usage("thread count must be between 1 and 4096");
        return std::nullopt;
    }
    p.k = static_cast<int>(k);
    p.minimizer_len = static_cast<int>(m);
    p.threads = static_cast<int>(threads);

    std::string budget = cli.has("-max_db_size") ? cli.get_string("-max_db_size")
                                                 : env.get("KRAKEN_MAX_DB_SIZE");
    if (!budget.empty()) {
        p.max_db_size = parse_size_budget(budget);
        if (!p.max_db_size) {
            status = Status::usage("invalid maximum database size '" + budget +
                                   "' (GiB expected)");
            return std::nullopt;
        }
    }

    p.work_on_disk = cli.has("-work_on_disk") || !env.get("KRAKEN_WORK_ON_DISK").empty();
    p.rebuild = resolve_flag(cli, env, "-rebuild", "KRAKEN_REBUILD_DATABASE");
    p.add_taxids_for_seq = resolve_flag(cli, env, "-add_taxids_for_seq",
                                        "KRAKEN_ADD_TAXIDS_FOR_SEQ");
    p.add_taxids_for_genome = resolve_flag(cli, env, "-add_taxids_for_genome",
                                           "KRAKEN_ADD_TAXIDS_FOR_GENOME");
    p.lca_database = resolve_enabled(cli, env, "-lca", "KRAKEN_LCA_DATABASE");
    p.uid_database = resolve_enabled(cli, env, "-uid", "KRAKEN_UID_DATABASE");
    p.verify_artifacts = resolve_flag(cli, env, "-verify", "KRAKEN_VERIFY_ARTIFACTS");

    // Engines run with the database directory as cwd, so every path to a
    // binary is made absolute here. A bare jellyfish name is looked up later.
    p.jellyfish_bin = cli.has("-jellyfish") ? cli.get_string("-jellyfish")
                                            : env.get("KRAKEN_JELLYFISH_BIN");
    if (p.jellyfish_bin.find('/') != std::string::npos)
        p.jellyfish_bin = absolute_from_cwd(p.jellyfish_bin);
    p.bin_dir = cli.has("-bin_dir") ? cli.get_string("-bin_dir") : env.get("KRAKEN_BIN_DIR");
    if (p.bin_dir.empty()) {
        // Engines ship next to the driver.
        const std::string& prog = cli.program();
        if (prog.find('/') != std::string::npos)
            p.bin_dir = fs::path(prog).parent_path().string();
    }
    if (!p.bin_dir.empty()) p.bin_dir = absolute_from_cwd(p.bin_dir);

    status = Status::success();
    return p;
}

} // namespace kubuild
