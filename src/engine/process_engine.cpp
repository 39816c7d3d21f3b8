#include "engine/process_engine.hpp"
#include "core/config.hpp"
#include "taxonomy/taxonomy_fetcher.hpp"
#include "util/file_util.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace kubuild {

std::string locate_jellyfish(const std::string& explicit_path,
                             const std::vector<std::string>& search_dirs) {
    if (!explicit_path.empty()) return find_executable(explicit_path, search_dirs);
    std::string p = find_executable("jellyfish1", search_dirs);
    if (p.empty()) p = find_executable("jellyfish", search_dirs);
    return p;
}

ProcessEngine::ProcessEngine(const ProcessEngineConfig& cfg, const Logger& logger)
    : cfg_(cfg), logger_(logger), runner_(logger) {
    jellyfish_ = locate_jellyfish(cfg_.jellyfish_bin, cfg_.search_dirs);
    if (cfg_.taxonomy_url.empty()) cfg_.taxonomy_url = TAXONOMY_ARCHIVE_URL;
}

std::string ProcessEngine::tool_path(const std::string& name) const {
    std::string p = find_executable(name, cfg_.search_dirs);
    return p.empty() ? name : p;
}

EngineResult ProcessEngine::run(std::vector<std::string> argv,
                                const std::string& stdout_path,
                                SequenceStream* stream) {
    ProcessSpec spec;
    spec.argv = std::move(argv);
    spec.working_dir = cfg_.working_dir;
    spec.stdout_path = stdout_path;
    spec.stream = stream;
    return runner_.run(spec);
}

EngineResult ProcessEngine::count(const CountRequest& req, SequenceStream& seqs) {
    if (jellyfish_.empty())
        return EngineResult::failure("jellyfish", "jellyfish 1.x not found");
    logger_.info("Using %s", jellyfish_.c_str());

    return run({jellyfish_, "count",
                "-m", std::to_string(req.k),
                "-s", std::to_string(req.hash_size),
                "-C",
                "-t", std::to_string(req.threads),
                "-o", req.output_prefix,
                ProcessRunner::kStreamArg},
               {}, &seqs);
}

EngineResult ProcessEngine::merge(const std::vector<std::string>& shards,
                                  const std::string& output) {
    if (jellyfish_.empty())
        return EngineResult::failure("jellyfish", "jellyfish 1.x not found");

    std::vector<std::string> argv = {jellyfish_, "merge", "-o", output};
    argv.insert(argv.end(), shards.begin(), shards.end());
    return run(std::move(argv));
}

EngineResult ProcessEngine::reduce(const std::string& input, const std::string& output,
                                   uint64_t record_count) {
    return run({tool_path(cfg_.shrink_bin),
                "-d", input,
                "-o", output,
                "-n", std::to_string(record_count)});
}

EngineResult ProcessEngine::sort(const SortRequest& req) {
    std::vector<std::string> argv = {tool_path(cfg_.sort_bin), "-z"};
    if (req.in_memory) argv.push_back("-M");
    argv.insert(argv.end(), {
        "-t", std::to_string(req.threads),
        "-n", std::to_string(req.minimizer_len),
        "-d", req.input,
        "-o", req.output,
        "-i", req.index});
    return run(std::move(argv));
}

EngineResult ProcessEngine::build_taxdb(const std::string& names_dmp,
                                        const std::string& nodes_dmp,
                                        const std::string& output) {
    return run({tool_path(cfg_.taxdb_bin), names_dmp, nodes_dmp}, output);
}

EngineResult ProcessEngine::set_lcas(const LcaRequest& req, SequenceStream& seqs) {
    std::vector<std::string> argv = {tool_path(cfg_.lca_bin)};
    if (req.in_memory) argv.push_back("-M");
    argv.insert(argv.end(), {"-x", "-d", req.sorted_db});
    if (!req.uid_map.empty()) argv.insert(argv.end(), {"-I", req.uid_map});
    argv.insert(argv.end(), {
        "-o", req.output_db,
        "-i", req.index,
        "-v",
        "-b", req.taxdb});
    if (req.add_taxids_for_seq) argv.push_back("-a");
    if (req.add_taxids_for_genome) argv.push_back("-A");
    argv.insert(argv.end(), {
        "-t", std::to_string(req.threads),
        "-m", req.seqid_map,
        "-c", req.kmer_count,
        "-F", ProcessRunner::kStreamArg});
    return run(std::move(argv), req.stdout_path, &seqs);
}

EngineResult ProcessEngine::classify(const ClassifyRequest& req, SequenceStream& seqs) {
    return run({tool_path(cfg_.classify_bin),
                "--db", req.db_dir,
                "--report-file", req.report_path,
                "--threads", std::to_string(req.threads),
                "--fasta-input", ProcessRunner::kStreamArg},
               req.output_path, &seqs);
}

EngineResult ProcessEngine::fetch_taxonomy(const std::string& taxonomy_dir) {
    std::error_code ec;
    std::filesystem::create_directories(taxonomy_dir, ec);
    if (ec) {
        return EngineResult::failure("fetch", "cannot create '" + taxonomy_dir +
                                     "': " + ec.message());
    }

    std::string archive = path_join(taxonomy_dir, "taxdump.tar.gz");
    logger_.info("Downloading %s", cfg_.taxonomy_url.c_str());
    std::string error;
    if (!download_file(cfg_.taxonomy_url, archive, FetchOptions{}, error))
        return EngineResult::failure("fetch", error);

    ProcessSpec spec;
    spec.argv = {tool_path(cfg_.tar_bin), "zxf", archive};
    spec.working_dir = taxonomy_dir;
    EngineResult r = runner_.run(spec);
    if (!r.ok()) return r;

    if (!taxonomy_dumps_present(taxonomy_dir)) {
        return EngineResult::failure("fetch", "archive did not contain names.dmp and nodes.dmp");
    }
    return EngineResult::success("fetch");
}

} // namespace kubuild
