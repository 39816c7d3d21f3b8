#include "core/config.hpp"
#include "core/status.hpp"
#include "core/version.hpp"
#include "engine/process_engine.hpp"
#include "pipeline/build_params.hpp"
#include "pipeline/stage_sequencer.hpp"
#include "taxonomy/taxonomy_fetcher.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>

#include <tbb/global_control.h>

using namespace kubuild;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n\n"
        "Builds a Kraken database in the database directory, resuming at the\n"
        "first unfinished step. Every option overrides the KRAKEN_* environment\n"
        "variable given in brackets.\n\n"
        "Required:\n"
        "  -db <dir>              Database directory [KRAKEN_DB_NAME]\n\n"
        "Options:\n"
        "  -library <dir>         Library directory, repeatable\n"
        "                         [KRAKEN_LIBRARY_DIRS] (default: <db>/library)\n"
        "  -taxonomy <dir>        Taxonomy directory with names.dmp / nodes.dmp\n"
        "                         [KRAKEN_TAXONOMY_DIR] (default: <db>/taxonomy)\n"
        "  -k <int>               k-mer length (%d-%d) [KRAKEN_KMER_LEN] (default: %d)\n"
        "  -minimizer <int>       Minimizer length [KRAKEN_MINIMIZER_LEN] (default: %d)\n"
        "  -hash_size <int>       Counter hash size [KRAKEN_HASH_SIZE]\n"
        "                         (default: 1.15 x library size)\n"
        "  -threads <int>         Number of threads [KRAKEN_THREAD_CT] (default: %d)\n"
        "  -max_db_size <GiB>     Shrink the database to this size [KRAKEN_MAX_DB_SIZE]\n"
        "  -work_on_disk          Minimize RAM instead of disk writes [KRAKEN_WORK_ON_DISK]\n"
        "  -rebuild               Delete previous build output first\n"
        "                         [KRAKEN_REBUILD_DATABASE=1]\n"
        "  -add_taxids_for_seq    Add taxonomy IDs for sequences\n"
        "                         [KRAKEN_ADD_TAXIDS_FOR_SEQ=1]\n"
        "  -add_taxids_for_genome Add taxonomy IDs for genomes\n"
        "                         [KRAKEN_ADD_TAXIDS_FOR_GENOME=1]\n"
        "  -lca <0|1>             Build the LCA database [KRAKEN_LCA_DATABASE] (default: 1)\n"
        "  -uid <0|1>             Build the UID database [KRAKEN_UID_DATABASE] (default: 1)\n"
        "  -verify                Seal artifacts with .sha256 files and check them\n"
        "                         on resume [KRAKEN_VERIFY_ARTIFACTS=1]\n"
        "  -jellyfish <path>      jellyfish 1.x binary [KRAKEN_JELLYFISH_BIN]\n"
        "  -bin_dir <dir>         Directory of the engine binaries [KRAKEN_BIN_DIR]\n"
        "                         (default: directory of this program, then $PATH)\n"
        "  -q, --quiet            Warnings and errors only\n"
        "  -v, --verbose          Verbose output (echo engine command lines)\n"
        "  --version              Print version\n",
        prog, MIN_K, MAX_K, DEFAULT_K, DEFAULT_MINIMIZER_LEN, DEFAULT_THREADS);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (auto code = handle_info_flags(cli, argv[0], print_usage)) return *code;

    if (!cli.positional().empty()) {
        std::fprintf(stderr, "Error: unexpected argument '%s'\n",
                     cli.positional().front().c_str());
        print_usage(argv[0]);
        return 2;
    }

    EnvSource env;
    Status status;
    auto params = resolve_build_params(cli, env, status);
    if (!params) {
        std::fprintf(stderr, "Error: %s\n", status.message.c_str());
        if (status.kind == ErrorKind::kUsage) {
            print_usage(argv[0]);
            return 2;
        }
        return 1;
    }

    Logger logger(log_level_from(cli));
    logger.debug("kubuild %s, database %s, %d thread(s)", KUBUILD_VERSION,
                 params->db_dir.c_str(), params->threads);
    if (!remote_fetch_enabled())
        logger.debug("Built without download support; taxonomy must be present");

    tbb::global_control tbb_limit(tbb::global_control::max_allowed_parallelism,
                                  static_cast<size_t>(params->threads));

    ProcessEngineConfig cfg;
    if (!params->bin_dir.empty()) cfg.search_dirs.push_back(params->bin_dir);
    cfg.working_dir = params->db_dir;
    cfg.jellyfish_bin = params->jellyfish_bin;
    cfg.taxonomy_url = TAXONOMY_ARCHIVE_URL;
    ProcessEngine engine(cfg, logger);

    StageSequencer sequencer(*params, engine, logger);
    Status st = sequencer.run();
    if (!st.ok()) {
        logger.error("%s: %s", error_kind_name(st.kind), st.message.c_str());
        return 1;
    }
    return 0;
}
