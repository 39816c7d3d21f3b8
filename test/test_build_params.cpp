#include "test_util.hpp"
#include "pipeline/build_params.hpp"
#include "util/cli_parser.hpp"

#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

using namespace kubuild;

static std::string g_test_dir;

class MapEnv : public EnvSource {
public:
    std::map<std::string, std::string> vars;
    std::string get(const std::string& name) const override {
        auto it = vars.find(name);
        return it == vars.end() ? std::string() : it->second;
    }
};

// Owns the argv strings for a CliParser.
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    explicit Args(std::vector<std::string> a,
                  const std::string& prog = "/opt/kraken/bin/kubuild")
        : storage(std::move(a)) {
        storage.insert(storage.begin(), prog);
        for (auto& s : storage) ptrs.push_back(&s[0]);
        ptrs.push_back(nullptr);
    }
    CliParser parser() { return CliParser(static_cast<int>(storage.size()), ptrs.data()); }
};

static std::optional<BuildParameters> resolve(std::vector<std::string> argv,
                                              const MapEnv& env, Status& status) {
    Args args(std::move(argv));
    CliParser cli = args.parser();
    return resolve_build_params(cli, env, status);
}

static void test_defaults() {
    std::fprintf(stderr, "-- test_defaults\n");
    MapEnv env;
    env.vars["KRAKEN_DB_NAME"] = g_test_dir;
    Status st;
    auto p = resolve({}, env, st);
    CHECK(p.has_value());
    CHECK(st.ok());
    CHECK(p->db_dir == std::filesystem::canonical(g_test_dir).string());
    CHECK_EQ(p->library_dirs.size(), 1u);
    CHECK(p->library_dirs[0] == p->db_dir + "/library");
    CHECK(p->taxonomy_dir == p->db_dir + "/taxonomy");
    CHECK_EQ(p->k, 31);
    CHECK_EQ(p->minimizer_len, 15);
    CHECK_EQ(p->threads, 1);
    CHECK_EQ(p->hash_size, 0u);
    CHECK(!p->max_db_size.has_value());
    CHECK(p->in_memory());
    CHECK(!p->rebuild);
    CHECK(p->lca_database);
    CHECK(p->uid_database);
    CHECK(!p->verify_artifacts);
    CHECK_STR(p->bin_dir, "/opt/kraken/bin");
}

static void test_environment() {
    std::fprintf(stderr, "-- test_environment\n");
    MapEnv env;
    env.vars["KRAKEN_DB_NAME"] = g_test_dir;
    env.vars["KRAKEN_LIBRARY_DIRS"] = "lib1  /abs/lib2";
    env.vars["KRAKEN_TAXONOMY_DIR"] = "/data/taxonomy";
    env.vars["KRAKEN_KMER_LEN"] = "25";
    env.vars["KRAKEN_MINIMIZER_LEN"] = "12";
    env.vars["KRAKEN_THREAD_CT"] = "8";
    env.vars["KRAKEN_HASH_SIZE"] = "1000000";
    env.vars["KRAKEN_MAX_DB_SIZE"] = "4.5";
    env.vars["KRAKEN_WORK_ON_DISK"] = "yes";
    env.vars["KRAKEN_REBUILD_DATABASE"] = "1";
    env.vars["KRAKEN_ADD_TAXIDS_FOR_SEQ"] = "1";
    env.vars["KRAKEN_LCA_DATABASE"] = "0";
    env.vars["KRAKEN_JELLYFISH_BIN"] = "/usr/bin/jellyfish1";

    Status st;
    auto p = resolve({}, env, st);
    CHECK(p.has_value());
    CHECK_EQ(p->library_dirs.size(), 2u);
    CHECK(p->library_dirs[0] == p->db_dir + "/lib1");
    CHECK_STR(p->library_dirs[1], "/abs/lib2");
    CHECK_STR(p->taxonomy_dir, "/data/taxonomy");
    CHECK_EQ(p->k, 25);
    CHECK_EQ(p->minimizer_len, 12);
    CHECK_EQ(p->threads, 8);
    CHECK_EQ(p->hash_size, 1000000u);
    CHECK(p->max_db_size.has_value());
    CHECK_STR(p->max_db_size->to_string(), "4.5");
    CHECK(!p->in_memory());
    CHECK(p->rebuild);
    CHECK(p->add_taxids_for_seq);
    CHECK(!p->add_taxids_for_genome);
    CHECK(!p->lca_database);
    CHECK(p->uid_database);
    CHECK_STR(p->jellyfish_bin, "/usr/bin/jellyfish1");
}

static void test_cli_overrides_environment() {
    std::fprintf(stderr, "-- test_cli_overrides_environment\n");
    MapEnv env;
    env.vars["KRAKEN_DB_NAME"] = "/nonexistent/db";
    env.vars["KRAKEN_KMER_LEN"] = "25";
    env.vars["KRAKEN_LIBRARY_DIRS"] = "envlib";
    env.vars["KRAKEN_UID_DATABASE"] = "0";

    Status st;
    auto p = resolve({"-db", g_test_dir, "-k", "21", "-minimizer", "11",
                      "-library", "a", "-library", "b", "-uid", "1",
                      "-rebuild", "-verify", "-bin_dir", "/engines"}, env, st);
    CHECK(p.has_value());
    CHECK_EQ(p->k, 21);
    CHECK_EQ(p->minimizer_len, 11);
    CHECK_EQ(p->library_dirs.size(), 2u);
    CHECK(p->library_dirs[1] == p->db_dir + "/b");
    CHECK(p->uid_database);
    CHECK(p->rebuild);
    CHECK(p->verify_artifacts);
    CHECK_STR(p->bin_dir, "/engines");
}

static void test_relative_engine_paths() {
    std::fprintf(stderr, "-- test_relative_engine_paths\n");
    namespace fs = std::filesystem;
    MapEnv env;
    env.vars["KRAKEN_DB_NAME"] = g_test_dir;
    const std::string cwd = fs::current_path().string();
    Status st;

    // Program started as bin/kubuild: engines are next to it, seen from cwd
    Args started({}, "bin/kubuild");
    CliParser cli = started.parser();
    auto p = resolve_build_params(cli, env, st);
    CHECK(p.has_value());
    CHECK_STR(p->bin_dir, cwd + "/bin");

    Args plain({}, "./kubuild");
    CliParser cli2 = plain.parser();
    p = resolve_build_params(cli2, env, st);
    CHECK(p.has_value());
    CHECK_STR(p->bin_dir, cwd);

    env.vars["KRAKEN_JELLYFISH_BIN"] = "tools/jellyfish1";
    p = resolve({"-bin_dir", "engines"}, env, st);
    CHECK(p.has_value());
    CHECK_STR(p->bin_dir, cwd + "/engines");
    CHECK_STR(p->jellyfish_bin, cwd + "/tools/jellyfish1");

    // A bare name stays a name for the search path lookup
    env.vars["KRAKEN_JELLYFISH_BIN"] = "jellyfish1";
    p = resolve({}, env, st);
    CHECK(p.has_value());
    CHECK_STR(p->jellyfish_bin, "jellyfish1");
}

static void test_missing_db_dir() {
    std::fprintf(stderr, "-- test_missing_db_dir\n");
    MapEnv env;
    Status st;
    CHECK(!resolve({}, env, st).has_value());
    CHECK(st.kind == ErrorKind::kUsage);

    env.vars["KRAKEN_DB_NAME"] = g_test_dir + "/absent";
    CHECK(!resolve({}, env, st).has_value());
    CHECK(st.kind == ErrorKind::kFatalInput);
    CHECK(st.message == "Can't find Kraken DB directory \"" + g_test_dir + "/absent\"");
}

static void test_validation() {
    std::fprintf(stderr, "-- test_validation\n");
    MapEnv env;
    env.vars["KRAKEN_DB_NAME"] = g_test_dir;
    Status st;

    CHECK(!resolve({"-k", "32"}, env, st).has_value());
    CHECK(st.kind == ErrorKind::kUsage);
    CHECK(!resolve({"-k", "abc"}, env, st).has_value());
    CHECK(!resolve({"-k", "0"}, env, st).has_value());
    CHECK(resolve({"-k", "1", "-minimizer", "1"}, env, st).has_value());
    // Minimizer may not exceed k, nor 29
    CHECK(!resolve({"-k", "10", "-minimizer", "11"}, env, st).has_value());
    CHECK(!resolve({"-k", "31", "-minimizer", "30"}, env, st).has_value());
    CHECK(resolve({"-k", "31", "-minimizer", "29"}, env, st).has_value());
    CHECK(!resolve({"-minimizer", "0"}, env, st).has_value());
    CHECK(!resolve({"-threads", "0"}, env, st).has_value());
    CHECK(!resolve({"-hash_size", "12.5"}, env, st).has_value());
    CHECK(!resolve({"-max_db_size", "4G"}, env, st).has_value());
    CHECK(st.message.find("4G") != std::string::npos);

    env.vars["KRAKEN_THREAD_CT"] = "four";
    CHECK(!resolve({}, env, st).has_value());
    CHECK(st.message.find("KRAKEN_THREAD_CT") != std::string::npos);
}

static void test_taxid_flags() {
    std::fprintf(stderr, "-- test_taxid_flags\n");
    BuildParameters p;
    p.add_taxids_for_seq = true;
    p.add_taxids_for_genome = true;

    CHECK(p.lca_taxid_flags().for_seq);
    CHECK(p.lca_taxid_flags().for_genome);
    CHECK(!p.uid_taxid_flags().any());

    p.lca_database = false;
    CHECK(p.uid_taxid_flags().for_seq);
    CHECK(p.uid_taxid_flags().for_genome);

    p.add_taxids_for_seq = false;
    p.add_taxids_for_genome = false;
    CHECK(!p.lca_taxid_flags().any());
    CHECK(!p.uid_taxid_flags().any());
}

static void test_params_text() {
    std::fprintf(stderr, "-- test_params_text\n");
    MapEnv env;
    env.vars["KRAKEN_DB_NAME"] = g_test_dir;
    Status st;
    auto a = resolve({"-k", "25"}, env, st);
    auto b = resolve({"-k", "25", "-threads", "16"}, env, st);
    auto c = resolve({"-k", "27"}, env, st);
    CHECK(a && b && c);
    // Thread count does not change the database
    CHECK(a->to_text() == b->to_text());
    CHECK(a->to_text() != c->to_text());
    CHECK(a->to_text().find("k=25\n") != std::string::npos);
}

int main() {
    char tmpl[] = "/tmp/kubuild_params_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    if (!dir) return 1;
    g_test_dir = dir;

    test_defaults();
    test_environment();
    test_cli_overrides_environment();
    test_relative_engine_paths();
    test_missing_db_dir();
    test_validation();
    test_taxid_flags();
    test_params_text();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
