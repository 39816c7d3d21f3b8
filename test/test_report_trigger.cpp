#include "test_util.hpp"
#include "fake_engine.hpp"
#include "io/sequence_stream.hpp"
#include "pipeline/artifacts.hpp"
#include "pipeline/report_trigger.hpp"
#include "util/file_util.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

using namespace kubuild;

static std::string g_test_dir;
static Logger g_logger(Logger::kQuiet);

static ReportTarget lca_target(const ArtifactPaths& paths) {
    ReportTarget t;
    t.label = "LCA";
    t.db_dir = paths.db_dir();
    t.report_path = paths.lca_report();
    t.classification = paths.lca_classification();
    return t;
}

static void test_generates_report() {
    std::fprintf(stderr, "-- test_generates_report\n");
    ArtifactPaths paths(g_test_dir);
    write_file_string(g_test_dir + "/lib.fa", ">s\nACGT\n");
    SequenceStream seqs({g_test_dir + "/lib.fa"});
    FakeEngine engine;

    bool done = false;
    Status st = trigger_report(lca_target(paths), 4, false, done, engine, seqs, g_logger);
    CHECK(st.ok());
    CHECK(done);
    CHECK(engine.calls == std::vector<std::string>{"classify"});
    CHECK_EQ(engine.classify_reqs[0].threads, 4);
    CHECK(engine.classify_reqs[0].report_path == ArtifactPaths::tmp(paths.lca_report()));
    CHECK(engine.classify_reqs[0].output_path ==
          ArtifactPaths::tmp(paths.lca_classification()));
    CHECK_STR(engine.last_stream, ">s\nACGT\n");
    CHECK(file_nonempty(paths.lca_report()));
    CHECK(file_exists(paths.lca_classification()));
    CHECK(!file_exists(ArtifactPaths::tmp(paths.lca_report())));

    // Already done: no engine call
    engine.clear();
    st = trigger_report(lca_target(paths), 4, false, done, engine, seqs, g_logger);
    CHECK(st.ok());
    CHECK(engine.calls.empty());
}

static void test_failure_leaves_no_report() {
    std::fprintf(stderr, "-- test_failure_leaves_no_report\n");
    std::string db = g_test_dir + "/failing";
    std::filesystem::create_directories(db);
    ArtifactPaths paths(db);
    SequenceStream seqs(std::vector<std::string>{});
    FakeEngine engine;
    engine.fail_on.insert("classify");

    bool done = false;
    Status st = trigger_report(lca_target(paths), 1, false, done, engine, seqs, g_logger);
    CHECK(st.kind == ErrorKind::kEngineFailure);
    CHECK(!done);
    CHECK(!file_exists(paths.lca_report()));
}

static void test_sealed_report() {
    std::fprintf(stderr, "-- test_sealed_report\n");
    std::string db = g_test_dir + "/sealed";
    std::filesystem::create_directories(db);
    ArtifactPaths paths(db);
    SequenceStream seqs(std::vector<std::string>{});
    FakeEngine engine;

    bool done = false;
    CHECK(trigger_report(lca_target(paths), 1, true, done, engine, seqs, g_logger).ok());
    CHECK(file_exists(ArtifactPaths::sidecar(paths.lca_report())));
    CHECK(file_exists(ArtifactPaths::sidecar(paths.lca_classification())));
}

int main() {
    char tmpl[] = "/tmp/kubuild_report_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    if (!dir) return 1;
    g_test_dir = dir;

    test_generates_report();
    test_failure_leaves_no_report();
    test_sealed_report();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
