#include "pipeline/report_trigger.hpp"
#include "engine/external_engine.hpp"
#include "pipeline/artifacts.hpp"
#include "util/elapsed_time.hpp"
#include "util/file_util.hpp"
#include "util/logger.hpp"

namespace kubuild {

Status trigger_report(const ReportTarget& target, int threads, bool seal,
                      bool& report_done, ExternalEngine& engine,
                      SequenceStream& seqs, const Logger& logger) {
    if (report_done) {
        logger.debug("%s summary report %s exists", target.label.c_str(),
                     target.report_path.c_str());
        return Status::success();
    }

    logger.info("Creating %s database summary report ...", target.label.c_str());
    ElapsedTimer timer;

    ClassifyRequest req;
    req.db_dir = target.db_dir;
    req.report_path = ArtifactPaths::tmp(target.report_path);
    req.output_path = ArtifactPaths::tmp(target.classification);
    req.threads = threads;

    EngineResult r = engine.classify(req, seqs);
    if (!r.ok()) return Status::engine_failure(r.describe());

    if (!commit_artifact(req.output_path, target.classification, seal, logger) ||
        !commit_artifact(req.report_path, target.report_path, seal, logger)) {
        return Status::io_error("cannot put summary report " + target.report_path +
                                " in place");
    }

    report_done = file_nonempty(target.report_path);
    logger.info("Summary report written to %s. [%s]", target.report_path.c_str(),
                timer.elapsed().c_str());
    return Status::success();
}

} // namespace kubuild
