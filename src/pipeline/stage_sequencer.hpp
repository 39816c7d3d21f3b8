#pragma once

#include <memory>
#include <optional>
#include <string>

#include "core/status.hpp"
#include "io/library_discovery.hpp"
#include "pipeline/artifacts.hpp"
#include "pipeline/build_params.hpp"

namespace kubuild {

class ExternalEngine;
class Logger;
class SequenceStream;

// Runs the database build stages in order:
//   1 count, 2 reduce, 3 sort, 4 seqid map, 5 taxDB, 6 LCA / UID databases
// Each stage is skipped when its canonical artifact is already present, so a
// rerun resumes at the first unfinished stage. The first failing stage stops
// the run; nothing is retried.
//
// Only one build may run against a database directory at a time; concurrent
// runs on the same directory are not detected.
class StageSequencer {
public:
    StageSequencer(const BuildParameters& params, ExternalEngine& engine,
                   const Logger& logger);
    ~StageSequencer();

    StageSequencer(const StageSequencer&) = delete;
    StageSequencer& operator=(const StageSequencer&) = delete;

    Status run();

    const PipelineState& state() const { return state_; }
    const ArtifactPaths& paths() const { return paths_; }

private:
    const BuildParameters& params_;
    ExternalEngine& engine_;
    const Logger& logger_;
    ArtifactPaths paths_;
    PipelineState state_;
    std::optional<LibraryManifest> manifest_;
    std::unique_ptr<SequenceStream> stream_;

    Status prepare();
    Status count_kmers();
    Status reduce_database();
    Status sort_kmers();
    Status build_seqid_map();
    Status build_taxdb();
    Status check_final_inputs() const;
    Status build_lca_database();
    Status build_uid_database();

    Status commit(const std::string& tmp, const std::string& canonical);
    // Undo a map swap left by an interrupted augmented LCA/UID build.
    Status restore_original_map();
    // seqid2taxid.map -> .orig, augmented map -> seqid2taxid.map
    Status install_augmented_map(const std::string& plus_tmp);
    void check_params_file();
};

} // namespace kubuild
