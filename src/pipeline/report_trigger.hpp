#pragma once

#include <string>

#include "core/status.hpp"

namespace kubuild {

class ExternalEngine;
class Logger;
class SequenceStream;

// Summary report for one finished database variant.
struct ReportTarget {
    std::string label;            // "LCA" or "UID", for log messages
    std::string db_dir;
    std::string report_path;      // <name>.report / <name>.uid_report
    std::string classification;   // <name>.kraken / <name>.uid_kraken
};

// Classify the library against the finished database unless a non-empty
// report already exists (report_done). Both outputs are written to
// temporaries and renamed on success, the report last. Sets report_done.
Status trigger_report(const ReportTarget& target, int threads, bool seal,
                      bool& report_done, ExternalEngine& engine,
                      SequenceStream& seqs, const Logger& logger);

} // namespace kubuild
