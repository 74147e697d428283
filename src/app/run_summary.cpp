#include <scanprep/app/run_summary.hpp>
#include <spdlog/spdlog.h>

namespace scanprep::app {

void RunSummary::record(const FileOutcome& outcome) {
  switch (outcome.status) {
    case FileStatus::Processed:
      ++processed;
      break;
    case FileStatus::PassedThrough:
      ++passed_through;
      break;
    case FileStatus::Skipped:
      ++skipped;
      break;
    case FileStatus::Failed:
      ++failed;
      break;
  }
  if (outcome.score_from_cache) ++cached_scores;
  if (outcome.status == FileStatus::Skipped || outcome.status == FileStatus::Failed) {
    problems.push_back({outcome.source, outcome.status, outcome.state, outcome.error});
  }
}

void RunSummary::log() const {
  spdlog::info("{} files: {} processed, {} passed through, {} skipped, {} failed ({} scores from cache)",
               total, processed, passed_through, skipped, failed, cached_scores);
  for (const auto& p : problems) {
    spdlog::warn("  {} {} at {}: {}", p.status == FileStatus::Skipped ? "skipped" : "failed",
                 p.file.string(), to_string(p.state), core::to_string(p.error));
  }
  if (cancelled) {
    spdlog::warn("run interrupted, {} files not started", not_started());
  }
}

}  // namespace scanprep::app
