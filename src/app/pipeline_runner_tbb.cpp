#include <scanprep/app/pipeline_runner_tbb.hpp>
#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <cstddef>
#include <mutex>

#ifdef SCANPREP_HAS_TBB

namespace scanprep::app {

RunSummary run_batch_tbb(DocumentProcessor& processor,
                         const std::vector<std::filesystem::path>& files,
                         const std::atomic<bool>* cancel,
                         FileOutcomeCallback callback) {
  RunSummary summary;
  summary.total = files.size();
  if (files.empty()) return summary;
  processor.plan_outputs(files);

  std::mutex summary_mutex;
  std::atomic<std::size_t> started{0};
  const std::size_t n = files.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          if (cancel && cancel->load()) {
            std::lock_guard lock(summary_mutex);
            summary.cancelled = true;
            return;
          }
          spdlog::info("[{}/{}] {}", ++started, n, files[i].string());
          FileOutcome outcome = processor.process(files[i]);
          {
            std::lock_guard lock(summary_mutex);
            summary.record(outcome);
          }
          if (callback) callback(outcome);
        }
      });

  std::sort(summary.problems.begin(), summary.problems.end(),
            [](const RunSummary::Problem& a, const RunSummary::Problem& b) { return a.file < b.file; });
  return summary;
}

}  // namespace scanprep::app

#endif  // SCANPREP_HAS_TBB
