#include <scanprep/app/pipeline_runner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>

namespace scanprep::app {

namespace {

bool cancelled(const std::atomic<bool>* cancel) {
  return cancel && cancel->load();
}

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

RunSummary run_sequential(DocumentProcessor& processor,
                          const std::vector<std::filesystem::path>& files,
                          const std::atomic<bool>* cancel,
                          const FileOutcomeCallback& callback) {
  RunSummary summary;
  summary.total = files.size();
  for (std::size_t i = 0; i < files.size(); ++i) {
    if (cancelled(cancel)) {
      summary.cancelled = true;
      break;
    }
    spdlog::info("[{}/{}] {}", i + 1, files.size(), files[i].string());
    FileOutcome outcome = processor.process(files[i]);
    summary.record(outcome);
    if (callback) callback(outcome);
  }
  return summary;
}

}  // namespace

RunSummary run_batch(DocumentProcessor& processor,
                     const std::vector<std::filesystem::path>& files,
                     const std::atomic<bool>* cancel,
                     FileOutcomeCallback callback) {
  processor.plan_outputs(files);
  return run_sequential(processor, files, cancel, callback);
}

RunSummary run_batch_parallel(DocumentProcessor& processor,
                              const std::vector<std::filesystem::path>& files,
                              std::size_t num_workers,
                              const std::atomic<bool>* cancel,
                              FileOutcomeCallback callback) {
  processor.plan_outputs(files);
  const std::size_t n = files.size();
  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return run_sequential(processor, files, cancel, callback);
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }

  RunSummary summary;
  summary.total = n;
  std::mutex queue_mutex;
  std::mutex summary_mutex;
  std::size_t started = 0;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      std::size_t position;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        if (cancelled(cancel)) {
          std::lock_guard summary_lock(summary_mutex);
          summary.cancelled = true;
          break;
        }
        idx = index_queue.front();
        index_queue.pop();
        position = ++started;
      }

      spdlog::info("[{}/{}] {}", position, n, files[idx].string());
      FileOutcome outcome = processor.process(files[idx]);
      {
        std::lock_guard lock(summary_mutex);
        summary.record(outcome);
      }
      if (callback) callback(outcome);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  std::sort(summary.problems.begin(), summary.problems.end(),
            [](const RunSummary::Problem& a, const RunSummary::Problem& b) { return a.file < b.file; });
  return summary;
}

}  // namespace scanprep::app
