#pragma once

#include <scanprep/app/document_processor.hpp>
#include <scanprep/app/run_summary.hpp>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace scanprep::app {

/// Called once per routed file; may be invoked from worker threads and must be thread-safe.
using FileOutcomeCallback = std::function<void(const FileOutcome&)>;

/// Routes every file through \p processor on the calling thread, in order.
/// Destinations are planned first (DocumentProcessor::plan_outputs), so a file
/// whose output name is taken by an earlier one is reported as failed.
/// Stops picking up new files once \p cancel is set; the file in flight completes.
RunSummary run_batch(DocumentProcessor& processor,
                     const std::vector<std::filesystem::path>& files,
                     const std::atomic<bool>* cancel = nullptr,
                     FileOutcomeCallback callback = {});

/// Same as run_batch with a pool of worker threads pulling file indices from a queue.
/// num_workers 0 = use hardware concurrency. Each file is routed exactly once;
/// on cancel, workers stop taking files and in-flight files complete.
RunSummary run_batch_parallel(DocumentProcessor& processor,
                              const std::vector<std::filesystem::path>& files,
                              std::size_t num_workers = 0,
                              const std::atomic<bool>* cancel = nullptr,
                              FileOutcomeCallback callback = {});

}  // namespace scanprep::app
