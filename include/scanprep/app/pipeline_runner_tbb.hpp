#pragma once

#include <scanprep/app/pipeline_runner.hpp>
#include <atomic>
#include <filesystem>
#include <vector>

#ifdef SCANPREP_HAS_TBB

namespace scanprep::app {

/// Routes every file through \p processor with tbb::parallel_for.
///
/// The processor is shared by all TBB tasks; model calls are serialized inside it,
/// so the parallelism pays off in decoding, enhancement, Sauvola and deskew.
/// Once \p cancel is set, remaining chunks return without routing their files.
/// \param callback Invoked for each routed file. Must be thread-safe.
RunSummary run_batch_tbb(DocumentProcessor& processor,
                         const std::vector<std::filesystem::path>& files,
                         const std::atomic<bool>* cancel = nullptr,
                         FileOutcomeCallback callback = {});

}  // namespace scanprep::app

#endif  // SCANPREP_HAS_TBB
