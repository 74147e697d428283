#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/core/pipeline_stage.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace scanprep::core {

/// Callback for per-stage timing: (stage_index, stage_name, duration_ms). Optional; pass to run().
using StageTimingCallback =
    std::function<void(std::size_t stage_index, std::string_view stage_name, double duration_ms)>;

/// Runs a sequence of stages; each stage consumes the previous stage's output.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one image; returns the last stage's output or the first error.
  /// An empty pipeline is a configuration error.
  /// If timing_cb is non-null, it is called after each stage.
  /// Thread-safe as long as every stage's process() is.
  [[nodiscard]] StageResult run(const ImageBuffer& input,
                                StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace scanprep::core
