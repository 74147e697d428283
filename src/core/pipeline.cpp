#include <scanprep/core/pipeline.hpp>
#include <chrono>

namespace scanprep::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

StageResult Pipeline::run(const ImageBuffer& input,
                          StageTimingCallback* timing_cb) const {
  if (stages_.empty()) {
    return std::unexpected(PipelineError::InvalidConfig);
  }

  const ImageBuffer* current = &input;
  ImageBuffer owned;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*current);
    if (timing_cb && *timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, stages_[i]->name(), ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }

    owned = std::move(*result);
    current = &owned;
  }

  return owned;
}

}  // namespace scanprep::core
