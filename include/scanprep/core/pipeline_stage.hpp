#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <expected>
#include <string_view>

namespace scanprep::core {

/// Output of a pipeline stage: the transformed image or a per-file error.
using StageResult = std::expected<ImageBuffer, PipelineError>;

/// Abstract pipeline stage: transform one ImageBuffer into a new one.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual StageResult process(const ImageBuffer& input) = 0;

  /// Short stage name for timing and log output.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace scanprep::core
