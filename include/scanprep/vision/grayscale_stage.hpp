#pragma once

#include <scanprep/core/image.hpp>
#include <scanprep/core/pipeline_stage.hpp>
#include <string_view>

namespace scanprep::vision {

/// Reduces BGR8/BGRA8 input to a single Grayscale8 channel. Grayscale input is copied.
class GrayscaleStage : public scanprep::core::IPipelineStage {
 public:
  [[nodiscard]] scanprep::core::StageResult process(
      const scanprep::core::ImageBuffer& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "grayscale"; }
};

}  // namespace scanprep::vision
