#pragma once

#include <scanprep/core/image.hpp>
#include <scanprep/core/pipeline_stage.hpp>
#include <string_view>

namespace scanprep::vision {

struct ContrastParams {
  double clahe_clip_limit{2.0};
  int clahe_tiles{8};  // tiles per axis
};

/// Min-max contrast stretch to [0, 255] followed by CLAHE, on Grayscale8 input.
/// A constant image (zero dynamic range) passes through unchanged.
class ContrastEnhanceStage : public scanprep::core::IPipelineStage {
 public:
  explicit ContrastEnhanceStage(ContrastParams params = {});

  [[nodiscard]] scanprep::core::StageResult process(
      const scanprep::core::ImageBuffer& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "contrast"; }

 private:
  ContrastParams params_;
};

}  // namespace scanprep::vision
