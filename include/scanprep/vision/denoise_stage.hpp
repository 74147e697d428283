#pragma once

#include <scanprep/core/image.hpp>
#include <scanprep/core/pipeline_stage.hpp>
#include <string_view>

namespace scanprep::vision {

/// Non-local-means denoising parameters (cv::fastNlMeansDenoising).
struct DenoiseParams {
  float strength{10.f};         // filter strength h
  int template_window{7};       // patch size, odd
  int search_window{21};        // search area, odd
};

/// Suppresses scan grain on a Grayscale8 image while keeping stroke edges.
class DenoiseStage : public scanprep::core::IPipelineStage {
 public:
  explicit DenoiseStage(DenoiseParams params = {});

  [[nodiscard]] scanprep::core::StageResult process(
      const scanprep::core::ImageBuffer& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "denoise"; }

 private:
  DenoiseParams params_;
};

}  // namespace scanprep::vision
