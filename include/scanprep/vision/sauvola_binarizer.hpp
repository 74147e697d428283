#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace scanprep::vision {

/// Sauvola thresholding parameters:
///   T = mean * (1 + k * (stddev / dynamic_range - 1))
/// computed over a window x window neighbourhood clamped to the image bounds.
struct SauvolaParams {
  double k{0.24};
  int window{11};               // odd, >= 3
  double dynamic_range{128.0};  // R for 8-bit samples
};

/// True if \p window is an odd size >= 3.
[[nodiscard]] constexpr bool is_valid_sauvola_window(int window) noexcept {
  return window >= 3 && window % 2 == 1;
}

/// Local adaptive binarization of a Grayscale8 image into Binary8
/// (kInk where sample < T, kPaper otherwise). Windowed mean and variance come
/// from integral images, so cost per pixel is constant in the window size.
/// InvalidConfig for an even or too small window, InvalidImage for non-grayscale input.
[[nodiscard]] std::expected<scanprep::core::ImageBuffer, scanprep::core::PipelineError>
sauvola_binarize(const scanprep::core::ImageBuffer& gray, const SauvolaParams& params);

/// BAD-branch binarizer stage.
class SauvolaBinarizeStage : public scanprep::core::IPipelineStage {
 public:
  explicit SauvolaBinarizeStage(SauvolaParams params);

  [[nodiscard]] scanprep::core::StageResult process(
      const scanprep::core::ImageBuffer& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "sauvola"; }

  [[nodiscard]] const SauvolaParams& params() const noexcept { return params_; }

 private:
  SauvolaParams params_;
};

}  // namespace scanprep::vision
