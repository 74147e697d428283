#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/vision/binarizer_backend.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace scanprep::vision {

/// ONNX Runtime binarization backend for patch-based segmentation models.
///
/// Expected model: input [1,H,W,3] float (grayscale replicated to 3 channels, scaled to [0, 1]),
/// output [1,H,W,C] per-class scores. The image is cut into HxW patches (edge patches padded
/// with white); each pixel takes the arg-max class and \p foreground_class maps to kInk.
/// When the model declares dynamic H/W, 448x448 patches are used.
/// \p timeout (0 = no limit) bounds the whole binarize() call across all patches; past it the
/// running patch is terminated and the image is reported as BinarizationFailed.
class OnnxBinarizerBackend : public IBinarizerBackend {
 public:
  OnnxBinarizerBackend(std::string model_path,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds{0},
                       std::int64_t foreground_class = 1);

  ~OnnxBinarizerBackend() override;

  OnnxBinarizerBackend(const OnnxBinarizerBackend&) = delete;
  OnnxBinarizerBackend& operator=(const OnnxBinarizerBackend&) = delete;

  [[nodiscard]] std::expected<scanprep::core::ImageBuffer, scanprep::core::PipelineError>
  binarize(const scanprep::core::ImageBuffer& gray) override;

  void warmup() override;

  [[nodiscard]] std::uint32_t patch_width() const noexcept;
  [[nodiscard]] std::uint32_t patch_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace scanprep::vision
