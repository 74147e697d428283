#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/vision/quality_assessor.hpp>
#include <array>
#include <chrono>
#include <memory>
#include <string>

namespace scanprep::vision {

/// Per-channel RGB normalization applied after scaling samples to [0, 1].
struct ChannelNormalization {
  std::array<float, 3> mean{0.f, 0.f, 0.f};
  std::array<float, 3> stddev{1.f, 1.f, 1.f};
};

/// ONNX Runtime quality assessor: loads a no-reference IQA model and implements IQualityAssessor.
///
/// Expected model: one float image input, [1,3,H,W] (NCHW) or [1,H,W,3] (NHWC), RGB in [0, 1]
/// before normalization; the first element of the first output is the score. The image is
/// resized to the model's input size, or to 224x224 when the model declares dynamic H/W.
/// An assess() call that exceeds \p timeout (0 = no limit) is terminated and reported as
/// ScoreUnavailable.
class OnnxQualityAssessor : public IQualityAssessor {
 public:
  OnnxQualityAssessor(std::string model_path,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds{0},
                      ChannelNormalization normalization = {});

  ~OnnxQualityAssessor() override;

  OnnxQualityAssessor(const OnnxQualityAssessor&) = delete;
  OnnxQualityAssessor& operator=(const OnnxQualityAssessor&) = delete;

  [[nodiscard]] std::expected<scanprep::core::QualityScore, scanprep::core::PipelineError>
  assess(const scanprep::core::ImageBuffer& image) override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace scanprep::vision
