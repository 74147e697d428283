#pragma once

#include <scanprep/core/image.hpp>
#include <scanprep/core/pipeline_stage.hpp>
#include <scanprep/vision/binarizer_backend.hpp>
#include <memory>
#include <mutex>
#include <string_view>

namespace scanprep::vision {

/// GOOD-branch adapter: hands the enhanced grayscale image to an external
/// binarization backend. Any backend failure, or an output that is not a
/// two-level image of the input's size, becomes BinarizationFailed. No retry.
/// Backend calls are serialized, so one stage may be shared by several workers.
class MlBinarizeStage : public scanprep::core::IPipelineStage {
 public:
  explicit MlBinarizeStage(std::shared_ptr<IBinarizerBackend> backend);

  [[nodiscard]] scanprep::core::StageResult process(
      const scanprep::core::ImageBuffer& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "ml_binarize"; }

 private:
  std::shared_ptr<IBinarizerBackend> backend_;
  std::mutex backend_mutex_;
};

}  // namespace scanprep::vision
