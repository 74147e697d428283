#include <scanprep/vision/ml_binarize_stage.hpp>
#include <scanprep/core/error.hpp>
#include <stdexcept>

namespace scanprep::vision {

namespace sc = scanprep::core;

MlBinarizeStage::MlBinarizeStage(std::shared_ptr<IBinarizerBackend> backend)
    : backend_(std::move(backend)) {
  if (!backend_) {
    throw std::invalid_argument("MlBinarizeStage: backend must not be null");
  }
}

sc::StageResult MlBinarizeStage::process(const sc::ImageBuffer& input) {
  std::lock_guard lock(backend_mutex_);

  auto valid = backend_->validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto result = backend_->binarize(input);
  if (!result) {
    return std::unexpected(sc::PipelineError::BinarizationFailed);
  }
  if (result->width() != input.width() || result->height() != input.height() ||
      !result->is_two_level()) {
    return std::unexpected(sc::PipelineError::BinarizationFailed);
  }
  return std::move(*result);
}

}  // namespace scanprep::vision
