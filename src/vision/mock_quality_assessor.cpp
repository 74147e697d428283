#include <scanprep/vision/mock_quality_assessor.hpp>

namespace scanprep::vision {

std::expected<scanprep::core::QualityScore, scanprep::core::PipelineError>
MockQualityAssessor::assess(const scanprep::core::ImageBuffer& image) {
  ++calls_;
  if (fail_ || !image.valid()) {
    return std::unexpected(scanprep::core::PipelineError::ScoreUnavailable);
  }
  return score_;
}

}  // namespace scanprep::vision
