#include <scanprep/vision/binarizer_backend.hpp>

namespace scanprep::vision {

std::expected<void, scanprep::core::PipelineError>
IBinarizerBackend::validate_input(const scanprep::core::ImageBuffer& input) const {
  if (!input.valid() || input.format() != scanprep::core::PixelFormat::Grayscale8) {
    return std::unexpected(scanprep::core::PipelineError::InvalidImage);
  }
  return {};
}

}  // namespace scanprep::vision
