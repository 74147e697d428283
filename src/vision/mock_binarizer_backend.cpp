#include <scanprep/vision/mock_binarizer_backend.hpp>

namespace scanprep::vision {

std::expected<scanprep::core::ImageBuffer, scanprep::core::PipelineError>
MockBinarizerBackend::binarize(const scanprep::core::ImageBuffer& gray) {
  ++calls_;
  auto valid = validate_input(gray);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (fail_) {
    return std::unexpected(scanprep::core::PipelineError::BinarizationFailed);
  }
  return scanprep::core::ImageBuffer::filled(gray.width(), gray.height(),
                                             scanprep::core::PixelFormat::Binary8, fill_);
}

}  // namespace scanprep::vision
