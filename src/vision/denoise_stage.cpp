#include <scanprep/vision/denoise_stage.hpp>
#include "image_cv_utils.hpp"
#include <scanprep/core/error.hpp>
#include <opencv2/core.hpp>
#include <opencv2/photo.hpp>

namespace scanprep::vision {

DenoiseStage::DenoiseStage(DenoiseParams params) : params_(params) {}

scanprep::core::StageResult DenoiseStage::process(const scanprep::core::ImageBuffer& input) {
  using namespace scanprep::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(PipelineError::InvalidImage);
  }
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidImage);
  }

  cv::Mat mat_out;
  try {
    cv::fastNlMeansDenoising(*mat_in, mat_out, params_.strength,
                             params_.template_window, params_.search_window);
  } catch (const cv::Exception&) {
    return std::unexpected(PipelineError::InvalidImage);
  }
  return detail::mat_to_image(mat_out, PixelFormat::Grayscale8);
}

}  // namespace scanprep::vision
