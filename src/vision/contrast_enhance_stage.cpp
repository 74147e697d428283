#include <scanprep/vision/contrast_enhance_stage.hpp>
#include "image_cv_utils.hpp"
#include <scanprep/core/error.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace scanprep::vision {

ContrastEnhanceStage::ContrastEnhanceStage(ContrastParams params) : params_(params) {}

scanprep::core::StageResult ContrastEnhanceStage::process(
    const scanprep::core::ImageBuffer& input) {
  using namespace scanprep::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(PipelineError::InvalidImage);
  }
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidImage);
  }

  double min_val = 0.0;
  double max_val = 0.0;
  cv::minMaxLoc(*mat_in, &min_val, &max_val);
  if (max_val <= min_val) {
    // cv::normalize would flatten a constant image to 0.
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return ImageBuffer(input.width(), input.height(), PixelFormat::Grayscale8, std::move(buf));
  }

  cv::Mat stretched;
  cv::normalize(*mat_in, stretched, 0, 255, cv::NORM_MINMAX, CV_8U);

  cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(
      params_.clahe_clip_limit, cv::Size(params_.clahe_tiles, params_.clahe_tiles));
  cv::Mat equalized;
  clahe->apply(stretched, equalized);

  return detail::mat_to_image(equalized, PixelFormat::Grayscale8);
}

}  // namespace scanprep::vision
