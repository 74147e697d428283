#include <scanprep/vision/grayscale_stage.hpp>
#include "image_cv_utils.hpp"
#include <scanprep/core/error.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace scanprep::vision {

scanprep::core::StageResult GrayscaleStage::process(const scanprep::core::ImageBuffer& input) {
  using namespace scanprep::core;

  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidImage);
  }

  int code = -1;
  switch (input.format()) {
    case PixelFormat::Grayscale8:
    case PixelFormat::Binary8: {
      std::vector<std::byte> buf(input.data().begin(), input.data().end());
      return ImageBuffer(input.width(), input.height(), PixelFormat::Grayscale8, std::move(buf));
    }
    case PixelFormat::BGR8:
      code = cv::COLOR_BGR2GRAY;
      break;
    case PixelFormat::BGRA8:
      code = cv::COLOR_BGRA2GRAY;
      break;
    case PixelFormat::Unknown:
    default:
      return std::unexpected(PipelineError::InvalidImage);
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return detail::mat_to_image(mat_out, PixelFormat::Grayscale8);
}

}  // namespace scanprep::vision
