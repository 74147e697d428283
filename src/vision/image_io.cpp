#include <scanprep/vision/image_io.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <system_error>
#include <vector>

namespace scanprep::vision {

namespace sc = scanprep::core;

std::expected<sc::ImageBuffer, sc::PipelineError> load_image(const std::filesystem::path& path) {
  cv::Mat mat;
  try {
    mat = cv::imread(path.string(), cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return std::unexpected(sc::PipelineError::LoadFailed);
  }
  if (mat.empty()) return std::unexpected(sc::PipelineError::LoadFailed);

  sc::PixelFormat format = sc::PixelFormat::BGR8;
  if (mat.channels() == 1) format = sc::PixelFormat::Grayscale8;

  return detail::mat_to_image(mat, format);
}

std::expected<void, sc::PipelineError> write_image(const std::filesystem::path& path,
                                                   const sc::ImageBuffer& image) {
  auto mat = detail::image_to_mat(image);
  if (!mat) return std::unexpected(sc::PipelineError::InvalidImage);

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) return std::unexpected(sc::PipelineError::WriteFailed);
  }

  // Fixed PNG parameters keep repeated runs byte-identical.
  const std::vector<int> params{cv::IMWRITE_PNG_COMPRESSION, 3};
  try {
    if (!cv::imwrite(path.string(), *mat, params)) {
      return std::unexpected(sc::PipelineError::WriteFailed);
    }
  } catch (const cv::Exception&) {
    return std::unexpected(sc::PipelineError::WriteFailed);
  }
  return {};
}

}  // namespace scanprep::vision
