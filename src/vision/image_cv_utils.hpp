#pragma once

#include <scanprep/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace scanprep::vision::detail {

/// Wrap an ImageBuffer as a cv::Mat header over its buffer (no copy).
/// Returns nullopt if the image is invalid or the format unsupported.
std::optional<cv::Mat> image_to_mat(const scanprep::core::ImageBuffer& image);

/// Convert cv::Mat (CV_8UC1/3/4) to ImageBuffer (copy).
scanprep::core::ImageBuffer mat_to_image(const cv::Mat& mat,
                                         scanprep::core::PixelFormat format);

}  // namespace scanprep::vision::detail
