#include <scanprep/vision/sauvola_binarizer.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace scanprep::vision {

namespace sc = scanprep::core;

namespace {

/// Sum over [left, right) x [top, bottom) of an integral image with one extra row/col.
inline double window_sum(const cv::Mat& integral, int left, int top, int right, int bottom) {
  return integral.at<double>(bottom, right) - integral.at<double>(top, right) -
         integral.at<double>(bottom, left) + integral.at<double>(top, left);
}

}  // namespace

std::expected<sc::ImageBuffer, sc::PipelineError>
sauvola_binarize(const sc::ImageBuffer& gray, const SauvolaParams& params) {
  if (!is_valid_sauvola_window(params.window) || !std::isfinite(params.k) ||
      !(params.dynamic_range > 0.0)) {
    return std::unexpected(sc::PipelineError::InvalidConfig);
  }
  if (gray.format() != sc::PixelFormat::Grayscale8) {
    return std::unexpected(sc::PipelineError::InvalidImage);
  }
  auto src = detail::image_to_mat(gray);
  if (!src) {
    return std::unexpected(sc::PipelineError::InvalidImage);
  }

  const int w = src->cols;
  const int h = src->rows;

  cv::Mat sum;
  cv::Mat sqsum;
  cv::integral(*src, sum, sqsum, CV_64F, CV_64F);

  const int lower_half = params.window >> 1;
  const int upper_half = params.window - lower_half;
  const double k = params.k;
  const double r = params.dynamic_range;

  cv::Mat bw(h, w, CV_8UC1);
  const cv::Mat& gray_mat = *src;

  cv::parallel_for_(cv::Range(0, h), [&](const cv::Range& rows) {
    for (int y = rows.start; y < rows.end; ++y) {
      const int top = std::max(0, y - lower_half);
      const int bottom = std::min(h, y + upper_half);  // exclusive
      const std::uint8_t* gray_row = gray_mat.ptr<std::uint8_t>(y);
      std::uint8_t* bw_row = bw.ptr<std::uint8_t>(y);

      for (int x = 0; x < w; ++x) {
        const int left = std::max(0, x - lower_half);
        const int right = std::min(w, x + upper_half);  // exclusive
        const double area = static_cast<double>((bottom - top) * (right - left));

        const double mean = window_sum(sum, left, top, right, bottom) / area;
        const double sqmean = window_sum(sqsum, left, top, right, bottom) / area;
        const double variance = sqmean - mean * mean;
        const double deviation = std::sqrt(std::fabs(variance));

        const double threshold = mean * (1.0 + k * (deviation / r - 1.0));
        bw_row[x] = static_cast<double>(gray_row[x]) < threshold ? sc::kInk : sc::kPaper;
      }
    }
  });

  return detail::mat_to_image(bw, sc::PixelFormat::Binary8);
}

SauvolaBinarizeStage::SauvolaBinarizeStage(SauvolaParams params) : params_(params) {}

sc::StageResult SauvolaBinarizeStage::process(const sc::ImageBuffer& input) {
  return sauvola_binarize(input, params_);
}

}  // namespace scanprep::vision
