#include <scanprep/vision/deskewer.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace scanprep::vision {

namespace sc = scanprep::core;

namespace {

constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

struct InkPoint {
  float dx;  // x - cx
  float dy;  // y - cy
};

bool valid_params(const DeskewParams& params) {
  return std::isfinite(params.max_angle_deg) && params.max_angle_deg >= 0.0 &&
         std::isfinite(params.step_deg) && params.step_deg > 0.0 &&
         params.tie_tolerance >= 0.0;
}

/// Candidate angles ordered by distance from zero: 0, -s, +s, -2s, +2s, ...
std::vector<double> candidate_angles(const DeskewParams& params) {
  const int steps = static_cast<int>(std::floor(params.max_angle_deg / params.step_deg + 1e-9));
  std::vector<double> angles;
  angles.reserve(static_cast<std::size_t>(2 * steps + 1));
  angles.push_back(0.0);
  for (int i = 1; i <= steps; ++i) {
    angles.push_back(-i * params.step_deg);
    angles.push_back(i * params.step_deg);
  }
  return angles;
}

/// Variance of the row-wise ink count after rotating the points by angle_deg.
double profile_variance(const std::vector<InkPoint>& points,
                        double angle_deg,
                        int half_span) {
  // Row coordinate of cv::getRotationMatrix2D(center, angle, 1) applied to (x, y):
  //   y' - cy = -sin(a) * (x - cx) + cos(a) * (y - cy)
  const double a = angle_deg * kDegToRad;
  const double s = std::sin(a);
  const double c = std::cos(a);
  const int bins = 2 * half_span + 1;

  std::vector<std::uint32_t> profile(static_cast<std::size_t>(bins), 0u);
  for (const auto& p : points) {
    const double row = -s * p.dx + c * p.dy;
    const int bin = static_cast<int>(std::floor(row + 0.5)) + half_span;
    if (bin >= 0 && bin < bins) ++profile[static_cast<std::size_t>(bin)];
  }

  double sum = 0.0;
  double sqsum = 0.0;
  for (const auto count : profile) {
    sum += count;
    sqsum += static_cast<double>(count) * count;
  }
  const double mean = sum / bins;
  return sqsum / bins - mean * mean;
}

}  // namespace

double estimate_skew(const sc::ImageBuffer& binary, const DeskewParams& params) {
  if (binary.format() != sc::PixelFormat::Binary8 || !binary.valid() || !valid_params(params)) {
    return 0.0;
  }

  const double cx = (binary.width() - 1) / 2.0;
  const double cy = (binary.height() - 1) / 2.0;

  const auto bytes = binary.data();
  const std::size_t ink = static_cast<std::size_t>(
      std::count(bytes.begin(), bytes.end(), static_cast<std::byte>(sc::kInk)));
  if (ink == 0) return 0.0;
  const std::size_t stride =
      params.max_ink_points == 0 ? 1 : (ink + params.max_ink_points - 1) / params.max_ink_points;

  std::vector<InkPoint> points;
  points.reserve(ink / stride + 1);
  std::size_t seen = 0;
  for (std::uint32_t y = 0; y < binary.height(); ++y) {
    for (std::uint32_t x = 0; x < binary.width(); ++x) {
      if (binary.at(x, y) == sc::kInk && seen++ % stride == 0) {
        points.push_back({static_cast<float>(x - cx), static_cast<float>(y - cy)});
      }
    }
  }

  const double diagonal = std::hypot(static_cast<double>(binary.width()),
                                     static_cast<double>(binary.height()));
  const int half_span = static_cast<int>(std::ceil(diagonal / 2.0)) + 1;

  const std::vector<double> angles = candidate_angles(params);
  std::vector<double> variances(angles.size(), 0.0);
  cv::parallel_for_(cv::Range(0, static_cast<int>(angles.size())), [&](const cv::Range& range) {
    for (int i = range.start; i < range.end; ++i) {
      variances[static_cast<std::size_t>(i)] =
          profile_variance(points, angles[static_cast<std::size_t>(i)], half_span);
    }
  });

  double best = 0.0;
  for (const double v : variances) best = std::max(best, v);
  if (best <= params.min_variance) return 0.0;

  // angles are ordered by |angle|, so the first near-maximal entry is the smallest rotation.
  const double cutoff = best * (1.0 - params.tie_tolerance);
  for (std::size_t i = 0; i < angles.size(); ++i) {
    if (variances[i] >= cutoff) return angles[i];
  }
  return 0.0;
}

std::expected<sc::ImageBuffer, sc::PipelineError> rotate_binary(const sc::ImageBuffer& binary,
                                                                 double angle_deg) {
  if (binary.format() != sc::PixelFormat::Binary8) {
    return std::unexpected(sc::PipelineError::InvalidImage);
  }
  auto src = detail::image_to_mat(binary);
  if (!src) {
    return std::unexpected(sc::PipelineError::InvalidImage);
  }
  if (angle_deg == 0.0) {
    return detail::mat_to_image(*src, sc::PixelFormat::Binary8);
  }

  const cv::Point2f center(static_cast<float>((src->cols - 1) / 2.0),
                           static_cast<float>((src->rows - 1) / 2.0));
  const cv::Mat rotation = cv::getRotationMatrix2D(center, angle_deg, 1.0);
  cv::Mat rotated;
  cv::warpAffine(*src, rotated, rotation, src->size(), cv::INTER_NEAREST,
                 cv::BORDER_CONSTANT, cv::Scalar(sc::kPaper));
  return detail::mat_to_image(rotated, sc::PixelFormat::Binary8);
}

std::expected<DeskewResult, sc::PipelineError> deskew(const sc::ImageBuffer& binary,
                                                      const DeskewParams& params) {
  if (!valid_params(params)) {
    return std::unexpected(sc::PipelineError::InvalidConfig);
  }
  if (binary.format() != sc::PixelFormat::Binary8 || !binary.valid()) {
    return std::unexpected(sc::PipelineError::InvalidImage);
  }

  const double angle = estimate_skew(binary, params);
  auto rotated = rotate_binary(binary, angle);
  if (!rotated) {
    return std::unexpected(rotated.error());
  }
  return DeskewResult{std::move(*rotated), angle};
}

}  // namespace scanprep::vision
