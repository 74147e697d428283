#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <cstddef>
#include <expected>

namespace scanprep::vision {

/// Projection-profile sweep settings. Candidate angles are the multiples of
/// step_deg within [-max_angle_deg, +max_angle_deg].
struct DeskewParams {
  double max_angle_deg{15.0};
  double step_deg{0.25};
  /// Angles whose profile variance is within this fraction of the best are ties;
  /// the tie closest to 0 wins.
  double tie_tolerance{1e-4};
  /// Best variance at or below this is treated as a blank page (angle 0).
  double min_variance{1e-9};
  /// Ceiling on the ink pixels fed to the sweep; denser pages keep every n-th
  /// ink pixel in raster order. 0 keeps all of them.
  std::size_t max_ink_points{1u << 20};
};

/// Rotated image plus the rotation applied (degrees, counter-clockwise positive,
/// same convention as cv::getRotationMatrix2D). The angle is diagnostic only.
struct DeskewResult {
  scanprep::core::ImageBuffer image;
  double angle_deg{0.0};
};

/// Returns the rotation that maximizes the variance of the row-wise ink count
/// (horizontal projection profile) of a Binary8 image. Blank images give 0.
[[nodiscard]] double estimate_skew(const scanprep::core::ImageBuffer& binary,
                                   const DeskewParams& params);

/// Estimates the skew and rotates the image by it about its centre with
/// nearest-neighbour sampling, keeping the canvas size and filling with kPaper.
/// InvalidImage for non-Binary8 input, InvalidConfig for a bad sweep.
[[nodiscard]] std::expected<DeskewResult, scanprep::core::PipelineError>
deskew(const scanprep::core::ImageBuffer& binary, const DeskewParams& params);

/// Rotates a Binary8 image by \p angle_deg (nearest-neighbour, kPaper fill).
[[nodiscard]] std::expected<scanprep::core::ImageBuffer, scanprep::core::PipelineError>
rotate_binary(const scanprep::core::ImageBuffer& binary, double angle_deg);

}  // namespace scanprep::vision
