#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/core/quality.hpp>
#include <expected>

namespace scanprep::vision {

/// Abstract no-reference image quality model: image -> scalar score.
/// Any failure (unreadable input, runtime error, timeout) is ScoreUnavailable.
/// Implementations need not be thread-safe; callers serialize access.
class IQualityAssessor {
 public:
  virtual ~IQualityAssessor() = default;

  [[nodiscard]] virtual std::expected<scanprep::core::QualityScore, scanprep::core::PipelineError>
  assess(const scanprep::core::ImageBuffer& image) = 0;

  /// Optional: warmup run. Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace scanprep::vision
