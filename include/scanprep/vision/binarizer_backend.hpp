#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <expected>

namespace scanprep::vision {

/// Abstract external binarization model: Grayscale8 image -> Binary8 image of the same size.
/// Implement binarize(); optionally override validate_input and warmup.
/// Implementations need not be thread-safe; callers serialize access.
class IBinarizerBackend {
 public:
  virtual ~IBinarizerBackend() = default;

  [[nodiscard]] virtual std::expected<scanprep::core::ImageBuffer, scanprep::core::PipelineError>
  binarize(const scanprep::core::ImageBuffer& gray) = 0;

  /// Optional: validate image format/dimensions before binarize. Default: Grayscale8 only.
  [[nodiscard]] virtual std::expected<void, scanprep::core::PipelineError>
  validate_input(const scanprep::core::ImageBuffer& input) const;

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace scanprep::vision
