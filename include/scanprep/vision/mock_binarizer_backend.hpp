#pragma once

#include <scanprep/vision/binarizer_backend.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace scanprep::vision {

/// Mock backend that returns a uniformly filled Binary8 image (for tests/demo).
class MockBinarizerBackend : public IBinarizerBackend {
 public:
  /// Sample value for every output pixel: kPaper (default) or kInk.
  void set_fill(std::uint8_t value) noexcept { fill_ = value; }

  /// When set, binarize() fails with BinarizationFailed.
  void set_fail(bool fail) noexcept { fail_ = fail; }

  [[nodiscard]] std::expected<scanprep::core::ImageBuffer, scanprep::core::PipelineError>
  binarize(const scanprep::core::ImageBuffer& gray) override;

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  std::uint8_t fill_{scanprep::core::kPaper};
  bool fail_{false};
  std::atomic<std::size_t> calls_{0};
};

}  // namespace scanprep::vision
