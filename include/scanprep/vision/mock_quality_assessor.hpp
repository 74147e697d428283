#pragma once

#include <scanprep/vision/quality_assessor.hpp>
#include <atomic>
#include <cstddef>

namespace scanprep::vision {

/// Mock assessor that returns a fixed score (for tests/demo).
class MockQualityAssessor : public IQualityAssessor {
 public:
  explicit MockQualityAssessor(scanprep::core::QualityScore score = 0.5) : score_(score) {}

  void set_score(scanprep::core::QualityScore score) noexcept { score_ = score; }

  /// When set, assess() fails with ScoreUnavailable.
  void set_fail(bool fail) noexcept { fail_ = fail; }

  [[nodiscard]] std::expected<scanprep::core::QualityScore, scanprep::core::PipelineError>
  assess(const scanprep::core::ImageBuffer& image) override;

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  scanprep::core::QualityScore score_;
  bool fail_{false};
  std::atomic<std::size_t> calls_{0};
};

}  // namespace scanprep::vision
