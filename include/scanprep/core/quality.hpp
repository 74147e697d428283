#pragma once

#include <cstdint>
#include <string_view>

namespace scanprep::core {

/// Raw output of the image-quality model. Open-ended range, never clamped.
using QualityScore = double;

/// Quality class that selects the binarization branch.
enum class Classification : std::uint8_t {
  Bad,   // classical Sauvola branch
  Good,  // ML binarizer branch
};

/// Whether the configured quality metric ranks higher or lower scores as better.
enum class ScorePolarity : std::uint8_t {
  HigherIsBetter,
  LowerIsBetter,
};

/// Quality gate. HigherIsBetter: Good iff score >= threshold (the boundary
/// belongs to Good). LowerIsBetter: Good iff score <= threshold.
[[nodiscard]] constexpr Classification classify(
    QualityScore score,
    QualityScore threshold,
    ScorePolarity polarity = ScorePolarity::HigherIsBetter) noexcept {
  if (polarity == ScorePolarity::LowerIsBetter) {
    return score <= threshold ? Classification::Good : Classification::Bad;
  }
  return score >= threshold ? Classification::Good : Classification::Bad;
}

[[nodiscard]] constexpr std::string_view to_string(Classification c) noexcept {
  return c == Classification::Good ? "GOOD" : "BAD";
}

}  // namespace scanprep::core
