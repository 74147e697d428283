#pragma once

#include <string_view>

namespace scanprep::core {

/// Per-file error codes; used with std::expected for recoverable failures.
/// Configuration problems are fatal and thrown instead (see app::ConfigError).
enum class PipelineError {
  None = 0,
  InvalidImage,
  LoadFailed,
  ScoreUnavailable,    // quality model failed or timed out
  BinarizationFailed,  // branch binarizer failed
  InvalidConfig,
  CacheIOError,        // score store unreadable or write failed
  WriteFailed,
};

[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;

}  // namespace scanprep::core
