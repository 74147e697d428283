#pragma once

#include <scanprep/core/quality.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace scanprep::app {

/// Fatal configuration problem; raised before any image is processed.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// External model backend type: mock (synthetic) or onnx (real model).
enum class BackendType {
  Mock,
  Onnx,
};

/// What to do with an image whose quality score cannot be obtained.
enum class UnscoredPolicy {
  Skip,        // record the file as skipped
  TreatAsBad,  // route it through the classical (Sauvola) branch
};

/// Run configuration, resolved once per run and then treated as immutable.
struct PreprocessConfig {
  // Sauvola (BAD branch)
  double sauvola_k{0.24};
  int sauvola_window{11};

  // Shared enhancer
  bool contrast_enhance{false};

  // Routing
  std::optional<std::string> selection_pattern;  // regex searched in the file name
  double goodbad_threshold{0.335};
  core::ScorePolarity score_polarity{core::ScorePolarity::HigherIsBetter};
  UnscoredPolicy unscored_policy{UnscoredPolicy::Skip};

  // Deskew sweep
  double deskew_max_angle{15.0};
  double deskew_step{0.25};

  // External models
  BackendType iqa_backend{BackendType::Mock};
  BackendType binarizer_backend{BackendType::Mock};
  std::string iqa_model_path;
  std::string binarizer_model_path;
  std::uint32_t model_timeout_ms{0};  // 0 = no limit
  double mock_score{0.5};

  // Execution and storage
  std::size_t num_workers{0};  // 0 = hardware concurrency
  std::string cache_file_name{"image_scores.cache"};
  std::vector<std::string> image_extensions{".png", ".jpg", ".jpeg", ".tiff",
                                            ".tif", ".bmp", ".webp"};
};

/// Default config when no file is provided.
PreprocessConfig default_config();

/// Apply one key=value setting to \p config. Throws ConfigError for an unknown
/// key or a malformed value.
void apply_setting(PreprocessConfig& config, std::string_view key, std::string_view value);

/// Load a key=value file (one per line, '#' comments) on top of \p base.
/// Throws ConfigError if the file cannot be read or a line is invalid.
PreprocessConfig load_config(const std::string& path, PreprocessConfig base = default_config());

/// Reject settings the pipeline cannot run with (even or < 3 Sauvola window,
/// non-finite thresholds, bad deskew sweep, invalid selection regex, onnx
/// backend without a model path, ...). Throws ConfigError.
void validate_config(const PreprocessConfig& config);

}  // namespace scanprep::app
