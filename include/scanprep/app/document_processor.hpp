#pragma once

#include <scanprep/app/config.hpp>
#include <scanprep/app/input_files.hpp>
#include <scanprep/app/score_cache.hpp>
#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/core/pipeline.hpp>
#include <scanprep/core/quality.hpp>
#include <scanprep/vision/binarizer_backend.hpp>
#include <scanprep/vision/deskewer.hpp>
#include <scanprep/vision/ml_binarize_stage.hpp>
#include <scanprep/vision/quality_assessor.hpp>
#include <scanprep/vision/sauvola_binarizer.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace scanprep::app {

/// Last state a file reached in the router:
///   Selected -> Scored -> Classified -> Enhanced -> Binarized -> Deskewed -> Written
///   Selected -> PassThrough -> Written   (files excluded by the selection filter)
enum class FileState : std::uint8_t {
  Selected,
  PassThrough,
  Scored,
  Classified,
  Enhanced,
  Binarized,
  Deskewed,
  Written,
};

[[nodiscard]] std::string_view to_string(FileState state) noexcept;

enum class FileStatus : std::uint8_t {
  Processed,      // enhanced, binarized, deskewed and written
  PassedThrough,  // excluded by the selection filter, copied as-is
  Skipped,        // no quality score available
  Failed,         // error after the file was scored
};

/// Result of routing one file.
struct FileOutcome {
  std::filesystem::path source;
  std::filesystem::path output;
  FileStatus status{FileStatus::Failed};
  FileState state{FileState::Selected};
  core::PipelineError error{core::PipelineError::None};
  std::optional<core::QualityScore> score;
  bool score_from_cache{false};
  std::optional<core::Classification> classification;
  double skew_angle_deg{0.0};
};

/// Per-image router. Owns the shared enhancer, both binarizer branches and the
/// deskewer; borrows the score cache. process() may be called from several
/// threads at once: calls into the quality model are serialized here, calls into
/// the binarization model inside MlBinarizeStage, cache access inside ScoreCache.
class DocumentProcessor {
 public:
  /// \p cache may be null (scores are then computed on every run).
  /// Throws ConfigError if \p config is invalid.
  DocumentProcessor(const PreprocessConfig& config,
                    std::filesystem::path source_dir,
                    std::filesystem::path dest_dir,
                    std::shared_ptr<vision::IQualityAssessor> assessor,
                    std::shared_ptr<vision::IBinarizerBackend> binarizer,
                    ScoreCache* cache);

  DocumentProcessor(const DocumentProcessor&) = delete;
  DocumentProcessor& operator=(const DocumentProcessor&) = delete;

  /// Assign a destination to every file of the batch before any is routed.
  /// When several files map to the same destination (p.jpg and p.tif both give
  /// p.png), the first one in \p files keeps it and process() fails the others
  /// with WriteFailed. Returns the number of such files. Call before process();
  /// not safe against concurrent process() calls.
  std::size_t plan_outputs(const std::vector<std::filesystem::path>& files);

  /// Route one file from SELECTED to WRITTEN, stopping at the first error.
  [[nodiscard]] FileOutcome process(const std::filesystem::path& file);

  /// Destination of \p file: <stem>.png when selected, the same name otherwise.
  [[nodiscard]] std::filesystem::path output_for(const std::filesystem::path& file) const;

  [[nodiscard]] const PreprocessConfig& config() const noexcept { return config_; }

 private:
  [[nodiscard]] std::expected<core::QualityScore, core::PipelineError> obtain_score(
      const std::filesystem::path& file, const core::ImageBuffer& image, bool& from_cache);

  void pass_through(FileOutcome& outcome);

  PreprocessConfig config_;
  std::filesystem::path source_dir_;
  std::filesystem::path dest_dir_;
  FileSelector selector_;
  /// Files that lost their destination, mapped to the file that kept it.
  std::map<std::filesystem::path, std::filesystem::path> collisions_;

  std::shared_ptr<vision::IQualityAssessor> assessor_;
  std::mutex assessor_mutex_;
  ScoreCache* cache_;

  core::Pipeline enhancer_;
  vision::SauvolaBinarizeStage sauvola_;
  vision::MlBinarizeStage ml_binarizer_;
  /// Binarizer per classification, indexed by core::Classification.
  std::array<core::IPipelineStage*, 2> branches_;
  vision::DeskewParams deskew_params_;
};

}  // namespace scanprep::app
