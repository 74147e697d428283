#pragma once

#include <scanprep/core/error.hpp>
#include <scanprep/core/quality.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace scanprep::app {

/// Persistent image path -> quality score store, one file per source directory.
///
/// The file is a list of `<absolute path>=<score>` lines; the last line for a
/// path wins. Construction loads it (a missing file is an empty cache) and
/// opens it for appending; every put() is appended and flushed at once so an
/// interrupted run keeps the scores computed so far. The destructor closes it.
///
/// I/O problems never throw: unreadable or corrupt content reads as a miss,
/// and a failed write returns CacheIOError while the run carries on.
/// Entries are not tied to a model version; use one cache file per model.
///
/// Thread-safety: get() and put() are serialized by an internal mutex.
class ScoreCache {
 public:
  explicit ScoreCache(std::filesystem::path file);
  ~ScoreCache();

  ScoreCache(const ScoreCache&) = delete;
  ScoreCache& operator=(const ScoreCache&) = delete;

  [[nodiscard]] std::optional<core::QualityScore> get(const std::filesystem::path& image) const;

  [[nodiscard]] std::expected<void, core::PipelineError> put(const std::filesystem::path& image,
                                                             core::QualityScore score);

  [[nodiscard]] std::size_t size() const;

  /// False once loading or writing has failed.
  [[nodiscard]] bool healthy() const;

  [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

  /// Cache key of an image: its absolute, normalized path.
  [[nodiscard]] static std::string key_for(const std::filesystem::path& image);

 private:
  void load();

  std::filesystem::path file_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, core::QualityScore> entries_;
  std::ofstream out_;
  bool healthy_{true};
};

}  // namespace scanprep::app
