#pragma once

#include <scanprep/app/document_processor.hpp>
#include <scanprep/core/error.hpp>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace scanprep::app {

/// Per-run counters plus the list of files that did not make it to the output.
struct RunSummary {
  struct Problem {
    std::filesystem::path file;
    FileStatus status{FileStatus::Failed};
    FileState state{FileState::Selected};
    core::PipelineError error{core::PipelineError::None};
  };

  std::size_t total{0};
  std::size_t processed{0};
  std::size_t passed_through{0};
  std::size_t skipped{0};
  std::size_t failed{0};
  std::size_t cached_scores{0};
  bool cancelled{false};
  std::vector<Problem> problems;

  void record(const FileOutcome& outcome);

  /// True when every file was written and the run was not interrupted.
  [[nodiscard]] bool clean() const noexcept {
    return !cancelled && skipped == 0 && failed == 0;
  }

  /// Files never handed to the router (cancelled run).
  [[nodiscard]] std::size_t not_started() const noexcept {
    return total - processed - passed_through - skipped - failed;
  }

  void log() const;
};

}  // namespace scanprep::app
