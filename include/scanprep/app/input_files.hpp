#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace scanprep::app {

/// Recursively lists image files under \p source_dir whose lower-case extension
/// is in \p extensions, skipping hidden files, the file \p exclude and everything
/// under \p exclude_dir (the destination tree when it lies inside the source).
/// Sorted by path. Throws ConfigError if \p source_dir is not a readable
/// directory or is itself \p exclude_dir.
std::vector<std::filesystem::path> collect_input_files(
    const std::filesystem::path& source_dir,
    const std::vector<std::string>& extensions,
    const std::filesystem::path& exclude = {},
    const std::filesystem::path& exclude_dir = {});

/// Selection filter: a file is selected when the pattern is found anywhere in
/// its file name (regex search). Without a pattern every file is selected.
class FileSelector {
 public:
  /// Throws ConfigError for an invalid pattern.
  explicit FileSelector(const std::optional<std::string>& pattern);

  [[nodiscard]] bool selected(const std::filesystem::path& file) const;

 private:
  std::optional<std::regex> pattern_;
};

/// Destination of \p file under \p dest_dir, mirroring its location under
/// \p source_dir. Processed images get a ".png" extension; passthrough files keep theirs.
[[nodiscard]] std::filesystem::path output_path_for(const std::filesystem::path& source_dir,
                                                    const std::filesystem::path& dest_dir,
                                                    const std::filesystem::path& file,
                                                    bool processed);

}  // namespace scanprep::app
