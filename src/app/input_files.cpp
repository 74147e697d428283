#include <scanprep/app/input_files.hpp>
#include <scanprep/app/config.hpp>
#include <algorithm>
#include <cctype>
#include <system_error>

namespace scanprep::app {

namespace fs = std::filesystem;

namespace {

std::string lower_extension(const fs::path& p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

}  // namespace

std::vector<fs::path> collect_input_files(const fs::path& source_dir,
                                          const std::vector<std::string>& extensions,
                                          const fs::path& exclude,
                                          const fs::path& exclude_dir) {
  std::error_code ec;
  if (!fs::is_directory(source_dir, ec)) {
    throw ConfigError("source directory does not exist or is not a directory: " +
                      source_dir.string());
  }

  const fs::path excluded = exclude.empty() ? fs::path{} : fs::weakly_canonical(exclude, ec);
  const bool has_excluded_dir = !exclude_dir.empty() && fs::is_directory(exclude_dir, ec);
  if (has_excluded_dir && fs::equivalent(source_dir, exclude_dir, ec)) {
    throw ConfigError("destination directory must differ from the source directory: " +
                      source_dir.string());
  }

  std::vector<fs::path> files;
  fs::recursive_directory_iterator it(source_dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw ConfigError("cannot read source directory " + source_dir.string() + ": " + ec.message());
  }
  fs::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      throw ConfigError("cannot read source directory " + source_dir.string() + ": " +
                        ec.message());
    }
    const fs::directory_entry& entry = *it;
    if (has_excluded_dir && entry.is_directory(ec)) {
      std::error_code eq_ec;
      if (fs::equivalent(entry.path(), exclude_dir, eq_ec)) it.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file(ec)) continue;

    const fs::path& p = entry.path();
    const std::string name = p.filename().string();
    if (name.empty() || name[0] == '.') continue;
    if (std::find(extensions.begin(), extensions.end(), lower_extension(p)) == extensions.end()) {
      continue;
    }
    if (!excluded.empty()) {
      std::error_code eq_ec;
      if (fs::equivalent(p, excluded, eq_ec)) continue;
    }
    files.push_back(p);
  }

  std::sort(files.begin(), files.end());
  return files;
}

FileSelector::FileSelector(const std::optional<std::string>& pattern) {
  if (!pattern) return;
  try {
    pattern_.emplace(*pattern);
  } catch (const std::regex_error& e) {
    throw ConfigError("invalid selection pattern '" + *pattern + "': " + e.what());
  }
}

bool FileSelector::selected(const fs::path& file) const {
  if (!pattern_) return true;
  return std::regex_search(file.filename().string(), *pattern_);
}

fs::path output_path_for(const fs::path& source_dir,
                         const fs::path& dest_dir,
                         const fs::path& file,
                         bool processed) {
  fs::path relative = file.lexically_relative(source_dir);
  if (relative.empty() || *relative.begin() == "..") {
    relative = file.filename();
  }
  if (processed) {
    relative.replace_extension(".png");
  }
  return dest_dir / relative;
}

}  // namespace scanprep::app
