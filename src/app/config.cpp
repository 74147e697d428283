#include <scanprep/app/config.hpp>
#include <scanprep/vision/sauvola_binarizer.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scanprep::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

double parse_double(std::string_view key, const std::string& value) {
  std::size_t consumed = 0;
  double v = 0.0;
  try {
    v = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("invalid number for " + std::string(key) + ": '" + value + "'");
  }
  if (consumed != value.size()) {
    throw ConfigError("invalid number for " + std::string(key) + ": '" + value + "'");
  }
  return v;
}

unsigned long parse_unsigned(std::string_view key, const std::string& value) {
  std::size_t consumed = 0;
  unsigned long v = 0;
  try {
    if (!value.empty() && value[0] == '-') throw std::invalid_argument("negative");
    v = std::stoul(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("invalid integer for " + std::string(key) + ": '" + value + "'");
  }
  if (consumed != value.size()) {
    throw ConfigError("invalid integer for " + std::string(key) + ": '" + value + "'");
  }
  return v;
}

int parse_int(std::string_view key, const std::string& value) {
  std::size_t consumed = 0;
  int v = 0;
  try {
    v = std::stoi(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("invalid integer for " + std::string(key) + ": '" + value + "'");
  }
  if (consumed != value.size()) {
    throw ConfigError("invalid integer for " + std::string(key) + ": '" + value + "'");
  }
  return v;
}

bool parse_bool(std::string_view key, const std::string& value) {
  const std::string v = to_lower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  throw ConfigError("invalid boolean for " + std::string(key) + ": '" + value + "'");
}

BackendType parse_backend(std::string_view key, const std::string& value) {
  if (value == "mock") return BackendType::Mock;
  if (value == "onnx") return BackendType::Onnx;
  throw ConfigError("invalid backend for " + std::string(key) + ": '" + value +
                    "' (use mock or onnx)");
}

std::vector<std::string> parse_extensions(const std::string& value) {
  std::vector<std::string> out;
  std::string item;
  for (std::size_t i = 0; i <= value.size(); ++i) {
    if (i == value.size() || value[i] == ',') {
      trim(item);
      if (!item.empty()) {
        if (item[0] != '.') item.insert(item.begin(), '.');
        out.push_back(to_lower(item));
      }
      item.clear();
    } else {
      item.push_back(value[i]);
    }
  }
  return out;
}

}  // namespace

PreprocessConfig default_config() {
  return PreprocessConfig{};
}

void apply_setting(PreprocessConfig& c, std::string_view key, std::string_view raw_value) {
  std::string value(raw_value);
  trim(value);

  if (key == "sauvola_k") c.sauvola_k = parse_double(key, value);
  else if (key == "sauvola_window") c.sauvola_window = parse_int(key, value);
  else if (key == "contrast_enhance") c.contrast_enhance = parse_bool(key, value);
  else if (key == "selection_pattern") {
    if (value.empty()) c.selection_pattern.reset();
    else c.selection_pattern = value;
  }
  else if (key == "goodbad_threshold") c.goodbad_threshold = parse_double(key, value);
  else if (key == "score_polarity") {
    if (value == "higher_better") c.score_polarity = core::ScorePolarity::HigherIsBetter;
    else if (value == "lower_better") c.score_polarity = core::ScorePolarity::LowerIsBetter;
    else throw ConfigError("invalid score_polarity: '" + value + "' (use higher_better or lower_better)");
  }
  else if (key == "unscored_policy") {
    if (value == "skip") c.unscored_policy = UnscoredPolicy::Skip;
    else if (value == "bad") c.unscored_policy = UnscoredPolicy::TreatAsBad;
    else throw ConfigError("invalid unscored_policy: '" + value + "' (use skip or bad)");
  }
  else if (key == "deskew_max_angle") c.deskew_max_angle = parse_double(key, value);
  else if (key == "deskew_step") c.deskew_step = parse_double(key, value);
  else if (key == "iqa_backend") c.iqa_backend = parse_backend(key, value);
  else if (key == "binarizer_backend") c.binarizer_backend = parse_backend(key, value);
  else if (key == "iqa_model_path") c.iqa_model_path = value;
  else if (key == "binarizer_model_path") c.binarizer_model_path = value;
  else if (key == "model_timeout_ms") c.model_timeout_ms = static_cast<std::uint32_t>(parse_unsigned(key, value));
  else if (key == "mock_score") c.mock_score = parse_double(key, value);
  else if (key == "num_workers") c.num_workers = static_cast<std::size_t>(parse_unsigned(key, value));
  else if (key == "cache_file_name") c.cache_file_name = value;
  else if (key == "image_extensions") c.image_extensions = parse_extensions(value);
  else throw ConfigError("unknown config key: '" + std::string(key) + "'");
}

PreprocessConfig load_config(const std::string& path, PreprocessConfig base) {
  std::ifstream f(path);
  if (!f) {
    throw ConfigError("cannot read config file: " + path);
  }

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      throw ConfigError(path + ":" + std::to_string(line_no) + ": expected key=value");
    }
    apply_setting(base, key, value);
  }
  return base;
}

void validate_config(const PreprocessConfig& c) {
  if (!vision::is_valid_sauvola_window(c.sauvola_window)) {
    throw ConfigError("sauvola_window must be an odd integer >= 3 (got " +
                      std::to_string(c.sauvola_window) + ")");
  }
  if (!std::isfinite(c.sauvola_k)) {
    throw ConfigError("sauvola_k must be finite");
  }
  if (!std::isfinite(c.goodbad_threshold)) {
    throw ConfigError("goodbad_threshold must be finite");
  }
  if (!std::isfinite(c.mock_score)) {
    throw ConfigError("mock_score must be finite");
  }
  if (!std::isfinite(c.deskew_max_angle) || c.deskew_max_angle < 0.0 || c.deskew_max_angle > 45.0) {
    throw ConfigError("deskew_max_angle must be within [0, 45] degrees");
  }
  if (!std::isfinite(c.deskew_step) || c.deskew_step <= 0.0) {
    throw ConfigError("deskew_step must be > 0");
  }
  if (c.selection_pattern) {
    try {
      std::regex re(*c.selection_pattern);
    } catch (const std::regex_error& e) {
      throw ConfigError("invalid selection_pattern '" + *c.selection_pattern + "': " + e.what());
    }
  }
  if (c.iqa_backend == BackendType::Onnx && c.iqa_model_path.empty()) {
    throw ConfigError("iqa_backend=onnx requires iqa_model_path");
  }
  if (c.binarizer_backend == BackendType::Onnx && c.binarizer_model_path.empty()) {
    throw ConfigError("binarizer_backend=onnx requires binarizer_model_path");
  }
  if (c.cache_file_name.empty()) {
    throw ConfigError("cache_file_name must not be empty");
  }
  if (c.image_extensions.empty()) {
    throw ConfigError("image_extensions must list at least one extension");
  }
}

}  // namespace scanprep::app
