#include <scanprep/app/score_cache.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <charconv>
#include <string_view>
#include <system_error>

namespace scanprep::app {

namespace {

constexpr std::string_view kHeader = "# scanprep score cache: <absolute image path>=<score>";

std::string format_score(core::QualityScore score) {
  std::array<char, 64> buf{};
  const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), score);
  if (ec != std::errc{}) return {};
  return std::string(buf.data(), end);
}

std::optional<core::QualityScore> parse_score(std::string_view text) {
  core::QualityScore value = 0.0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) return std::nullopt;
  return value;
}

}  // namespace

ScoreCache::ScoreCache(std::filesystem::path file) : file_(std::move(file)) {
  load();

  std::error_code ec;
  const bool existed = std::filesystem::exists(file_, ec);
  out_.open(file_, std::ios::out | std::ios::app);
  if (!out_) {
    spdlog::warn("score cache {}: cannot open for writing, scores will not be persisted",
                 file_.string());
    healthy_ = false;
    return;
  }
  if (!existed) {
    out_ << kHeader << '\n';
    out_.flush();
  }
}

ScoreCache::~ScoreCache() {
  std::lock_guard lock(mutex_);
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

void ScoreCache::load() {
  std::error_code ec;
  if (!std::filesystem::exists(file_, ec)) {
    if (ec) {
      spdlog::warn("score cache {}: {}", file_.string(), ec.message());
      healthy_ = false;
    }
    return;
  }

  std::ifstream in(file_);
  if (!in) {
    spdlog::warn("score cache {}: unreadable, treating every lookup as a miss", file_.string());
    healthy_ = false;
    return;
  }

  std::string line;
  std::size_t corrupt = 0;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line[0] == '#') continue;
    const auto pos = line.rfind('=');
    if (pos == std::string::npos || pos == 0) {
      ++corrupt;
      continue;
    }
    auto score = parse_score(std::string_view(line).substr(pos + 1));
    if (!score) {
      ++corrupt;
      continue;
    }
    entries_[line.substr(0, pos)] = *score;
  }
  if (in.bad()) {
    spdlog::warn("score cache {}: read error after {} entries", file_.string(), entries_.size());
    healthy_ = false;
  }
  if (corrupt > 0) {
    spdlog::warn("score cache {}: ignored {} corrupt line(s)", file_.string(), corrupt);
  }
  spdlog::debug("score cache {}: loaded {} entries", file_.string(), entries_.size());
}

std::string ScoreCache::key_for(const std::filesystem::path& image) {
  std::error_code ec;
  std::filesystem::path p = std::filesystem::absolute(image, ec);
  if (ec) p = image;
  const auto canonical = std::filesystem::weakly_canonical(p, ec);
  if (!ec) p = canonical;
  return p.lexically_normal().string();
}

std::optional<core::QualityScore> ScoreCache::get(const std::filesystem::path& image) const {
  const std::string key = key_for(image);
  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

std::expected<void, core::PipelineError> ScoreCache::put(const std::filesystem::path& image,
                                                         core::QualityScore score) {
  const std::string key = key_for(image);
  const std::string value = format_score(score);

  std::lock_guard lock(mutex_);
  entries_[key] = score;

  if (value.empty() || key.find('\n') != std::string::npos) {
    return std::unexpected(core::PipelineError::CacheIOError);
  }
  if (!out_.is_open()) {
    return std::unexpected(core::PipelineError::CacheIOError);
  }
  out_ << key << '=' << value << '\n';
  out_.flush();
  if (!out_) {
    healthy_ = false;
    out_.clear();
    return std::unexpected(core::PipelineError::CacheIOError);
  }
  return {};
}

std::size_t ScoreCache::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

bool ScoreCache::healthy() const {
  std::lock_guard lock(mutex_);
  return healthy_;
}

}  // namespace scanprep::app
