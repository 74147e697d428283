#include <scanprep/app/document_processor.hpp>
#include <scanprep/vision/enhancer.hpp>
#include <scanprep/vision/image_io.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace scanprep::app {

namespace fs = std::filesystem;
namespace sc = scanprep::core;

std::string_view to_string(FileState state) noexcept {
  switch (state) {
    case FileState::Selected:
      return "SELECTED";
    case FileState::PassThrough:
      return "PASSTHROUGH";
    case FileState::Scored:
      return "SCORED";
    case FileState::Classified:
      return "CLASSIFIED";
    case FileState::Enhanced:
      return "ENHANCED";
    case FileState::Binarized:
      return "BINARIZED";
    case FileState::Deskewed:
      return "DESKEWED";
    case FileState::Written:
      return "WRITTEN";
  }
  return "UNKNOWN";
}

namespace {

const PreprocessConfig& validated(const PreprocessConfig& config) {
  validate_config(config);
  return config;
}

std::size_t branch_index(sc::Classification c) {
  return static_cast<std::size_t>(c);
}

}  // namespace

DocumentProcessor::DocumentProcessor(const PreprocessConfig& config,
                                     fs::path source_dir,
                                     fs::path dest_dir,
                                     std::shared_ptr<vision::IQualityAssessor> assessor,
                                     std::shared_ptr<vision::IBinarizerBackend> binarizer,
                                     ScoreCache* cache)
    : config_(validated(config)),
      source_dir_(std::move(source_dir)),
      dest_dir_(std::move(dest_dir)),
      selector_(config_.selection_pattern),
      assessor_(std::move(assessor)),
      cache_(cache),
      enhancer_(vision::make_enhancer(config_.contrast_enhance)),
      sauvola_(vision::SauvolaParams{config_.sauvola_k, config_.sauvola_window}),
      ml_binarizer_(std::move(binarizer)),
      branches_{&sauvola_, &ml_binarizer_} {
  if (!assessor_) {
    throw ConfigError("DocumentProcessor: quality assessor must not be null");
  }
  static_assert(static_cast<std::size_t>(sc::Classification::Bad) == 0 &&
                static_cast<std::size_t>(sc::Classification::Good) == 1);
  deskew_params_.max_angle_deg = config_.deskew_max_angle;
  deskew_params_.step_deg = config_.deskew_step;
}

std::expected<sc::QualityScore, sc::PipelineError> DocumentProcessor::obtain_score(
    const fs::path& file, const sc::ImageBuffer& image, bool& from_cache) {
  from_cache = false;
  if (cache_) {
    if (auto cached = cache_->get(file)) {
      from_cache = true;
      return *cached;
    }
  }

  std::expected<sc::QualityScore, sc::PipelineError> score;
  {
    std::lock_guard lock(assessor_mutex_);
    score = assessor_->assess(image);
  }
  if (!score) {
    return std::unexpected(sc::PipelineError::ScoreUnavailable);
  }

  if (cache_) {
    auto stored = cache_->put(file, *score);
    if (!stored) {
      spdlog::warn("{}: score {} not persisted ({})", file.string(), *score,
                   sc::to_string(stored.error()));
    }
  }
  return *score;
}

fs::path DocumentProcessor::output_for(const fs::path& file) const {
  return output_path_for(source_dir_, dest_dir_, file, selector_.selected(file));
}

std::size_t DocumentProcessor::plan_outputs(const std::vector<fs::path>& files) {
  collisions_.clear();
  std::map<fs::path, fs::path> owners;
  for (const auto& file : files) {
    const fs::path output = output_for(file).lexically_normal();
    auto [it, inserted] = owners.emplace(output, file);
    if (!inserted && it->second != file) {
      collisions_.emplace(file, it->second);
      spdlog::warn("{}: output {} already belongs to {}", file.string(), output.string(),
                   it->second.string());
    }
  }
  return collisions_.size();
}

void DocumentProcessor::pass_through(FileOutcome& outcome) {
  outcome.state = FileState::PassThrough;
  outcome.output = output_path_for(source_dir_, dest_dir_, outcome.source, false);

  std::error_code ec;
  fs::create_directories(outcome.output.parent_path(), ec);
  if (!ec) {
    fs::copy_file(outcome.source, outcome.output, fs::copy_options::overwrite_existing, ec);
  }
  if (ec) {
    outcome.status = FileStatus::Failed;
    outcome.error = sc::PipelineError::WriteFailed;
    spdlog::error("{}: passthrough copy failed: {}", outcome.source.string(), ec.message());
    return;
  }
  outcome.state = FileState::Written;
  outcome.status = FileStatus::PassedThrough;
  spdlog::info("{}: not selected, copied unchanged", outcome.source.string());
}

FileOutcome DocumentProcessor::process(const fs::path& file) {
  FileOutcome outcome;
  outcome.source = file;
  outcome.state = FileState::Selected;

  const bool selected = selector_.selected(file);
  if (auto collision = collisions_.find(file); collision != collisions_.end()) {
    outcome.output = output_for(file);
    outcome.state = selected ? FileState::Selected : FileState::PassThrough;
    outcome.status = FileStatus::Failed;
    outcome.error = sc::PipelineError::WriteFailed;
    spdlog::error("{}: not written, {} is the output of {}", file.string(),
                  outcome.output.string(), collision->second.string());
    return outcome;
  }

  if (!selected) {
    pass_through(outcome);
    return outcome;
  }

  auto fail = [&](sc::PipelineError error, std::string_view what) {
    outcome.status = FileStatus::Failed;
    outcome.error = error;
    spdlog::error("{}: {} failed after {} ({})", file.string(), what, to_string(outcome.state),
                  sc::to_string(error));
    return outcome;
  };

  auto image = vision::load_image(file);
  if (!image) {
    return fail(image.error(), "load");
  }

  bool from_cache = false;
  auto score = obtain_score(file, *image, from_cache);
  sc::Classification classification = sc::Classification::Bad;
  if (score) {
    outcome.score = *score;
    outcome.score_from_cache = from_cache;
    outcome.state = FileState::Scored;
    classification = sc::classify(*score, config_.goodbad_threshold, config_.score_polarity);
  } else if (config_.unscored_policy == UnscoredPolicy::TreatAsBad) {
    spdlog::warn("{}: no quality score, using the {} branch", file.string(),
                 sc::to_string(sc::Classification::Bad));
  } else {
    outcome.status = FileStatus::Skipped;
    outcome.error = score.error();
    spdlog::warn("{}: skipped, no quality score ({})", file.string(), sc::to_string(score.error()));
    return outcome;
  }
  outcome.classification = classification;
  outcome.state = FileState::Classified;

  sc::StageTimingCallback timing = [&file](std::size_t, std::string_view stage, double ms) {
    spdlog::debug("{}: {} took {:.2f} ms", file.string(), stage, ms);
  };
  auto enhanced = enhancer_.run(*image, &timing);
  if (!enhanced) {
    return fail(enhanced.error(), "enhance");
  }
  outcome.state = FileState::Enhanced;

  auto binary = branches_[branch_index(classification)]->process(*enhanced);
  if (!binary) {
    return fail(binary.error(), "binarize");
  }
  outcome.state = FileState::Binarized;

  auto deskewed = vision::deskew(*binary, deskew_params_);
  if (!deskewed) {
    return fail(deskewed.error(), "deskew");
  }
  outcome.skew_angle_deg = deskewed->angle_deg;
  outcome.state = FileState::Deskewed;

  outcome.output = output_path_for(source_dir_, dest_dir_, file, true);
  auto written = vision::write_image(outcome.output, deskewed->image);
  if (!written) {
    return fail(written.error(), "write");
  }
  outcome.state = FileState::Written;
  outcome.status = FileStatus::Processed;

  if (outcome.score) {
    spdlog::info("{}: score {:.4f}{} -> {}, skew {:.2f} deg -> {}", file.string(), *outcome.score,
                 from_cache ? " (cached)" : "", sc::to_string(classification),
                 outcome.skew_angle_deg, outcome.output.string());
  } else {
    spdlog::info("{}: unscored -> {}, skew {:.2f} deg -> {}", file.string(),
                 sc::to_string(classification), outcome.skew_angle_deg, outcome.output.string());
  }
  return outcome;
}

}  // namespace scanprep::app
