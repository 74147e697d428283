#include <scanprep/app/config.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace sa = scanprep::app;
namespace sc = scanprep::core;

namespace {

std::string write_temp_config(const std::string& name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream(path) << content;
  return path.string();
}

}  // namespace

TEST(Config, DefaultsMatchTheClassicPipeline) {
  const sa::PreprocessConfig cfg = sa::default_config();
  EXPECT_DOUBLE_EQ(cfg.sauvola_k, 0.24);
  EXPECT_EQ(cfg.sauvola_window, 11);
  EXPECT_FALSE(cfg.contrast_enhance);
  EXPECT_FALSE(cfg.selection_pattern.has_value());
  EXPECT_DOUBLE_EQ(cfg.goodbad_threshold, 0.335);
  EXPECT_EQ(cfg.score_polarity, sc::ScorePolarity::HigherIsBetter);
  EXPECT_EQ(cfg.unscored_policy, sa::UnscoredPolicy::Skip);
  EXPECT_EQ(cfg.iqa_backend, sa::BackendType::Mock);
  EXPECT_EQ(cfg.binarizer_backend, sa::BackendType::Mock);
  EXPECT_EQ(cfg.cache_file_name, "image_scores.cache");
  EXPECT_NO_THROW(sa::validate_config(cfg));
}

TEST(Config, LoadsKeyValueFile) {
  const std::string path = write_temp_config(
      "scanprep_config_test.cfg",
      "# comment\n"
      "\n"
      "sauvola_k = 0.3\n"
      "sauvola_window=15\n"
      "contrast_enhance=true\n"
      "selection_pattern=^scan_\\d+\n"
      "goodbad_threshold=40\n"
      "score_polarity=lower_better\n"
      "unscored_policy=bad\n"
      "deskew_max_angle=10\n"
      "model_timeout_ms=2500\n"
      "num_workers=3\n"
      "image_extensions=PNG, .tif\n");
  const sa::PreprocessConfig cfg = sa::load_config(path);
  EXPECT_DOUBLE_EQ(cfg.sauvola_k, 0.3);
  EXPECT_EQ(cfg.sauvola_window, 15);
  EXPECT_TRUE(cfg.contrast_enhance);
  ASSERT_TRUE(cfg.selection_pattern.has_value());
  EXPECT_EQ(*cfg.selection_pattern, "^scan_\\d+");
  EXPECT_DOUBLE_EQ(cfg.goodbad_threshold, 40.0);
  EXPECT_EQ(cfg.score_polarity, sc::ScorePolarity::LowerIsBetter);
  EXPECT_EQ(cfg.unscored_policy, sa::UnscoredPolicy::TreatAsBad);
  EXPECT_DOUBLE_EQ(cfg.deskew_max_angle, 10.0);
  EXPECT_EQ(cfg.model_timeout_ms, 2500u);
  EXPECT_EQ(cfg.num_workers, 3u);
  ASSERT_EQ(cfg.image_extensions.size(), 2u);
  EXPECT_EQ(cfg.image_extensions[0], ".png");
  EXPECT_EQ(cfg.image_extensions[1], ".tif");
  std::remove(path.c_str());
}

TEST(Config, MissingFileThrows) {
  EXPECT_THROW(sa::load_config("/nonexistent/scanprep.cfg"), sa::ConfigError);
}

TEST(Config, LineWithoutEqualsThrows) {
  const std::string path = write_temp_config("scanprep_config_bad_line.cfg", "sauvola_k 0.3\n");
  EXPECT_THROW(sa::load_config(path), sa::ConfigError);
  std::remove(path.c_str());
}

TEST(Config, UnknownKeyThrows) {
  sa::PreprocessConfig cfg;
  EXPECT_THROW(sa::apply_setting(cfg, "sauvola_kk", "0.2"), sa::ConfigError);
}

TEST(Config, MalformedNumbersThrow) {
  sa::PreprocessConfig cfg;
  EXPECT_THROW(sa::apply_setting(cfg, "sauvola_k", "abc"), sa::ConfigError);
  EXPECT_THROW(sa::apply_setting(cfg, "sauvola_window", "11px"), sa::ConfigError);
  EXPECT_THROW(sa::apply_setting(cfg, "num_workers", "-1"), sa::ConfigError);
  EXPECT_THROW(sa::apply_setting(cfg, "contrast_enhance", "maybe"), sa::ConfigError);
  EXPECT_THROW(sa::apply_setting(cfg, "iqa_backend", "tensorrt"), sa::ConfigError);
}

TEST(Config, EvenOrTinyWindowIsRejected) {
  sa::PreprocessConfig cfg;
  cfg.sauvola_window = 10;
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
  cfg.sauvola_window = 1;
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
  cfg.sauvola_window = 3;
  EXPECT_NO_THROW(sa::validate_config(cfg));
}

TEST(Config, InvalidRegexIsRejected) {
  sa::PreprocessConfig cfg;
  cfg.selection_pattern = "scan_(";
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
}

TEST(Config, DeskewSweepIsValidated) {
  sa::PreprocessConfig cfg;
  cfg.deskew_step = 0.0;
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
  cfg = sa::default_config();
  cfg.deskew_max_angle = 60.0;
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
}

TEST(Config, NonFiniteMockScoreIsRejected) {
  sa::PreprocessConfig cfg;
  sa::apply_setting(cfg, "mock_score", "nan");
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
  sa::apply_setting(cfg, "mock_score", "inf");
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
  sa::apply_setting(cfg, "mock_score", "0.2");
  EXPECT_NO_THROW(sa::validate_config(cfg));
}

TEST(Config, OnnxBackendNeedsModelPath) {
  sa::PreprocessConfig cfg;
  cfg.iqa_backend = sa::BackendType::Onnx;
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
  cfg.iqa_model_path = "iqa.onnx";
  EXPECT_NO_THROW(sa::validate_config(cfg));
  cfg.binarizer_backend = sa::BackendType::Onnx;
  EXPECT_THROW(sa::validate_config(cfg), sa::ConfigError);
}

TEST(Config, EmptySelectionPatternClearsIt) {
  sa::PreprocessConfig cfg;
  sa::apply_setting(cfg, "selection_pattern", "abc");
  ASSERT_TRUE(cfg.selection_pattern.has_value());
  sa::apply_setting(cfg, "selection_pattern", "");
  EXPECT_FALSE(cfg.selection_pattern.has_value());
}
