// Unit tests for OnnxQualityAssessor.
// One test runs without a model (constructor with missing file). The rest require a real
// no-reference IQA .onnx model: set SCANPREP_TEST_IQA_MODEL to its path.
// They are skipped if the env var is unset or the file is missing.
#include <scanprep/core/error.hpp>
#include <scanprep/core/image.hpp>
#include <scanprep/vision/onnx_quality_assessor.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace sv = scanprep::vision;
namespace sc = scanprep::core;

static std::string get_test_model_path() {
  const char* env = std::getenv("SCANPREP_TEST_IQA_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

TEST(OnnxQualityAssessor, ConstructorThrowsWhenFileMissing) {
  EXPECT_THROW(
      { sv::OnnxQualityAssessor assessor("nonexistent_iqa_model_12345_should_not_exist.onnx"); },
      Ort::Exception);
}

TEST(OnnxQualityAssessor, InvalidImageIsScoreUnavailable) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set SCANPREP_TEST_IQA_MODEL to run (path to .onnx file)";
  }
  sv::OnnxQualityAssessor assessor(path);
  auto score = assessor.assess(sc::ImageBuffer{});
  ASSERT_FALSE(score.has_value());
  EXPECT_EQ(score.error(), sc::PipelineError::ScoreUnavailable);
}

TEST(OnnxQualityAssessor, ScoresAreFiniteAndRepeatable) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set SCANPREP_TEST_IQA_MODEL to run (path to .onnx file)";
  }
  sv::OnnxQualityAssessor assessor(path);
  assessor.warmup();
  auto page = sc::ImageBuffer::filled(320, 240, sc::PixelFormat::BGR8, 200);
  auto first = assessor.assess(page);
  auto second = assessor.assess(page);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(std::isfinite(*first));
  EXPECT_DOUBLE_EQ(*first, *second);
}

TEST(OnnxQualityAssessor, AcceptsGrayscaleInput) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set SCANPREP_TEST_IQA_MODEL to run (path to .onnx file)";
  }
  sv::OnnxQualityAssessor assessor(path, std::chrono::milliseconds{60000});
  auto score = assessor.assess(sc::ImageBuffer::filled(100, 100, sc::PixelFormat::Grayscale8, 90));
  EXPECT_TRUE(score.has_value());
}

TEST(OnnxQualityAssessor, TimeoutMakesScoreUnavailable) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set SCANPREP_TEST_IQA_MODEL to run (path to .onnx file)";
  }
  sv::OnnxQualityAssessor assessor(path, std::chrono::milliseconds{1});
  auto score = assessor.assess(sc::ImageBuffer::filled(2048, 2048, sc::PixelFormat::BGR8, 128));
  ASSERT_FALSE(score.has_value());
  EXPECT_EQ(score.error(), sc::PipelineError::ScoreUnavailable);
}
