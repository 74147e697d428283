#include <scanprep/app/backends.hpp>
#include <scanprep/vision/mock_binarizer_backend.hpp>
#include <scanprep/vision/mock_quality_assessor.hpp>
#include <scanprep/vision/onnx_binarizer_backend.hpp>
#include <scanprep/vision/onnx_quality_assessor.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace scanprep::app {

std::shared_ptr<vision::IQualityAssessor> make_quality_assessor(const PreprocessConfig& config) {
  if (config.iqa_backend == BackendType::Onnx) {
    if (config.iqa_model_path.empty()) {
      throw ConfigError("iqa_backend=onnx requires iqa_model_path to be set");
    }
    // ImageNet statistics, the usual input normalization of IQA backbones.
    vision::ChannelNormalization norm;
    norm.mean = {0.485f, 0.456f, 0.406f};
    norm.stddev = {0.229f, 0.224f, 0.225f};
    auto onnx = std::make_shared<vision::OnnxQualityAssessor>(
        config.iqa_model_path, std::chrono::milliseconds{config.model_timeout_ms}, norm);
    onnx->warmup();
    spdlog::info("quality model: {}", config.iqa_model_path);
    return onnx;
  }
  spdlog::info("quality model: mock (score {})", config.mock_score);
  return std::make_shared<vision::MockQualityAssessor>(config.mock_score);
}

std::shared_ptr<vision::IBinarizerBackend> make_binarizer_backend(const PreprocessConfig& config) {
  if (config.binarizer_backend == BackendType::Onnx) {
    if (config.binarizer_model_path.empty()) {
      throw ConfigError("binarizer_backend=onnx requires binarizer_model_path to be set");
    }
    auto onnx = std::make_shared<vision::OnnxBinarizerBackend>(
        config.binarizer_model_path, std::chrono::milliseconds{config.model_timeout_ms});
    onnx->warmup();
    spdlog::info("binarization model: {} ({}x{} patches)", config.binarizer_model_path,
                 onnx->patch_width(), onnx->patch_height());
    return onnx;
  }
  spdlog::info("binarization model: mock (all background)");
  return std::make_shared<vision::MockBinarizerBackend>();
}

}  // namespace scanprep::app
