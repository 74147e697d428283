#pragma once

#include <scanprep/app/config.hpp>
#include <scanprep/vision/binarizer_backend.hpp>
#include <scanprep/vision/quality_assessor.hpp>
#include <memory>

namespace scanprep::app {

/// Build the quality model selected by config (mock or ONNX Runtime) and warm it up.
/// Throws if the model cannot be loaded.
std::shared_ptr<vision::IQualityAssessor> make_quality_assessor(const PreprocessConfig& config);

/// Build the binarization model selected by config (mock or ONNX Runtime) and warm it up.
/// Throws if the model cannot be loaded.
std::shared_ptr<vision::IBinarizerBackend> make_binarizer_backend(const PreprocessConfig& config);

}  // namespace scanprep::app
