#include <scanprep/vision/onnx_binarizer_backend.hpp>
#include "onnx_run_watchdog.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace scanprep::vision {

namespace sc = scanprep::core;

namespace {

constexpr int64_t kNumChannels = 3;
constexpr std::uint32_t kDynamicPatchSize = 448;

}  // namespace

struct OnnxBinarizerBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "scanprep-binarizer"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::uint32_t patch_height{kDynamicPatchSize};
  std::uint32_t patch_width{kDynamicPatchSize};
  std::int64_t foreground_class{1};
  std::chrono::milliseconds timeout{0};

  std::vector<float> patch_buffer;  // NHWC scratch for one patch

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  /// Copy one patch (x0, y0) of \p gray into patch_buffer, padding with white.
  void fill_patch(const sc::ImageBuffer& gray, std::uint32_t x0, std::uint32_t y0);
};

void OnnxBinarizerBackend::Impl::fill_patch(const sc::ImageBuffer& gray,
                                            std::uint32_t x0,
                                            std::uint32_t y0) {
  patch_buffer.assign(static_cast<std::size_t>(patch_height) * patch_width * kNumChannels, 1.f);
  const std::uint32_t rows = std::min(patch_height, gray.height() - y0);
  const std::uint32_t cols = std::min(patch_width, gray.width() - x0);
  for (std::uint32_t y = 0; y < rows; ++y) {
    for (std::uint32_t x = 0; x < cols; ++x) {
      const float v = static_cast<float>(gray.at(x0 + x, y0 + y)) / 255.f;
      const std::size_t idx = (static_cast<std::size_t>(y) * patch_width + x) * kNumChannels;
      patch_buffer[idx + 0] = v;
      patch_buffer[idx + 1] = v;
      patch_buffer[idx + 2] = v;
    }
  }
}

OnnxBinarizerBackend::OnnxBinarizerBackend(std::string model_path,
                                           std::chrono::milliseconds timeout,
                                           std::int64_t foreground_class)
    : impl_(std::make_unique<Impl>()) {
  impl_->timeout = timeout;
  impl_->foreground_class = foreground_class;
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxBinarizerBackend: model has no inputs");
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxBinarizerBackend: model has no outputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const std::vector<int64_t> dims = input_type.GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u || dims[3] != kNumChannels) {
    throw std::runtime_error("OnnxBinarizerBackend: expected input shape [1,H,W,3]");
  }
  if (dims[1] > 0 && dims[2] > 0) {
    impl_->patch_height = static_cast<std::uint32_t>(dims[1]);
    impl_->patch_width = static_cast<std::uint32_t>(dims[2]);
  }
}

OnnxBinarizerBackend::~OnnxBinarizerBackend() = default;

std::uint32_t OnnxBinarizerBackend::patch_width() const noexcept { return impl_->patch_width; }
std::uint32_t OnnxBinarizerBackend::patch_height() const noexcept { return impl_->patch_height; }

std::expected<sc::ImageBuffer, sc::PipelineError>
OnnxBinarizerBackend::binarize(const sc::ImageBuffer& gray) {
  auto valid = validate_input(gray);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const detail::RunDeadline deadline(impl_->timeout);
  auto out = sc::ImageBuffer::filled(gray.width(), gray.height(),
                                     sc::PixelFormat::Binary8, sc::kPaper);
  auto out_bytes = out.data();

  const std::array<int64_t, 4> shape{1, static_cast<int64_t>(impl_->patch_height),
                                     static_cast<int64_t>(impl_->patch_width), kNumChannels};
  Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};

  for (std::uint32_t y0 = 0; y0 < gray.height(); y0 += impl_->patch_height) {
    for (std::uint32_t x0 = 0; x0 < gray.width(); x0 += impl_->patch_width) {
      if (deadline.expired()) {
        return std::unexpected(sc::PipelineError::BinarizationFailed);
      }
      impl_->fill_patch(gray, x0, y0);
      Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
          mem_info, impl_->patch_buffer.data(), impl_->patch_buffer.size(),
          shape.data(), shape.size());

      Ort::RunOptions run_options;
      std::vector<Ort::Value> outputs;
      try {
        detail::RunWatchdog watchdog(run_options, deadline.remaining());
        outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                     output_names_c, 1);
      } catch (const Ort::Exception&) {
        return std::unexpected(sc::PipelineError::BinarizationFailed);
      }
      if (outputs.size() != 1u) {
        return std::unexpected(sc::PipelineError::BinarizationFailed);
      }

      // [1, H, W, C] class scores for this patch.
      const auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
      if (out_shape.size() != 4u || out_shape[1] != shape[1] || out_shape[2] != shape[2] ||
          out_shape[3] <= impl_->foreground_class) {
        return std::unexpected(sc::PipelineError::BinarizationFailed);
      }
      const int64_t num_classes = out_shape[3];
      const float* scores = outputs[0].GetTensorData<float>();

      const std::uint32_t rows = std::min(impl_->patch_height, gray.height() - y0);
      const std::uint32_t cols = std::min(impl_->patch_width, gray.width() - x0);
      for (std::uint32_t y = 0; y < rows; ++y) {
        for (std::uint32_t x = 0; x < cols; ++x) {
          const float* px = scores + (static_cast<std::size_t>(y) * impl_->patch_width + x) *
                                         static_cast<std::size_t>(num_classes);
          const int64_t best = std::max_element(px, px + num_classes) - px;
          if (best == impl_->foreground_class) {
            out_bytes[static_cast<std::size_t>(y0 + y) * gray.width() + (x0 + x)] =
                static_cast<std::byte>(sc::kInk);
          }
        }
      }
    }
  }
  // A result that arrives after the deadline counts as timed out.
  if (deadline.expired()) {
    return std::unexpected(sc::PipelineError::BinarizationFailed);
  }
  return out;
}

void OnnxBinarizerBackend::warmup() {
  const auto blank = sc::ImageBuffer::filled(impl_->patch_width, impl_->patch_height,
                                             sc::PixelFormat::Grayscale8, sc::kPaper);
  (void)binarize(blank);
}

}  // namespace scanprep::vision
