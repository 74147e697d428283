#include <scanprep/vision/onnx_quality_assessor.hpp>
#include "image_cv_utils.hpp"
#include "onnx_run_watchdog.hpp"
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace scanprep::vision {

namespace sc = scanprep::core;

namespace {

constexpr int64_t kNumChannels = 3;
constexpr std::uint32_t kDynamicInputSize = 224;

}  // namespace

struct OnnxQualityAssessor::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "scanprep-iqa"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{kDynamicInputSize};
  std::uint32_t input_width{kDynamicInputSize};
  bool input_is_nchw{true};

  std::chrono::milliseconds timeout{0};
  ChannelNormalization normalization;

  std::vector<float> input_buffer;  // scratch tensor storage

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  /// Resize to model input, convert to RGB float, normalize, lay out as NCHW or NHWC.
  bool fill_input(const sc::ImageBuffer& image);
};

bool OnnxQualityAssessor::Impl::fill_input(const sc::ImageBuffer& image) {
  auto mat = detail::image_to_mat(image);
  if (!mat) return false;

  cv::Mat rgb;
  switch (image.format()) {
    case sc::PixelFormat::Grayscale8:
    case sc::PixelFormat::Binary8:
      cv::cvtColor(*mat, rgb, cv::COLOR_GRAY2RGB);
      break;
    case sc::PixelFormat::BGR8:
      cv::cvtColor(*mat, rgb, cv::COLOR_BGR2RGB);
      break;
    case sc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, rgb, cv::COLOR_BGRA2RGB);
      break;
    default:
      return false;
  }

  cv::Mat resized;
  cv::resize(rgb, resized,
             cv::Size(static_cast<int>(input_width), static_cast<int>(input_height)),
             0, 0, cv::INTER_AREA);

  const std::size_t hw = static_cast<std::size_t>(input_height) * input_width;
  input_buffer.assign(hw * kNumChannels, 0.f);
  for (std::uint32_t y = 0; y < input_height; ++y) {
    const auto* row = resized.ptr<cv::Vec3b>(static_cast<int>(y));
    for (std::uint32_t x = 0; x < input_width; ++x) {
      for (int64_t c = 0; c < kNumChannels; ++c) {
        const float v = (static_cast<float>(row[x][static_cast<int>(c)]) / 255.f -
                         normalization.mean[c]) / normalization.stddev[c];
        const std::size_t pixel = static_cast<std::size_t>(y) * input_width + x;
        if (input_is_nchw) {
          input_buffer[static_cast<std::size_t>(c) * hw + pixel] = v;
        } else {
          input_buffer[pixel * kNumChannels + static_cast<std::size_t>(c)] = v;
        }
      }
    }
  }
  return true;
}

OnnxQualityAssessor::OnnxQualityAssessor(std::string model_path,
                                         std::chrono::milliseconds timeout,
                                         ChannelNormalization normalization)
    : impl_(std::make_unique<Impl>()) {
  impl_->timeout = timeout;
  impl_->normalization = normalization;
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxQualityAssessor: model has no inputs");
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxQualityAssessor: model has no outputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const std::vector<int64_t> dims = input_type.GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxQualityAssessor: expected 4D input");
  }
  int64_t h = 0;
  int64_t w = 0;
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    h = dims[2];
    w = dims[3];
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    h = dims[1];
    w = dims[2];
  } else {
    throw std::runtime_error("OnnxQualityAssessor: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (h > 0 && w > 0) {
    impl_->input_height = static_cast<std::uint32_t>(h);
    impl_->input_width = static_cast<std::uint32_t>(w);
  }
}

OnnxQualityAssessor::~OnnxQualityAssessor() = default;

std::expected<sc::QualityScore, sc::PipelineError>
OnnxQualityAssessor::assess(const sc::ImageBuffer& image) {
  const detail::RunDeadline deadline(impl_->timeout);
  if (!image.valid() || !impl_->fill_input(image)) {
    return std::unexpected(sc::PipelineError::ScoreUnavailable);
  }

  const auto h = static_cast<int64_t>(impl_->input_height);
  const auto w = static_cast<int64_t>(impl_->input_width);
  const std::array<int64_t, 4> shape =
      impl_->input_is_nchw ? std::array<int64_t, 4>{1, kNumChannels, h, w}
                           : std::array<int64_t, 4>{1, h, w, kNumChannels};
  Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, impl_->input_buffer.data(), impl_->input_buffer.size(),
      shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  if (deadline.expired()) {
    return std::unexpected(sc::PipelineError::ScoreUnavailable);
  }
  std::vector<Ort::Value> outputs;
  try {
    detail::RunWatchdog watchdog(run_options, deadline.remaining());
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 output_names_c, 1);
  } catch (const Ort::Exception&) {
    return std::unexpected(sc::PipelineError::ScoreUnavailable);
  }
  if (deadline.expired()) {
    return std::unexpected(sc::PipelineError::ScoreUnavailable);
  }

  if (outputs.empty() || outputs[0].GetTensorTypeAndShapeInfo().GetElementCount() == 0) {
    return std::unexpected(sc::PipelineError::ScoreUnavailable);
  }
  const double score = static_cast<double>(outputs[0].GetTensorData<float>()[0]);
  if (!std::isfinite(score)) {
    return std::unexpected(sc::PipelineError::ScoreUnavailable);
  }
  return score;
}

void OnnxQualityAssessor::warmup() {
  const auto blank = sc::ImageBuffer::filled(impl_->input_width, impl_->input_height,
                                             sc::PixelFormat::Grayscale8, sc::kPaper);
  (void)assess(blank);
}

}  // namespace scanprep::vision
