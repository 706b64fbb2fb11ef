#ifdef IMGPIPE_HAS_ONNXRUNTIME

#include <imgpipe/vision/onnx_caption_model.hpp>
#include <imgpipe/vision/image_ops.hpp>
#include <imgpipe/vision/wordpiece.hpp>
#include "frame_cv_utils.hpp"
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <array>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace imgpipe::vision {

namespace {

constexpr int64_t kNumChannels = 3;
constexpr std::uint32_t kDefaultInputEdge = 384;

constexpr std::array<float, 3> kMean{0.48145466f, 0.4578275f, 0.40821073f};
constexpr std::array<float, 3> kStd{0.26862954f, 0.26130258f, 0.27577711f};

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// RGB8 HWC -> normalised float NCHW.
void RgbToNormalisedNchw(const std::uint8_t* rgb, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t px = static_cast<std::size_t>(y) * w + x;
      for (std::size_t c = 0; c < 3; ++c) {
        const float v = static_cast<float>(rgb[px * 3 + c]) / 255.0f;
        nchw[c * hw + px] = (v - kMean[c]) / kStd[c];
      }
    }
  }
}

}  // namespace

struct OnnxCaptionModel::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "imgpipe"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{kDefaultInputEdge};
  std::uint32_t input_width{kDefaultInputEdge};

  std::vector<std::string> vocab;

  std::mutex run_mutex;            // guards session.Run and nchw_buffer
  std::vector<float> nchw_buffer;

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxCaptionModel::OnnxCaptionModel(std::string model_path, std::string vocab_path)
    : impl_(std::make_unique<Impl>()) {
  impl_->vocab = load_vocabulary(vocab_path);
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxCaptionModel: model has no inputs");
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxCaptionModel: model has no outputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  const std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u || (dims[1] != kNumChannels && dims[1] > 0)) {
    throw std::runtime_error("OnnxCaptionModel: expected input shape [1,3,H,W]");
  }
  if (dims[2] > 0) impl_->input_height = static_cast<std::uint32_t>(dims[2]);
  if (dims[3] > 0) impl_->input_width = static_cast<std::uint32_t>(dims[3]);
}

OnnxCaptionModel::~OnnxCaptionModel() = default;

std::uint32_t OnnxCaptionModel::input_width() const noexcept { return impl_->input_width; }
std::uint32_t OnnxCaptionModel::input_height() const noexcept { return impl_->input_height; }

std::expected<std::string, core::JobError>
OnnxCaptionModel::caption(const core::Frame& image) {
  if (image.empty()) {
    return std::unexpected(core::JobError::DecodeFailed);
  }
  auto rgb = convert_color(image, core::PixelFormat::RGB8);
  if (!rgb) {
    return std::unexpected(core::JobError::DecodeFailed);
  }
  auto mat = detail::view_of(*rgb);
  if (!mat) {
    return std::unexpected(core::JobError::DecodeFailed);
  }

  const std::uint32_t h = impl_->input_height;
  const std::uint32_t w = impl_->input_width;
  cv::Mat resized;
  try {
    cv::resize(*mat, resized, cv::Size(static_cast<int>(w), static_cast<int>(h)), 0, 0,
               cv::INTER_CUBIC);
  } catch (const cv::Exception&) {
    return std::unexpected(core::JobError::DecodeFailed);
  }
  if (!resized.isContinuous()) {
    resized = resized.clone();
  }

  std::lock_guard lock(impl_->run_mutex);
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;
  impl_->nchw_buffer.resize(num_floats);
  RgbToNormalisedNchw(resized.ptr<std::uint8_t>(), h, w, impl_->nchw_buffer.data());

  const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                     static_cast<int64_t>(w)};
  Ort::MemoryInfo mem_info = CpuMemoryInfo();

  std::vector<int64_t> ids;
  try {
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, impl_->nchw_buffer.data(), num_floats, shape.data(), shape.size());

    const char* input_names_c[] = {impl_->input_name.c_str()};
    const char* output_names_c[] = {impl_->output_name.c_str()};
    Ort::RunOptions run_options;
    auto outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                      output_names_c, 1);
    if (outputs.size() != 1u) {
      return std::unexpected(core::JobError::ModelFailed);
    }
    const auto info = outputs[0].GetTensorTypeAndShapeInfo();
    if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64) {
      return std::unexpected(core::JobError::ModelFailed);
    }
    const std::size_t count = info.GetElementCount();
    const int64_t* data = outputs[0].GetTensorData<int64_t>();
    ids.assign(data, data + count);
  } catch (const Ort::Exception&) {
    return std::unexpected(core::JobError::ModelFailed);
  }

  return decode_wordpiece(ids, impl_->vocab);
}

void OnnxCaptionModel::warmup() {
  const std::uint32_t w = impl_->input_width;
  const std::uint32_t h = impl_->input_height;
  auto result = caption(core::Frame::blank(w, h, core::PixelFormat::RGB8));
  if (!result) {
    throw std::runtime_error("OnnxCaptionModel: warmup inference failed");
  }
}

}  // namespace imgpipe::vision

#endif  // IMGPIPE_HAS_ONNXRUNTIME
