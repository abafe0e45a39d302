#include <memoria/vision/onnx_transition_backend.hpp>
#include "frame_cv_utils.hpp"
#include "onnx_model.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace memoria::vision {

struct OnnxTransitionBackend::Impl {
  Impl(const std::string& path, int w, int h)
      : model(path, "memoria-transition"),
        generation_width(std::max(64, w)),
        generation_height(std::max(64, h)) {}

  detail::OnnxModel model;
  int generation_width;
  int generation_height;
};

OnnxTransitionBackend::OnnxTransitionBackend(const std::string& model_path,
                                             int generation_width,
                                             int generation_height)
    : impl_(std::make_unique<Impl>(model_path, generation_width, generation_height)) {
  if (impl_->model.input_count() != 1u || impl_->model.output_count() == 0u) {
    throw std::runtime_error("OnnxTransitionBackend: expected one image input and an image output");
  }
  const auto dims = impl_->model.input_shape(0);
  if (dims.size() != 4u || dims[1] != 3) {
    throw std::runtime_error("OnnxTransitionBackend: expected image input [1,3,H,W]");
  }
  if (dims[2] > 0 && dims[3] > 0) {
    impl_->generation_height = static_cast<int>(dims[2]);
    impl_->generation_width = static_cast<int>(dims[3]);
  }
}

OnnxTransitionBackend::~OnnxTransitionBackend() = default;

std::expected<memoria::core::Frame, memoria::core::PipelineError>
OnnxTransitionBackend::generate_frame(const memoria::core::Frame& base_blend,
                                      const std::string& prompt,
                                      const std::optional<std::string>& negative_prompt) {
  using memoria::core::PipelineError;

  if (base_blend.format() != memoria::core::PixelFormat::BGR8) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  auto src = detail::frame_to_mat(base_blend);
  if (!src) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  spdlog::debug("transition keyframe prompt='{}' negative='{}'", prompt,
                negative_prompt.value_or(""));

  const int gw = impl_->generation_width;
  const int gh = impl_->generation_height;
  cv::Mat resized;
  cv::resize(*src, resized, cv::Size(gw, gh), 0, 0, cv::INTER_AREA);

  std::vector<float> input = detail::bgr_to_rgb_planar(resized);
  std::vector<Ort::Value> inputs;
  inputs.push_back(detail::make_nchw_tensor(input, 3, gh, gw));

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->model.run(inputs);
  } catch (const Ort::Exception& e) {
    spdlog::warn("transition inference failed: {}", e.what());
    return std::unexpected(PipelineError::InferenceFailed);
  }

  const auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  if (shape.size() != 4u || shape[1] != 3 || shape[2] <= 0 || shape[3] <= 0) {
    return std::unexpected(PipelineError::InferenceFailed);
  }
  const int out_h = static_cast<int>(shape[2]);
  const int out_w = static_cast<int>(shape[3]);
  const float* data = outputs[0].GetTensorData<float>();
  const std::size_t count = static_cast<std::size_t>(out_h) * out_w * 3;
  cv::Mat out = detail::rgb_planar_to_bgr(data, out_h, out_w, detail::looks_byte_range(data, count));
  cv::resize(out, out, src->size(), 0, 0, cv::INTER_LANCZOS4);
  return detail::mat_to_frame(out, memoria::core::PixelFormat::BGR8);
}

}  // namespace memoria::vision
