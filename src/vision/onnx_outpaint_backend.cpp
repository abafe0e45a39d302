#include <memoria/vision/onnx_outpaint_backend.hpp>
#include "frame_cv_utils.hpp"
#include "onnx_model.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace memoria::vision {

namespace {

constexpr int kAlign = 8;

int round_up(int v, int m) { return ((v + m - 1) / m) * m; }

}  // namespace

struct OnnxOutpaintBackend::Impl {
  Impl(const std::string& path, int max_side)
      : model(path, "memoria-outpaint"), fast_max_side(std::max(64, max_side)) {}

  detail::OnnxModel model;
  int fast_max_side;
  int fixed_height{-1};  // -1 = dynamic
  int fixed_width{-1};
};

OnnxOutpaintBackend::OnnxOutpaintBackend(const std::string& model_path, int fast_max_side)
    : impl_(std::make_unique<Impl>(model_path, fast_max_side)) {
  if (impl_->model.input_count() != 2u) {
    throw std::runtime_error("OnnxOutpaintBackend: expected inputs (image, mask)");
  }
  if (impl_->model.output_count() == 0u) {
    throw std::runtime_error("OnnxOutpaintBackend: model has no outputs");
  }
  const auto dims = impl_->model.input_shape(0);
  if (dims.size() != 4u || dims[1] != 3) {
    throw std::runtime_error("OnnxOutpaintBackend: expected image input [1,3,H,W]");
  }
  if (dims[2] > 0 && dims[3] > 0) {
    impl_->fixed_height = static_cast<int>(dims[2]);
    impl_->fixed_width = static_cast<int>(dims[3]);
  }
}

OnnxOutpaintBackend::~OnnxOutpaintBackend() = default;

std::expected<memoria::core::Frame, memoria::core::PipelineError>
OnnxOutpaintBackend::outpaint(const memoria::core::Frame& base,
                              const memoria::core::Frame& generation_mask,
                              const OutpaintParams& params) {
  using memoria::core::PipelineError;
  using memoria::core::PixelFormat;

  if (base.format() != PixelFormat::BGR8) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  auto src = detail::frame_to_mat(base);
  auto mask = detail::mask_to_mat(generation_mask);
  if (!src || !mask || mask->size() != src->size()) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  if (params.num_inference_steps) {
    spdlog::debug("onnx outpaint is single-pass; ignoring num_inference_steps={}",
                  *params.num_inference_steps);
  }

  // Working size: source, optionally capped in fast mode.
  int proc_w = src->cols;
  int proc_h = src->rows;
  if (params.fast_mode) {
    const int longest = std::max(proc_w, proc_h);
    if (longest > impl_->fast_max_side) {
      const double s = static_cast<double>(impl_->fast_max_side) / longest;
      proc_w = std::max(kAlign, static_cast<int>(std::lround(proc_w * s)) / kAlign * kAlign);
      proc_h = std::max(kAlign, static_cast<int>(std::lround(proc_h * s)) / kAlign * kAlign);
    }
  }

  cv::Mat proc_img = *src;
  cv::Mat proc_mask = *mask;
  if (proc_w != src->cols || proc_h != src->rows) {
    cv::resize(*src, proc_img, cv::Size(proc_w, proc_h), 0, 0, cv::INTER_AREA);
    cv::resize(*mask, proc_mask, cv::Size(proc_w, proc_h), 0, 0, cv::INTER_NEAREST);
  }

  // Model input: fixed size by resize, dynamic size by edge/zero padding to a multiple of 8.
  int gen_w = round_up(proc_w, kAlign);
  int gen_h = round_up(proc_h, kAlign);
  cv::Mat gen_img;
  cv::Mat gen_mask;
  const bool fixed = impl_->fixed_width > 0;
  if (fixed) {
    gen_w = impl_->fixed_width;
    gen_h = impl_->fixed_height;
    cv::resize(proc_img, gen_img, cv::Size(gen_w, gen_h), 0, 0, cv::INTER_AREA);
    cv::resize(proc_mask, gen_mask, cv::Size(gen_w, gen_h), 0, 0, cv::INTER_NEAREST);
  } else {
    cv::copyMakeBorder(proc_img, gen_img, 0, gen_h - proc_h, 0, gen_w - proc_w,
                       cv::BORDER_REPLICATE);
    cv::copyMakeBorder(proc_mask, gen_mask, 0, gen_h - proc_h, 0, gen_w - proc_w,
                       cv::BORDER_CONSTANT, cv::Scalar(0));
  }

  std::vector<float> image_data = detail::bgr_to_rgb_planar(gen_img);
  std::vector<float> mask_data(static_cast<std::size_t>(gen_w) * gen_h);
  for (int y = 0; y < gen_h; ++y) {
    const auto* m = gen_mask.ptr<std::uint8_t>(y);
    for (int x = 0; x < gen_w; ++x) {
      mask_data[static_cast<std::size_t>(y) * gen_w + x] = m[x] != 0 ? 1.f : 0.f;
    }
  }

  std::vector<Ort::Value> inputs;
  inputs.push_back(detail::make_nchw_tensor(image_data, 3, gen_h, gen_w));
  inputs.push_back(detail::make_nchw_tensor(mask_data, 1, gen_h, gen_w));

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->model.run(inputs);
  } catch (const Ort::Exception& e) {
    spdlog::warn("outpaint inference failed: {}", e.what());
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

  if (out.cols != gen_w || out.rows != gen_h) {
    cv::resize(out, out, cv::Size(gen_w, gen_h), 0, 0, cv::INTER_LANCZOS4);
  }
  if (fixed) {
    cv::resize(out, out, cv::Size(proc_w, proc_h), 0, 0, cv::INTER_LANCZOS4);
  } else {
    out = out(cv::Rect(0, 0, proc_w, proc_h)).clone();
  }
  if (proc_w != src->cols || proc_h != src->rows) {
    cv::resize(out, out, src->size(), 0, 0, cv::INTER_LANCZOS4);
  }
  return detail::mat_to_frame(out, PixelFormat::BGR8);
}

}  // namespace memoria::vision
