#include "onnx_model.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <array>

namespace memoria::vision::detail {

Ort::Env& shared_ort_env() {
  static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "memoria");
  return env;
}

OnnxModel::OnnxModel(const std::string& model_path, const char* log_id) : log_id_(log_id) {
  session_options_.SetIntraOpNumThreads(1);
  session_options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  session_options_.SetLogId(log_id_.c_str());
  session_ = Ort::Session(shared_ort_env(), model_path.c_str(), session_options_);

  Ort::AllocatorWithDefaultOptions allocator;
  for (std::size_t i = 0; i < session_.GetInputCount(); ++i) {
    input_names_.emplace_back(session_.GetInputNameAllocated(i, allocator).get());
  }
  for (std::size_t i = 0; i < session_.GetOutputCount(); ++i) {
    output_names_.emplace_back(session_.GetOutputNameAllocated(i, allocator).get());
  }
  for (const auto& n : input_names_) input_name_ptrs_.push_back(n.c_str());
  for (const auto& n : output_names_) output_name_ptrs_.push_back(n.c_str());
}

std::vector<std::int64_t> OnnxModel::input_shape(std::size_t index) const {
  Ort::TypeInfo info = session_.GetInputTypeInfo(index);
  return info.GetTensorTypeAndShapeInfo().GetShape();
}

std::vector<Ort::Value> OnnxModel::run(std::vector<Ort::Value>& inputs) {
  std::lock_guard lock(run_mutex_);
  Ort::RunOptions run_options;
  return session_.Run(run_options, input_name_ptrs_.data(), inputs.data(), inputs.size(),
                      output_name_ptrs_.data(), output_name_ptrs_.size());
}

Ort::Value make_nchw_tensor(std::vector<float>& storage, std::int64_t channels,
                            std::int64_t height, std::int64_t width) {
  static const Ort::MemoryInfo mem_info =
      Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  const std::array<std::int64_t, 4> shape{1, channels, height, width};
  return Ort::Value::CreateTensor<float>(mem_info, storage.data(), storage.size(),
                                         shape.data(), shape.size());
}

std::vector<float> bgr_to_rgb_planar(const cv::Mat& bgr) {
  const std::size_t hw = static_cast<std::size_t>(bgr.rows) * bgr.cols;
  std::vector<float> out(hw * 3);
  for (int y = 0; y < bgr.rows; ++y) {
    const auto* row = bgr.ptr<cv::Vec3b>(y);
    for (int x = 0; x < bgr.cols; ++x) {
      const std::size_t i = static_cast<std::size_t>(y) * bgr.cols + x;
      out[0 * hw + i] = row[x][2] / 255.f;
      out[1 * hw + i] = row[x][1] / 255.f;
      out[2 * hw + i] = row[x][0] / 255.f;
    }
  }
  return out;
}

cv::Mat rgb_planar_to_bgr(const float* data, int height, int width, bool byte_range) {
  const float scale = byte_range ? 1.f : 255.f;
  const std::size_t hw = static_cast<std::size_t>(height) * width;
  cv::Mat out(height, width, CV_8UC3);
  for (int y = 0; y < height; ++y) {
    auto* row = out.ptr<cv::Vec3b>(y);
    for (int x = 0; x < width; ++x) {
      const std::size_t i = static_cast<std::size_t>(y) * width + x;
      row[x][2] = cv::saturate_cast<std::uint8_t>(data[0 * hw + i] * scale);
      row[x][1] = cv::saturate_cast<std::uint8_t>(data[1 * hw + i] * scale);
      row[x][0] = cv::saturate_cast<std::uint8_t>(data[2 * hw + i] * scale);
    }
  }
  return out;
}

bool looks_byte_range(const float* data, std::size_t count) {
  return std::any_of(data, data + count, [](float v) { return v > 1.5f; });
}

}  // namespace memoria::vision::detail
