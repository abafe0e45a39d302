#pragma once

#include <onnxruntime_cxx_api.h>
#include <opencv2/core/mat.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace memoria::vision::detail {

/// Process-wide ONNX Runtime environment shared by every session.
Ort::Env& shared_ort_env();

/// Owns an ONNX Runtime session plus its input/output names. run() is serialized
/// so one instance can be shared by sequential callers on different threads.
class OnnxModel {
 public:
  /// Throws Ort::Exception when the model cannot be loaded.
  OnnxModel(const std::string& model_path, const char* log_id);

  OnnxModel(const OnnxModel&) = delete;
  OnnxModel& operator=(const OnnxModel&) = delete;

  [[nodiscard]] std::size_t input_count() const noexcept { return input_names_.size(); }
  [[nodiscard]] std::size_t output_count() const noexcept { return output_names_.size(); }

  /// Declared shape of input \p index; dynamic dims are reported as -1.
  [[nodiscard]] std::vector<std::int64_t> input_shape(std::size_t index) const;

  /// Runs the model on \p inputs (one per declared input, in order) and returns all outputs.
  std::vector<Ort::Value> run(std::vector<Ort::Value>& inputs);

 private:
  std::string log_id_;
  Ort::SessionOptions session_options_;
  Ort::Session session_{nullptr};
  std::vector<std::string> input_names_;
  std::vector<std::string> output_names_;
  std::vector<const char*> input_name_ptrs_;
  std::vector<const char*> output_name_ptrs_;
  std::mutex run_mutex_;
};

/// Float tensor [1, C, H, W] backed by \p storage (caller keeps storage alive while the tensor is used).
Ort::Value make_nchw_tensor(std::vector<float>& storage, std::int64_t channels,
                            std::int64_t height, std::int64_t width);

/// BGR8 Mat -> planar RGB floats in [0, 1] (NCHW order, batch of one).
std::vector<float> bgr_to_rgb_planar(const cv::Mat& bgr);

/// Planar RGB floats -> BGR8 Mat. Values are taken as [0, 1] unless \p byte_range.
cv::Mat rgb_planar_to_bgr(const float* data, int height, int width, bool byte_range);

/// True when any value exceeds 1.5, i.e. the model emits [0, 255] rather than [0, 1].
bool looks_byte_range(const float* data, std::size_t count);

}  // namespace memoria::vision::detail
