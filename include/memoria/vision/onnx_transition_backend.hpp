#pragma once

#include <memoria/vision/transition_frame_backend.hpp>
#include <memory>
#include <string>

namespace memoria::vision {

/// ONNX Runtime image-to-image backend for transition keyframes.
///
/// Expected model: one image input [1,3,H,W] (RGB in [0,1]) and one image output
/// of the same layout. Keyframes are processed at generation_width x
/// generation_height (or the model's fixed size) and resized back. Text prompts
/// are not model inputs here; they are logged for traceability only.
class OnnxTransitionBackend : public ITransitionFrameBackend {
 public:
  OnnxTransitionBackend(const std::string& model_path,
                        int generation_width = 800,
                        int generation_height = 450);
  ~OnnxTransitionBackend() override;

  OnnxTransitionBackend(const OnnxTransitionBackend&) = delete;
  OnnxTransitionBackend& operator=(const OnnxTransitionBackend&) = delete;

  [[nodiscard]] bool available() const override { return true; }

  [[nodiscard]] std::expected<memoria::core::Frame, memoria::core::PipelineError>
  generate_frame(const memoria::core::Frame& base_blend,
                 const std::string& prompt,
                 const std::optional<std::string>& negative_prompt) override;

  [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Model; }
  [[nodiscard]] std::string name() const override { return "onnx-transition"; }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace memoria::vision
