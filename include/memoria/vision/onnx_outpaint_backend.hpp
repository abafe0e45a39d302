#pragma once

#include <memoria/vision/outpaint_backend.hpp>
#include <memory>
#include <string>

namespace memoria::vision {

/// ONNX Runtime outpaint backend for single-pass inpainting exports (LaMa-style).
///
/// Expected model: inputs image [1,3,H,W] (RGB in [0,1]) and mask [1,1,H,W]
/// (1 = fill), output image [1,3,H,W] in [0,1] or [0,255]. Dynamic H/W are fed
/// at the working size rounded up to a multiple of 8; fixed H/W are honoured by
/// resizing. In fast mode the working size is capped at \p fast_max_side.
class OnnxOutpaintBackend : public IOutpaintBackend {
 public:
  /// Throws Ort::Exception if the model cannot be loaded, std::runtime_error on unexpected I/O layout.
  OnnxOutpaintBackend(const std::string& model_path, int fast_max_side = 768);
  ~OnnxOutpaintBackend() override;

  OnnxOutpaintBackend(const OnnxOutpaintBackend&) = delete;
  OnnxOutpaintBackend& operator=(const OnnxOutpaintBackend&) = delete;

  [[nodiscard]] std::expected<memoria::core::Frame, memoria::core::PipelineError>
  outpaint(const memoria::core::Frame& base,
           const memoria::core::Frame& generation_mask,
           const OutpaintParams& params) override;

  [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Model; }
  [[nodiscard]] std::string name() const override { return "onnx-outpaint"; }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace memoria::vision
