#pragma once

#include <memoria/vision/outpaint_backend.hpp>

namespace memoria::vision {

/// Non-generative reference outpaint: per row, masked pixels left of the first
/// unmasked column take that column's value, masked pixels right of the last
/// unmasked column take the last one's. For pipeline wiring only; the canvas
/// compositor never ships its output.
class MirrorOutpaintBackend : public IOutpaintBackend {
 public:
  [[nodiscard]] std::expected<memoria::core::Frame, memoria::core::PipelineError>
  outpaint(const memoria::core::Frame& base,
           const memoria::core::Frame& generation_mask,
           const OutpaintParams& params) override;

  [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Reference; }
  [[nodiscard]] std::string name() const override { return "mirror"; }
};

}  // namespace memoria::vision
