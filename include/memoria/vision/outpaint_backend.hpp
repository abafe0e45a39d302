#pragma once

#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/vision/backend_kind.hpp>
#include <expected>
#include <optional>
#include <string>

namespace memoria::vision {

/// Per-call knobs for outpainting.
struct OutpaintParams {
  std::optional<int> num_inference_steps;
  bool fast_mode{false};
};

/// Outpaint capability: fills the active pixels of a Grayscale8 generation mask
/// in a BGR8 base image and returns a new image of the same size.
/// Implementations must not modify \p base.
class IOutpaintBackend {
 public:
  virtual ~IOutpaintBackend() = default;

  [[nodiscard]] virtual std::expected<memoria::core::Frame, memoria::core::PipelineError>
  outpaint(const memoria::core::Frame& base,
           const memoria::core::Frame& generation_mask,
           const OutpaintParams& params) = 0;

  [[nodiscard]] virtual BackendKind kind() const noexcept = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace memoria::vision
