#pragma once

#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/vision/backend_kind.hpp>
#include <expected>
#include <optional>
#include <string>

namespace memoria::vision {

/// Transition-frame capability: refines a cross-dissolve keyframe (BGR8) into a
/// generated in-between frame of the same size.
class ITransitionFrameBackend {
 public:
  virtual ~ITransitionFrameBackend() = default;

  [[nodiscard]] virtual bool available() const = 0;

  [[nodiscard]] virtual std::expected<memoria::core::Frame, memoria::core::PipelineError>
  generate_frame(const memoria::core::Frame& base_blend,
                 const std::string& prompt,
                 const std::optional<std::string>& negative_prompt) = 0;

  [[nodiscard]] virtual BackendKind kind() const noexcept = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace memoria::vision
