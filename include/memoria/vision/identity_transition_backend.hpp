#pragma once

#include <memoria/vision/transition_frame_backend.hpp>

namespace memoria::vision {

/// Reference transition backend: reports unavailable and returns its input unchanged,
/// so transitions resolve to blend-only or classic output.
class IdentityTransitionBackend : public ITransitionFrameBackend {
 public:
  [[nodiscard]] bool available() const override { return false; }

  [[nodiscard]] std::expected<memoria::core::Frame, memoria::core::PipelineError>
  generate_frame(const memoria::core::Frame& base_blend,
                 const std::string& prompt,
                 const std::optional<std::string>& negative_prompt) override;

  [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Reference; }
  [[nodiscard]] std::string name() const override { return "classic"; }
};

}  // namespace memoria::vision
