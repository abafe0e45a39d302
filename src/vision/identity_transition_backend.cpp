#include <memoria/vision/identity_transition_backend.hpp>

namespace memoria::vision {

std::expected<memoria::core::Frame, memoria::core::PipelineError>
IdentityTransitionBackend::generate_frame(const memoria::core::Frame& base_blend,
                                          const std::string& /*prompt*/,
                                          const std::optional<std::string>& /*negative_prompt*/) {
  if (base_blend.empty()) {
    return std::unexpected(memoria::core::PipelineError::InvalidFrame);
  }
  return base_blend;
}

}  // namespace memoria::vision
