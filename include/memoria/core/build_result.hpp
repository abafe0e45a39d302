#pragma once

#include <memoria/core/frame.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace memoria::core {

/// Rectangle, in canvas coordinates, occupied by the resized source photo.
/// Invariant: 0 <= x, 0 <= y, x + width <= canvas width, y + height <= canvas height.
struct Placement {
  std::int32_t x{0};
  std::int32_t y{0};
  std::int32_t width{0};
  std::int32_t height{0};
};

/// Outcome of one canvas build. Produced once per source photo.
struct CanvasBuildResult {
  Frame image;
  bool used_outpaint{false};
  std::string adapter_name;
  bool fallback_applied{false};
  std::optional<std::string> fallback_reason;
  bool safety_passed{true};
  std::string safety_message;
};

/// Outcome of one transition build. One per adjacent photo pair.
struct TransitionBuildResult {
  std::string output_path;
  bool used_generative{false};
  bool fallback_applied{false};
  std::optional<std::string> fallback_reason;
  bool safety_passed{true};
  std::string safety_message;
};

}  // namespace memoria::core
