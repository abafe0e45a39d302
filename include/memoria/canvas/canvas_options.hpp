#pragma once

#include <memoria/vision/safety.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace memoria::canvas {

/// Non-generative background behind the placed photo.
enum class BackgroundStyle : std::uint8_t {
  BlurredCover,  // cover-resized, center-cropped, Gaussian-blurred copy of the photo
  EdgeReflect,   // placed photo reflected outward at its borders
};

[[nodiscard]] std::string_view to_string(BackgroundStyle style) noexcept;

/// Parses "blurred_cover" / "edge_reflect"; false on anything else.
[[nodiscard]] bool parse_background_style(std::string_view text, BackgroundStyle& out) noexcept;

/// Canvas compositor settings.
struct CanvasOptions {
  std::int32_t target_width{1600};
  std::int32_t target_height{900};
  std::int32_t min_generation_width{900};
  std::int32_t max_attempts{2};
  bool strict_safety{true};

  BackgroundStyle background_style{BackgroundStyle::BlurredCover};
  double background_blur_sigma{22.0};
  std::int32_t edge_blend_px{24};

  std::int32_t num_inference_steps{30};
  std::int32_t fast_num_inference_steps{12};
  double fast_blend_seam_weight{0.8};
  double fast_blend_outer_weight{0.2};

  vision::SafetyThresholds thresholds;
};

}  // namespace memoria::canvas
