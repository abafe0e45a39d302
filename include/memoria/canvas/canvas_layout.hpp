#pragma once

#include <memoria/canvas/canvas_options.hpp>
#include <memoria/core/build_result.hpp>
#include <memoria/core/frame.hpp>
#include <cstdint>

namespace memoria::canvas {

// Geometry and compositing helpers for the canvas compositor. Every function
// takes BGR8 (or Grayscale8 mask) Frames and returns new Frames; inputs are
// never modified. Functions throw core::PipelineFailure{InvalidFrame} on
// frames of the wrong format or size.

/// Aspect-preserving fit of a src_w x src_h photo into the target, centered.
/// scale = min(target_w / src_w, target_h / src_h); sizes are rounded and at least 1.
[[nodiscard]] core::Placement fit_placement(std::uint32_t src_w, std::uint32_t src_h,
                                            std::int32_t target_w, std::int32_t target_h);

/// Lanczos resize of \p photo to the placement size.
[[nodiscard]] core::Frame resize_to_placement(const core::Frame& photo,
                                              const core::Placement& placement);

/// Safe target-size background for \p photo. \p resized is the photo at placement size
/// (used by EdgeReflect).
[[nodiscard]] core::Frame build_background(const core::Frame& photo,
                                           const core::Frame& resized,
                                           const core::Placement& placement,
                                           const CanvasOptions& options);

/// Pastes \p resized at \p placement over \p background. When \p edge_blend_px > 0,
/// background pixels within that distance of the placement edge are ramped toward the
/// adjacent photo edge pixel; pixels inside the placement are copied exactly.
[[nodiscard]] core::Frame compose_center(const core::Frame& background,
                                         const core::Frame& resized,
                                         const core::Placement& placement,
                                         std::int32_t edge_blend_px);

/// Protected mask (the placement) and generation mask (full-height columns left and
/// right of the placement; top/bottom padding is never generated).
struct CanvasMasks {
  core::Frame protected_mask;
  core::Frame generation_mask;
};

[[nodiscard]] CanvasMasks make_masks(std::int32_t target_w, std::int32_t target_h,
                                     const core::Placement& placement);

/// Copy of \p candidate with the placement rectangle taken from \p reference.
[[nodiscard]] core::Frame restore_protected(const core::Frame& candidate,
                                            const core::Frame& reference,
                                            const core::Placement& placement);

/// Blends generated side bands of \p candidate toward \p safe. The weight of \p safe
/// runs linearly from \p seam_weight next to the placement to \p outer_weight at the
/// canvas edge. The placement itself is untouched.
[[nodiscard]] core::Frame fast_mode_ramp(const core::Frame& candidate,
                                         const core::Frame& safe,
                                         const core::Placement& placement,
                                         double seam_weight,
                                         double outer_weight);

/// Everything the compositor needs before any generation attempt.
struct CanvasLayout {
  core::Placement placement;
  core::Frame safe_canvas;
  CanvasMasks masks;
};

/// Placement, safe composite and masks for \p photo under \p options.
[[nodiscard]] CanvasLayout layout_canvas(const core::Frame& photo, const CanvasOptions& options);

}  // namespace memoria::canvas
