#pragma once

#include <memoria/core/frame.hpp>
#include <memoria/vision/animal_detector.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace memoria::vision {

/// Outcome of one safety validator.
struct SafetyCheckResult {
  bool passed{true};
  std::optional<std::string> reason;

  [[nodiscard]] static SafetyCheckResult pass() { return {}; }
  [[nodiscard]] static SafetyCheckResult fail(std::string why) {
    return SafetyCheckResult{false, std::move(why)};
  }
};

/// Numeric limits shared by the validators. Defaults are the production thresholds.
struct SafetyThresholds {
  // protected-region-unchanged
  int protected_diff_threshold{8};
  double protected_max_changed_ratio{0.001};

  // boundary-continuity
  double boundary_max_mean_diff{34.0};
  double boundary_max_p95_diff{86.0};
  std::size_t boundary_min_pair_count{120};

  // generated-region-naturalness
  int naturalness_ref_band_width{72};
  std::size_t naturalness_min_pixels_per_side{1800};
  double naturalness_max_mean_delta{0.26};
  double naturalness_max_std_delta{0.36};
  double naturalness_max_grad_ratio{3.0};
  double naturalness_max_edge_density_ratio{3.5};
  double naturalness_edge_threshold{26.0};
};

// All validators are pure: they read their inputs and return a verdict.
// Images are BGR8 Frames, masks are Grayscale8 Frames of the same size
// (any non-zero byte counts as active). Malformed inputs fail with a reason.

/// Counts pixels inside \p protected_mask whose max-channel absolute difference
/// between \p base and \p candidate exceeds \p diff_threshold. Fails when the
/// changed ratio exceeds \p max_changed_ratio, or when the mask is empty.
[[nodiscard]] SafetyCheckResult check_protected_region_unchanged(
    const memoria::core::Frame& base,
    const memoria::core::Frame& candidate,
    const memoria::core::Frame& protected_mask,
    double max_changed_ratio = 0.001,
    int diff_threshold = 8);

/// Runs \p detector on \p candidate and fails if any detection box overlaps the
/// generation mask. An unavailable detector fails in strict mode when the mask is non-empty.
[[nodiscard]] SafetyCheckResult check_no_new_animals_in_generated_region(
    const memoria::core::Frame& candidate,
    const memoria::core::Frame& generation_mask,
    IAnimalDetector& detector,
    bool strict_mode);

/// Horizontal seam check: max-channel difference of horizontally adjacent pixel
/// pairs that straddle the protected/generation boundary. Fails on mean or p95
/// above limits once at least boundary_min_pair_count pairs exist.
[[nodiscard]] SafetyCheckResult check_generation_boundary_continuity(
    const memoria::core::Frame& candidate,
    const memoria::core::Frame& protected_mask,
    const memoria::core::Frame& generation_mask,
    const SafetyThresholds& limits = {});

/// Compares colour mean, colour std, mean gradient magnitude and edge density of
/// each generated side band against an adjacent reference band inside the
/// protected region. Each side is judged only when both bands have at least
/// naturalness_min_pixels_per_side pixels.
[[nodiscard]] SafetyCheckResult check_generated_region_naturalness(
    const memoria::core::Frame& candidate,
    const memoria::core::Frame& protected_mask,
    const memoria::core::Frame& generation_mask,
    const SafetyThresholds& limits = {});

}  // namespace memoria::vision
