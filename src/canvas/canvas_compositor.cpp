#include <memoria/canvas/canvas_compositor.hpp>
#include <memoria/canvas/canvas_layout.hpp>
#include <memoria/core/error.hpp>
#include <memoria/vision/load_image.hpp>
#include <memoria/vision/safety.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <optional>
#include <utility>

namespace memoria::canvas {

namespace mc = memoria::core;
namespace mv = memoria::vision;

namespace {

void poll(const mc::CancelCheck* cancel) {
  if (cancel && *cancel) (*cancel)();
}

}  // namespace

CanvasCompositor::CanvasCompositor(CanvasOptions options,
                                   std::shared_ptr<mv::IOutpaintBackend> outpaint,
                                   std::shared_ptr<mv::IAnimalDetector> detector)
    : options_(std::move(options)),
      outpaint_(std::move(outpaint)),
      detector_(std::move(detector)) {
  if (!outpaint_ || !detector_) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument,
                              "CanvasCompositor: outpaint backend and detector are required");
  }
}

mc::CanvasBuildResult CanvasCompositor::build_canvas(const mc::Frame& photo,
                                                     bool fast_mode,
                                                     bool enable_animal_detection,
                                                     const mc::CancelCheck* cancel) const {
  const CanvasLayout layout = layout_canvas(photo, options_);
  const auto& placement = layout.placement;

  mc::CanvasBuildResult result;
  result.image = layout.safe_canvas;
  result.adapter_name = outpaint_->name();

  if (placement.width >= options_.target_width) {
    result.safety_message = "placement spans canvas width";
    return result;
  }
  if (placement.width < options_.min_generation_width) {
    result.fallback_applied = true;
    result.fallback_reason = "outpaint skipped by width policy";
    result.safety_message = "safe padding path";
    return result;
  }

  const bool generative = outpaint_->kind() != mv::BackendKind::Reference;
  const int attempts = fast_mode ? 1 : std::max(1, options_.max_attempts);
  mv::OutpaintParams params;
  params.fast_mode = fast_mode;
  params.num_inference_steps =
      fast_mode ? options_.fast_num_inference_steps : options_.num_inference_steps;

  std::string last_reason = "unknown outpaint failure";
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    poll(cancel);

    std::optional<mc::Frame> generated;
    try {
      auto out = outpaint_->outpaint(layout.safe_canvas, layout.masks.generation_mask, params);
      if (out) {
        generated = std::move(*out);
      } else {
        last_reason = fmt::format("outpaint execution failed: {}", mc::to_string(out.error()));
      }
    } catch (const std::exception& e) {
      last_reason = fmt::format("outpaint execution failed: {}", e.what());
    }

    poll(cancel);
    if (!generated) {
      spdlog::warn("canvas attempt {}/{} ({}): {}", attempt, attempts, outpaint_->name(), last_reason);
      continue;
    }
    if (generated->format() != mc::PixelFormat::BGR8 ||
        generated->width() != layout.safe_canvas.width() ||
        generated->height() != layout.safe_canvas.height()) {
      last_reason = "outpaint returned an image of unexpected size or format";
      spdlog::warn("canvas attempt {}/{} ({}): {}", attempt, attempts, outpaint_->name(), last_reason);
      continue;
    }

    mc::Frame candidate = restore_protected(*generated, layout.safe_canvas, placement);
    if (fast_mode) {
      candidate = fast_mode_ramp(candidate, layout.safe_canvas, placement,
                                 options_.fast_blend_seam_weight, options_.fast_blend_outer_weight);
    }

    std::optional<std::string> failure;
    try {
      const auto& th = options_.thresholds;
      auto check = mv::check_protected_region_unchanged(
          layout.safe_canvas, candidate, layout.masks.protected_mask,
          th.protected_max_changed_ratio, th.protected_diff_threshold);
      if (!check.passed) {
        failure = check.reason.value_or("protected region safety check failed");
      }
      if (!failure && generative && enable_animal_detection) {
        check = mv::check_no_new_animals_in_generated_region(
            candidate, layout.masks.generation_mask, *detector_, options_.strict_safety);
        if (!check.passed) failure = check.reason.value_or("new-animal safety check failed");
      }
      if (!failure && generative) {
        check = mv::check_generation_boundary_continuity(
            candidate, layout.masks.protected_mask, layout.masks.generation_mask, th);
        if (!check.passed) failure = check.reason.value_or("boundary continuity check failed");
      }
      if (!failure && generative) {
        check = mv::check_generated_region_naturalness(
            candidate, layout.masks.protected_mask, layout.masks.generation_mask, th);
        if (!check.passed) failure = check.reason.value_or("naturalness check failed");
      }
    } catch (const std::exception& e) {
      failure = fmt::format("safety validation failed: {}", e.what());
    }

    if (failure) {
      last_reason = *failure;
      spdlog::warn("canvas attempt {}/{} ({}) rejected: {}", attempt, attempts,
                   outpaint_->name(), last_reason);
      continue;
    }

    if (!generative) {
      spdlog::info("canvas: {} adapter passed checks; keeping safe composite", outpaint_->name());
      result.fallback_applied = true;
      result.fallback_reason = "mirror adapter selected; forced safe background fallback";
      result.safety_message = "reference adapter output discarded";
      return result;
    }

    spdlog::info("canvas: outpaint accepted on attempt {}/{}", attempt, attempts);
    result.image = std::move(candidate);
    result.used_outpaint = true;
    result.safety_message = "outpaint accepted";
    return result;
  }

  spdlog::warn("canvas: outpaint attempts exhausted, using safe composite ({})", last_reason);
  result.used_outpaint = true;
  result.fallback_applied = true;
  result.fallback_reason = last_reason;
  result.safety_passed = false;
  result.safety_message = "outpaint attempts exhausted, fallback applied";
  return result;
}

mc::CanvasBuildResult CanvasCompositor::run_canvas_job(const std::string& input_path,
                                                       const std::string& output_path,
                                                       bool fast_mode,
                                                       bool enable_animal_detection,
                                                       const mc::CancelCheck* cancel) const {
  auto photo = mv::load_frame_from_image(input_path);
  if (!photo) {
    throw mc::PipelineFailure(mc::PipelineError::LoadFailed,
                              fmt::format("cannot decode image: {}", input_path));
  }
  auto result = build_canvas(*photo, fast_mode, enable_animal_detection, cancel);
  if (auto saved = mv::save_frame_to_image(result.image, output_path); !saved) {
    throw mc::PipelineFailure(saved.error(),
                              fmt::format("cannot write canvas: {}", output_path));
  }
  return result;
}

}  // namespace memoria::canvas
