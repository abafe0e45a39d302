#include <memoria/video/transition_generator.hpp>
#include <memoria/canvas/canvas_layout.hpp>
#include <memoria/core/error.hpp>
#include <memoria/vision/load_image.hpp>
#include <memoria/vision/safety.hpp>
#include "vision/frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <expected>

namespace memoria::video {

namespace mc = memoria::core;
namespace mv = memoria::vision;

namespace {

void poll(const mc::CancelCheck* cancel) {
  if (cancel && *cancel) (*cancel)();
}

bool is_blank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Linear cross-dissolve; alpha is clamped to [0, 1].
mc::Frame blend(const cv::Mat& a, const cv::Mat& b, double alpha) {
  alpha = std::clamp(alpha, 0.0, 1.0);
  cv::Mat out;
  cv::addWeighted(a, 1.0 - alpha, b, alpha, 0.0, out);
  return mv::detail::mat_to_frame(out, mc::PixelFormat::BGR8);
}

}  // namespace

bool is_allowed_transition_duration(int seconds) noexcept {
  return seconds == 6 || seconds == 10;
}

std::vector<std::size_t> transition_sample_indices(std::size_t total_frames, int step) {
  std::vector<std::size_t> out;
  if (total_frames <= 2) return out;
  const std::size_t s = static_cast<std::size_t>(std::max(1, step));
  for (std::size_t i = 1; i < total_frames - 1; i += s) out.push_back(i);
  if (out.back() != total_frames - 2) out.push_back(total_frames - 2);
  return out;
}

TransitionGenerator::TransitionGenerator(TransitionOptions options,
                                         std::shared_ptr<mv::ITransitionFrameBackend> backend,
                                         std::shared_ptr<mv::IAnimalDetector> detector,
                                         std::shared_ptr<IVideoEncoder> encoder)
    : options_(std::move(options)),
      backend_(std::move(backend)),
      detector_(std::move(detector)),
      encoder_(std::move(encoder)) {
  if (!backend_ || !detector_ || !encoder_) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument,
                              "TransitionGenerator: backend, detector and encoder are required");
  }
}

mc::Frame TransitionGenerator::load_canvas(const std::string& path) const {
  auto frame = mv::load_frame_from_image(path);
  if (!frame) {
    throw mc::PipelineFailure(mc::PipelineError::LoadFailed,
                              fmt::format("cannot decode canvas: {}", path));
  }
  if (static_cast<std::int32_t>(frame->width()) == options_.target_width &&
      static_cast<std::int32_t>(frame->height()) == options_.target_height) {
    return std::move(*frame);
  }
  // Not a canvas yet: normalize onto the safe background.
  canvas::CanvasOptions layout_opts;
  layout_opts.target_width = options_.target_width;
  layout_opts.target_height = options_.target_height;
  layout_opts.edge_blend_px = 0;
  return canvas::layout_canvas(*frame, layout_opts).safe_canvas;
}

std::vector<mc::Frame> TransitionGenerator::render_transition_frames(
    const mc::Frame& frame_a,
    const mc::Frame& frame_b,
    int duration_seconds,
    const std::string& prompt,
    const std::optional<std::string>& negative_prompt,
    const mc::CancelCheck* cancel) const {
  const auto a = mv::detail::frame_to_mat(frame_a);
  const auto b = mv::detail::frame_to_mat(frame_b);
  if (frame_a.format() != mc::PixelFormat::BGR8 || frame_b.format() != mc::PixelFormat::BGR8 ||
      !a || !b || a->size() != b->size()) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidFrame,
                              "transition endpoints must be BGR8 images of equal size");
  }

  const std::size_t total =
      static_cast<std::size_t>(std::max(2, duration_seconds * options_.fps));
  const std::size_t gen_step = static_cast<std::size_t>(std::max(1, options_.generation_step));

  std::vector<mc::Frame> frames;
  frames.reserve(total);
  for (std::size_t idx = 0; idx < total; ++idx) {
    if (idx == 0) {
      frames.push_back(frame_a);
      continue;
    }
    if (idx == total - 1) {
      frames.push_back(frame_b);
      continue;
    }
    mc::Frame base = blend(*a, *b, static_cast<double>(idx) / static_cast<double>(total - 1));
    if (idx % gen_step != 0) {
      frames.push_back(std::move(base));
      continue;
    }
    poll(cancel);
    auto generated = backend_->generate_frame(base, prompt, negative_prompt);
    if (!generated) {
      throw mc::PipelineFailure(generated.error(),
                                fmt::format("transition frame {} failed: {}", idx,
                                            mc::to_string(generated.error())));
    }
    if (generated->width() != base.width() || generated->height() != base.height() ||
        generated->format() != mc::PixelFormat::BGR8) {
      throw mc::PipelineFailure(mc::PipelineError::InferenceFailed,
                                fmt::format("transition frame {} has unexpected size", idx));
    }
    frames.push_back(std::move(*generated));
  }

  // Endpoints are pinned to the inputs whatever the backend did.
  frames.front() = frame_a;
  frames.back() = frame_b;
  return frames;
}

std::optional<std::string> TransitionGenerator::validate_frames(
    const std::vector<mc::Frame>& frames,
    const mc::Frame& frame_a,
    const mc::Frame& frame_b) const {
  if (frames.empty()) return "frames are empty";

  const auto full_mask =
      mc::Frame::filled(frame_a.width(), frame_a.height(), mc::PixelFormat::Grayscale8, 255);
  const auto start = mv::check_protected_region_unchanged(frame_a, frames.front(), full_mask, 0.0,
                                                          options_.protected_diff_threshold);
  if (!start.passed) return fmt::format("first frame mismatch: {}", start.reason.value_or(""));
  const auto end = mv::check_protected_region_unchanged(frame_b, frames.back(), full_mask, 0.0,
                                                        options_.protected_diff_threshold);
  if (!end.passed) return fmt::format("last frame mismatch: {}", end.reason.value_or(""));

  auto count = [this](const mc::Frame& f) -> std::expected<int, std::string> {
    if (!detector_->available()) {
      if (options_.strict_safety) {
        return std::unexpected(std::string("animal detector unavailable in strict mode"));
      }
      return 0;
    }
    auto dets = detector_->detect(f);
    if (!dets) {
      return std::unexpected(
          fmt::format("animal detector failed: {}", mc::to_string(dets.error())));
    }
    return static_cast<int>(dets->size());
  };

  const auto base_a = count(frame_a);
  if (!base_a) return base_a.error();
  const auto base_b = count(frame_b);
  if (!base_b) return base_b.error();
  const int baseline = std::max(*base_a, *base_b);
  const int allowed = std::max(0, options_.allowed_extra_animals);

  for (std::size_t idx : transition_sample_indices(frames.size(), options_.safety_sample_step)) {
    const auto n = count(frames[idx]);
    if (!n) return n.error();
    if (*n > baseline + allowed) {
      return fmt::format("extra animal detected on frame {}: count={}, baseline={}, allowed={}",
                         idx, *n, baseline, allowed);
    }
  }
  return std::nullopt;
}

mc::TransitionBuildResult TransitionGenerator::build_transition(
    const std::string& canvas_a_path,
    const std::string& canvas_b_path,
    const std::string& output_path,
    int duration_seconds,
    const std::string& prompt,
    const std::optional<std::string>& negative_prompt,
    const mc::CancelCheck* cancel) const {
  if (!is_allowed_transition_duration(duration_seconds)) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument,
                              "duration_seconds must be one of: 6, 10");
  }
  if (is_blank(prompt)) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument,
                              "prompt is required for generative transition");
  }

  mc::TransitionBuildResult result;
  result.output_path = output_path;

  if (options_.classic_provider) {
    encoder_->build_crossfade(canvas_a_path, canvas_b_path, output_path, duration_seconds);
    result.fallback_applied = true;
    result.fallback_reason = "classic provider configured";
    result.safety_message = "classic transition path";
    return result;
  }

  const mc::Frame frame_a = load_canvas(canvas_a_path);
  const mc::Frame frame_b = load_canvas(canvas_b_path);

  const int attempts = std::max(1, options_.max_attempts);
  std::string last_reason = "unknown generative transition failure";
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    poll(cancel);
    if (!backend_->available()) {
      last_reason = "generative adapter unavailable";
      spdlog::warn("transition attempt {}/{}: {}", attempt, attempts, last_reason);
      continue;
    }

    std::vector<mc::Frame> frames;
    std::optional<std::string> failure;
    try {
      frames = render_transition_frames(frame_a, frame_b, duration_seconds, prompt,
                                        negative_prompt, cancel);
      failure = validate_frames(frames, frame_a, frame_b);
    } catch (const mc::Canceled&) {
      throw;
    } catch (const std::exception& e) {
      failure = e.what();
    }

    poll(cancel);
    if (failure) {
      last_reason = *failure;
      spdlog::warn("transition attempt {}/{} ({}) rejected: {}", attempt, attempts,
                   backend_->name(), last_reason);
      continue;
    }

    encoder_->encode_frames(frames, output_path);
    spdlog::info("transition accepted on attempt {}/{} ({} frames)", attempt, attempts,
                 frames.size());
    result.used_generative = true;
    result.safety_message = "generative transition accepted";
    return result;
  }

  spdlog::warn("transition attempts exhausted, classic fallback ({})", last_reason);
  encoder_->build_crossfade(canvas_a_path, canvas_b_path, output_path, duration_seconds);
  result.used_generative = true;
  result.fallback_applied = true;
  result.fallback_reason = last_reason;
  result.safety_passed = false;
  result.safety_message = "generative attempts exhausted, classic fallback applied";
  return result;
}

}  // namespace memoria::video
