#include <memoria/app/pipeline_orchestrator.hpp>
#include <memoria/app/backend_registry.hpp>
#include <memoria/core/error.hpp>
#include <memoria/video/ffmpeg_encoder.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

namespace memoria::app {

namespace fs = std::filesystem;
namespace mc = memoria::core;

namespace {

constexpr int kPrepareEnd = 5;
constexpr int kCanvasEnd = 40;
constexpr int kTransitionEnd = 75;
constexpr int kLastClipEnd = 85;
constexpr int kRenderEnd = 99;

// Percent of item \p index out of \p count inside [begin, end).
int sub_progress(int begin, int end, std::size_t index, std::size_t count) {
  if (count == 0) return begin;
  return begin + static_cast<int>((static_cast<std::size_t>(end - begin) * index) / count);
}

bool is_blank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

void invalid(const std::string& what) {
  throw mc::PipelineFailure(mc::PipelineError::InvalidArgument, what);
}

void make_dir(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument,
                              fmt::format("cannot create {}: {}", dir.string(), ec.message()));
  }
}

PipelineServices checked(PipelineServices services) {
  if (!services.outpaint || !services.detector || !services.transition || !services.encoder) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument,
                              "PipelineOrchestrator: all services are required");
  }
  return services;
}

const PipelineConfig& validated(const PipelineConfig& config) {
  validate_config(config);
  return config;
}

}  // namespace

void validate_request(const PipelineRequest& r) {
  if (r.image_paths.empty()) invalid("image_paths must not be empty");
  if (is_blank(r.transition_prompt)) invalid("transition_prompt is required");
  if (r.working_dir.empty()) invalid("working_dir is required");
  if (r.final_output_path.empty()) invalid("final_output_path is required");
  if (!video::is_allowed_transition_duration(r.transition_duration_seconds)) {
    invalid("transition_duration_seconds must be one of: 6, 10");
  }
  if (r.last_clip_duration_seconds < 2 || r.last_clip_duration_seconds > 20) {
    invalid("last_clip_duration_seconds must be within 2..20");
  }
  if (!(r.bgm_volume >= 0.0 && r.bgm_volume <= 1.0)) {
    invalid("bgm_volume must be within 0..1");
  }

  std::error_code ec;
  for (const auto& p : r.image_paths) {
    if (!fs::is_regular_file(p, ec)) {
      throw mc::PipelineFailure(mc::PipelineError::NotFound,
                                fmt::format("input image not found: {}", p));
    }
  }
  if (r.bgm_path && !fs::is_regular_file(*r.bgm_path, ec)) {
    throw mc::PipelineFailure(mc::PipelineError::NotFound,
                              fmt::format("bgm not found: {}", *r.bgm_path));
  }
}

PipelineServices default_services(const PipelineConfig& config) {
  PipelineServices s;
  s.outpaint = default_outpaint_backend(config);
  s.detector = default_animal_detector(config);
  s.transition = default_transition_backend(config);
  s.encoder = std::make_shared<video::FfmpegVideoEncoder>(encoder_options(config));
  return s;
}

PipelineOrchestrator::PipelineOrchestrator(PipelineConfig config, PipelineServices services)
    : config_(validated(config)),
      services_(checked(std::move(services))),
      compositor_(canvas_options(config_), services_.outpaint, services_.detector),
      transitions_(transition_options(config_), services_.transition, services_.detector,
                   services_.encoder) {}

mc::PipelineRunSummary PipelineOrchestrator::run(const PipelineRequest& request,
                                                 const mc::ProgressCallback& on_progress,
                                                 const mc::CancelCheck& check_canceled) const {
  auto emit = [&](std::string_view stage, int percent, std::optional<std::string> detail) {
    spdlog::debug("progress {} {}%{}", stage, percent, detail ? " " + *detail : std::string());
    if (on_progress) on_progress(stage, percent, detail);
  };
  auto poll = [&]() {
    if (check_canceled) check_canceled();
  };
  const mc::CancelCheck* cancel = check_canceled ? &check_canceled : nullptr;

  // prepare
  emit("prepare", 0, "validating request");
  poll();
  validate_request(request);

  const fs::path root(request.working_dir);
  const fs::path canvas_dir = root / "canvas";
  const fs::path transition_dir = root / "transitions";
  const fs::path last_dir = root / "last";
  const fs::path render_dir = root / "render";
  for (const auto& d : {canvas_dir, transition_dir, last_dir, render_dir}) make_dir(d);
  emit("prepare", kPrepareEnd, std::nullopt);

  mc::PipelineRunSummary summary;
  summary.final_output_path = request.final_output_path;

  // canvas
  const std::size_t n = request.image_paths.size();
  for (std::size_t i = 0; i < n; ++i) {
    emit("canvas", sub_progress(kPrepareEnd, kCanvasEnd, i, n), fmt::format("image {}/{}", i + 1, n));
    poll();
    const auto out = (canvas_dir / fmt::format("canvas_{:04d}.jpg", i)).string();
    const auto result = compositor_.run_canvas_job(request.image_paths[i], out,
                                                   config_.outpaint_fast_mode,
                                                   config_.enable_animal_detection, cancel);
    summary.canvas_paths.push_back(out);
    if (result.fallback_applied) {
      ++summary.fallback_count;
      ++summary.canvas_fallback_count;
    }
    if (!result.safety_passed) ++summary.safety_failed_count;
    spdlog::info("canvas {}/{}: outpaint={} fallback={}{}", i + 1, n, result.used_outpaint,
                 result.fallback_applied,
                 result.fallback_reason ? " (" + *result.fallback_reason + ")" : std::string());
  }
  emit("canvas", kCanvasEnd, std::nullopt);

  // transition
  const std::size_t pairs = n - 1;
  for (std::size_t j = 0; j < pairs; ++j) {
    emit("transition", sub_progress(kCanvasEnd, kTransitionEnd, j, pairs),
         fmt::format("pair {}/{}", j + 1, pairs));
    poll();
    const auto out = (transition_dir / fmt::format("transition_{:04d}.mp4", j)).string();
    const auto result = transitions_.build_transition(
        summary.canvas_paths[j], summary.canvas_paths[j + 1], out,
        request.transition_duration_seconds, request.transition_prompt,
        request.transition_negative_prompt, cancel);
    summary.transition_paths.push_back(result.output_path);
    if (result.fallback_applied) {
      ++summary.fallback_count;
      ++summary.transition_fallback_count;
    }
    if (!result.safety_passed) ++summary.safety_failed_count;
    spdlog::info("transition {}/{}: generative={} fallback={}{}", j + 1, pairs,
                 result.used_generative, result.fallback_applied,
                 result.fallback_reason ? " (" + *result.fallback_reason + ")" : std::string());
  }
  emit("transition", kTransitionEnd, pairs == 0 ? std::optional<std::string>("single image")
                                                : std::nullopt);

  // last_clip
  emit("last_clip", kTransitionEnd, std::nullopt);
  poll();
  summary.last_clip_path = (last_dir / "last_clip.mp4").string();
  services_.encoder->build_still_clip(summary.canvas_paths.back(), summary.last_clip_path,
                                      request.last_clip_duration_seconds,
                                      request.last_clip_motion);
  emit("last_clip", kLastClipEnd, std::nullopt);

  // render
  emit("render", kLastClipEnd, std::nullopt);
  poll();
  std::vector<std::string> clips = summary.transition_paths;
  clips.push_back(summary.last_clip_path);
  services_.encoder->concat(clips, request.final_output_path, request.bgm_path,
                            request.bgm_volume);
  emit("render", kRenderEnd, std::nullopt);

  emit("completed", 100, request.final_output_path);
  spdlog::info("pipeline completed: {} (fallbacks={}, safety_failed={})",
               summary.final_output_path, summary.fallback_count, summary.safety_failed_count);
  return summary;
}

}  // namespace memoria::app
