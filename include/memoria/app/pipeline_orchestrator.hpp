#pragma once

#include <memoria/app/config.hpp>
#include <memoria/canvas/canvas_compositor.hpp>
#include <memoria/core/progress.hpp>
#include <memoria/core/run_summary.hpp>
#include <memoria/video/transition_generator.hpp>
#include <memoria/video/video_encoder.hpp>
#include <memoria/vision/animal_detector.hpp>
#include <memoria/vision/outpaint_backend.hpp>
#include <memoria/vision/transition_frame_backend.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace memoria::app {

/// One memorial-video run.
struct PipelineRequest {
  std::vector<std::string> image_paths;
  std::string working_dir;
  std::string final_output_path;
  int transition_duration_seconds{6};
  std::string transition_prompt;
  std::optional<std::string> transition_negative_prompt;
  int last_clip_duration_seconds{4};
  video::MotionStyle last_clip_motion{video::MotionStyle::ZoomIn};
  std::optional<std::string> bgm_path;
  double bgm_volume{0.15};
};

/// Throws core::PipelineFailure{InvalidArgument} for an unusable request and
/// core::PipelineFailure{NotFound} when an input image or the bgm file is missing.
void validate_request(const PipelineRequest& request);

/// Collaborators of a run. All four are required.
struct PipelineServices {
  std::shared_ptr<vision::IOutpaintBackend> outpaint;
  std::shared_ptr<vision::IAnimalDetector> detector;
  std::shared_ptr<vision::ITransitionFrameBackend> transition;
  std::shared_ptr<video::IVideoEncoder> encoder;
};

/// Services from the process-wide registry plus an ffmpeg encoder.
[[nodiscard]] PipelineServices default_services(const PipelineConfig& config);

/// Sequences prepare -> canvas (per image) -> transition (per adjacent pair) ->
/// last_clip -> render -> completed, reporting progress and polling cancellation
/// at the start of each stage and each loop iteration.
///
/// Progress: prepare 0..5, canvas 5..40, transition 40..75, last_clip 75..85,
/// render 85..99, completed 100; non-decreasing within a run.
/// Whatever the cancel check throws (core::Canceled) propagates unchanged; no
/// cleanup of partial artifacts is attempted. One run executes on the calling thread.
class PipelineOrchestrator {
 public:
  /// Throws core::PipelineFailure{InvalidArgument} if a service is missing and
  /// core::PipelineFailure{InvalidConfig} for an unusable config.
  PipelineOrchestrator(PipelineConfig config, PipelineServices services);

  core::PipelineRunSummary run(const PipelineRequest& request,
                               const core::ProgressCallback& on_progress = {},
                               const core::CancelCheck& check_canceled = {}) const;

  [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

 private:
  PipelineConfig config_;
  PipelineServices services_;
  canvas::CanvasCompositor compositor_;
  video::TransitionGenerator transitions_;
};

}  // namespace memoria::app
