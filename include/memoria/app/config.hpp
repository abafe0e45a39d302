#pragma once

#include <memoria/canvas/canvas_options.hpp>
#include <memoria/video/transition_generator.hpp>
#include <memoria/video/video_encoder.hpp>
#include <memoria/vision/safety.hpp>
#include <cstdint>
#include <string>

namespace memoria::app {

/// Outpaint provider: auto (model if configured and loadable, else mirror), onnx, mirror.
enum class OutpaintProvider { Auto, Onnx, Mirror };

/// Animal detector provider: auto, onnx, null (always unavailable).
enum class DetectorProvider { Auto, Onnx, Null };

/// Transition provider: auto, onnx, classic (cross-fade only, no generation).
enum class TransitionProvider { Auto, Onnx, Classic };

/// Process-wide pipeline configuration. Read-only once a run starts.
struct PipelineConfig {
  std::string log_level{"info"};
  std::string ffmpeg_path{"ffmpeg"};

  std::int32_t target_width{1600};
  std::int32_t target_height{900};
  std::int32_t target_fps{24};
  std::string output_pixel_format{"yuv420p"};
  std::string output_video_codec{"libx264"};
  bool strict_safety_checks{true};

  // Canvas / outpaint
  std::int32_t outpaint_min_width_for_generation{900};
  std::int32_t outpaint_max_attempts{2};
  canvas::BackgroundStyle background_style{canvas::BackgroundStyle::BlurredCover};
  double background_blur_sigma{22.0};
  std::int32_t canvas_edge_blend_px{24};
  bool outpaint_fast_mode{false};
  bool enable_animal_detection{true};
  OutpaintProvider outpaint_provider{OutpaintProvider::Auto};
  std::string outpaint_model_path;
  std::int32_t outpaint_num_inference_steps{30};
  std::int32_t outpaint_fast_num_inference_steps{12};
  std::int32_t outpaint_fast_max_side{768};
  double fast_blend_seam_weight{0.8};
  double fast_blend_outer_weight{0.2};

  // Detector
  DetectorProvider animal_detector_provider{DetectorProvider::Auto};
  std::string animal_detector_model_path;
  float animal_detector_confidence_threshold{0.25f};

  // Transitions
  std::int32_t transition_max_attempts{2};
  TransitionProvider transition_provider{TransitionProvider::Auto};
  std::string transition_model_path;
  std::int32_t transition_generation_width{800};
  std::int32_t transition_generation_height{450};
  std::int32_t transition_generation_step{8};
  std::int32_t transition_allowed_extra_animals{0};
  std::int32_t transition_safety_sample_step{8};
  double transition_crossfade_seconds{1.0};

  vision::SafetyThresholds thresholds;
};

/// Default config when no file is provided.
PipelineConfig default_config();

/// Load config from a key=value file (one per line, '#' comments) on top of the
/// defaults. A missing file yields the defaults; unknown keys are ignored.
/// Throws core::PipelineFailure{InvalidConfig} on a malformed value.
PipelineConfig load_config(const std::string& path);

/// Overrides keys from MEMORIA_<UPPER_KEY> environment variables
/// (e.g. MEMORIA_TARGET_FPS=30). Same value rules as load_config.
void apply_env_overrides(PipelineConfig& config);

/// Sets one key from its textual value. Returns false for an unknown key;
/// throws core::PipelineFailure{InvalidConfig} for a malformed value.
bool set_config_value(PipelineConfig& config, const std::string& key, const std::string& value);

/// Throws core::PipelineFailure{InvalidConfig} on values no run can use
/// (non-positive sizes or fps, attempts < 1, weights outside [0, 1]).
void validate_config(const PipelineConfig& config);

// Component views of the config.
[[nodiscard]] vision::SafetyThresholds safety_thresholds(const PipelineConfig& config);
[[nodiscard]] canvas::CanvasOptions canvas_options(const PipelineConfig& config);
[[nodiscard]] video::TransitionOptions transition_options(const PipelineConfig& config);
[[nodiscard]] video::EncoderOptions encoder_options(const PipelineConfig& config);

}  // namespace memoria::app
