#include <memoria/app/config.hpp>
#include <memoria/core/error.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace memoria::app {

namespace mc = memoria::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

[[noreturn]] void bad_value(const std::string& key, const std::string& value) {
  throw mc::PipelineFailure(mc::PipelineError::InvalidConfig,
                            fmt::format("invalid value for {}: '{}'", key, value));
}

std::int32_t to_int(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const long v = std::stol(value, &used);
    if (used != value.size()) bad_value(key, value);
    if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
      bad_value(key, value);
    }
    return static_cast<std::int32_t>(v);
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

std::size_t to_size(const std::string& key, const std::string& value) {
  const auto v = to_int(key, value);
  if (v < 0) bad_value(key, value);
  return static_cast<std::size_t>(v);
}

double to_double(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const double v = std::stod(value, &used);
    if (used != value.size()) bad_value(key, value);
    return v;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

bool to_bool(const std::string& key, std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
  if (value == "0" || value == "false" || value == "no" || value == "off") return false;
  bad_value(key, value);
}

// Every key set_config_value understands; drives apply_env_overrides.
constexpr std::array<std::string_view, 46> kKeys{
    "log_level", "ffmpeg_path", "target_width", "target_height", "target_fps",
    "output_pixel_format", "output_video_codec", "strict_safety_checks",
    "outpaint_min_width_for_generation", "outpaint_max_attempts", "background_style",
    "background_blur_sigma", "canvas_edge_blend_px", "outpaint_fast_mode",
    "enable_animal_detection", "outpaint_provider", "outpaint_model_path",
    "outpaint_num_inference_steps", "outpaint_fast_num_inference_steps",
    "outpaint_fast_max_side", "fast_blend_seam_weight", "fast_blend_outer_weight",
    "animal_detector_provider", "animal_detector_model_path",
    "animal_detector_confidence_threshold", "transition_max_attempts", "transition_provider",
    "transition_model_path", "transition_generation_width", "transition_generation_height",
    "transition_generation_step", "transition_allowed_extra_animals",
    "transition_safety_sample_step", "transition_crossfade_seconds",
    "protected_diff_threshold", "protected_max_changed_ratio", "boundary_max_mean_diff",
    "boundary_max_p95_diff", "boundary_min_pair_count", "naturalness_ref_band_width",
    "naturalness_min_pixels_per_side", "naturalness_max_mean_delta",
    "naturalness_max_std_delta", "naturalness_max_grad_ratio",
    "naturalness_max_edge_density_ratio", "naturalness_edge_threshold",
};

}  // namespace

PipelineConfig default_config() {
  return PipelineConfig{};
}

bool set_config_value(PipelineConfig& c, const std::string& key, const std::string& value) {
  auto& t = c.thresholds;
  if (key == "log_level") c.log_level = value;
  else if (key == "ffmpeg_path") c.ffmpeg_path = value;
  else if (key == "target_width") c.target_width = to_int(key, value);
  else if (key == "target_height") c.target_height = to_int(key, value);
  else if (key == "target_fps") c.target_fps = to_int(key, value);
  else if (key == "output_pixel_format") c.output_pixel_format = value;
  else if (key == "output_video_codec") c.output_video_codec = value;
  else if (key == "strict_safety_checks") c.strict_safety_checks = to_bool(key, value);
  else if (key == "outpaint_min_width_for_generation") c.outpaint_min_width_for_generation = to_int(key, value);
  else if (key == "outpaint_max_attempts") c.outpaint_max_attempts = to_int(key, value);
  else if (key == "background_style") {
    if (!canvas::parse_background_style(value, c.background_style)) bad_value(key, value);
  }
  else if (key == "background_blur_sigma") c.background_blur_sigma = to_double(key, value);
  else if (key == "canvas_edge_blend_px") c.canvas_edge_blend_px = to_int(key, value);
  else if (key == "outpaint_fast_mode") c.outpaint_fast_mode = to_bool(key, value);
  else if (key == "enable_animal_detection") c.enable_animal_detection = to_bool(key, value);
  else if (key == "outpaint_provider") {
    if (value == "auto") c.outpaint_provider = OutpaintProvider::Auto;
    else if (value == "onnx") c.outpaint_provider = OutpaintProvider::Onnx;
    else if (value == "mirror") c.outpaint_provider = OutpaintProvider::Mirror;
    else bad_value(key, value);
  }
  else if (key == "outpaint_model_path") c.outpaint_model_path = value;
  else if (key == "outpaint_num_inference_steps") c.outpaint_num_inference_steps = to_int(key, value);
  else if (key == "outpaint_fast_num_inference_steps") c.outpaint_fast_num_inference_steps = to_int(key, value);
  else if (key == "outpaint_fast_max_side") c.outpaint_fast_max_side = to_int(key, value);
  else if (key == "fast_blend_seam_weight") c.fast_blend_seam_weight = to_double(key, value);
  else if (key == "fast_blend_outer_weight") c.fast_blend_outer_weight = to_double(key, value);
  else if (key == "animal_detector_provider") {
    if (value == "auto") c.animal_detector_provider = DetectorProvider::Auto;
    else if (value == "onnx") c.animal_detector_provider = DetectorProvider::Onnx;
    else if (value == "null") c.animal_detector_provider = DetectorProvider::Null;
    else bad_value(key, value);
  }
  else if (key == "animal_detector_model_path") c.animal_detector_model_path = value;
  else if (key == "animal_detector_confidence_threshold") {
    c.animal_detector_confidence_threshold = static_cast<float>(to_double(key, value));
  }
  else if (key == "transition_max_attempts") c.transition_max_attempts = to_int(key, value);
  else if (key == "transition_provider") {
    if (value == "auto") c.transition_provider = TransitionProvider::Auto;
    else if (value == "onnx") c.transition_provider = TransitionProvider::Onnx;
    else if (value == "classic") c.transition_provider = TransitionProvider::Classic;
    else bad_value(key, value);
  }
  else if (key == "transition_model_path") c.transition_model_path = value;
  else if (key == "transition_generation_width") c.transition_generation_width = to_int(key, value);
  else if (key == "transition_generation_height") c.transition_generation_height = to_int(key, value);
  else if (key == "transition_generation_step") c.transition_generation_step = to_int(key, value);
  else if (key == "transition_allowed_extra_animals") c.transition_allowed_extra_animals = to_int(key, value);
  else if (key == "transition_safety_sample_step") c.transition_safety_sample_step = to_int(key, value);
  else if (key == "transition_crossfade_seconds") c.transition_crossfade_seconds = to_double(key, value);
  else if (key == "protected_diff_threshold") t.protected_diff_threshold = to_int(key, value);
  else if (key == "protected_max_changed_ratio") t.protected_max_changed_ratio = to_double(key, value);
  else if (key == "boundary_max_mean_diff") t.boundary_max_mean_diff = to_double(key, value);
  else if (key == "boundary_max_p95_diff") t.boundary_max_p95_diff = to_double(key, value);
  else if (key == "boundary_min_pair_count") t.boundary_min_pair_count = to_size(key, value);
  else if (key == "naturalness_ref_band_width") t.naturalness_ref_band_width = to_int(key, value);
  else if (key == "naturalness_min_pixels_per_side") t.naturalness_min_pixels_per_side = to_size(key, value);
  else if (key == "naturalness_max_mean_delta") t.naturalness_max_mean_delta = to_double(key, value);
  else if (key == "naturalness_max_std_delta") t.naturalness_max_std_delta = to_double(key, value);
  else if (key == "naturalness_max_grad_ratio") t.naturalness_max_grad_ratio = to_double(key, value);
  else if (key == "naturalness_max_edge_density_ratio") t.naturalness_max_edge_density_ratio = to_double(key, value);
  else if (key == "naturalness_edge_threshold") t.naturalness_edge_threshold = to_double(key, value);
  else return false;
  return true;
}

PipelineConfig load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    set_config_value(c, key, value);
  }
  return c;
}

void apply_env_overrides(PipelineConfig& config) {
  for (const auto key_view : kKeys) {
    const std::string key(key_view);
    std::string env_name = "MEMORIA_";
    for (const char ch : key) {
      env_name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    const char* raw = std::getenv(env_name.c_str());
    if (raw == nullptr) continue;
    std::string value(raw);
    trim(value);
    set_config_value(config, key, value);
  }
}

void validate_config(const PipelineConfig& c) {
  auto fail = [](const char* what) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidConfig, what);
  };
  if (c.target_width <= 0 || c.target_height <= 0) fail("target_width/target_height must be positive");
  if (c.target_fps <= 0) fail("target_fps must be positive");
  if (c.outpaint_max_attempts < 1) fail("outpaint_max_attempts must be at least 1");
  if (c.transition_max_attempts < 1) fail("transition_max_attempts must be at least 1");
  if (c.canvas_edge_blend_px < 0) fail("canvas_edge_blend_px must not be negative");
  if (c.fast_blend_seam_weight < 0.0 || c.fast_blend_seam_weight > 1.0 ||
      c.fast_blend_outer_weight < 0.0 || c.fast_blend_outer_weight > 1.0) {
    fail("fast blend weights must be within [0, 1]");
  }
  if (c.transition_generation_width <= 0 || c.transition_generation_height <= 0) {
    fail("transition generation size must be positive");
  }
  if (c.transition_crossfade_seconds < 0.0) fail("transition_crossfade_seconds must not be negative");
  if (c.ffmpeg_path.empty()) fail("ffmpeg_path must not be empty");
}

vision::SafetyThresholds safety_thresholds(const PipelineConfig& config) {
  return config.thresholds;
}

canvas::CanvasOptions canvas_options(const PipelineConfig& c) {
  canvas::CanvasOptions o;
  o.target_width = c.target_width;
  o.target_height = c.target_height;
  o.min_generation_width = c.outpaint_min_width_for_generation;
  o.max_attempts = c.outpaint_max_attempts;
  o.strict_safety = c.strict_safety_checks;
  o.background_style = c.background_style;
  o.background_blur_sigma = c.background_blur_sigma;
  o.edge_blend_px = c.canvas_edge_blend_px;
  o.num_inference_steps = c.outpaint_num_inference_steps;
  o.fast_num_inference_steps = c.outpaint_fast_num_inference_steps;
  o.fast_blend_seam_weight = c.fast_blend_seam_weight;
  o.fast_blend_outer_weight = c.fast_blend_outer_weight;
  o.thresholds = safety_thresholds(c);
  return o;
}

video::TransitionOptions transition_options(const PipelineConfig& c) {
  video::TransitionOptions o;
  o.target_width = c.target_width;
  o.target_height = c.target_height;
  o.fps = c.target_fps;
  o.max_attempts = c.transition_max_attempts;
  o.generation_step = c.transition_generation_step;
  o.safety_sample_step = c.transition_safety_sample_step;
  o.allowed_extra_animals = c.transition_allowed_extra_animals;
  o.protected_diff_threshold = c.thresholds.protected_diff_threshold;
  o.strict_safety = c.strict_safety_checks;
  o.classic_provider = c.transition_provider == TransitionProvider::Classic;
  return o;
}

video::EncoderOptions encoder_options(const PipelineConfig& c) {
  video::EncoderOptions o;
  o.ffmpeg_path = c.ffmpeg_path;
  o.width = c.target_width;
  o.height = c.target_height;
  o.fps = c.target_fps;
  o.pixel_format = c.output_pixel_format;
  o.video_codec = c.output_video_codec;
  o.crossfade_seconds = c.transition_crossfade_seconds;
  return o;
}

}  // namespace memoria::app
