#include <memoria/video/ffmpeg_encoder.hpp>
#include <memoria/core/error.hpp>
#include <memoria/vision/load_image.hpp>
#include "subprocess.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace memoria::video {

namespace fs = std::filesystem;
namespace mc = memoria::core;

namespace {

void ensure_parent(const std::string& output_path) {
  const fs::path parent = fs::path(output_path).parent_path();
  if (parent.empty()) return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    throw mc::PipelineFailure(mc::PipelineError::EncoderFailed,
                              fmt::format("cannot create {}: {}", parent.string(), ec.message()));
  }
}

void require_file(const std::string& path, const char* what) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw mc::PipelineFailure(mc::PipelineError::NotFound, fmt::format("{} not found: {}", what, path));
  }
}

std::string absolute_string(const fs::path& p) {
  std::error_code ec;
  auto abs = fs::absolute(p, ec);
  return ec ? p.string() : abs.string();
}

}  // namespace

// ' closes the quoted token, so it is written as '\''.
std::string concat_quote(const std::string& path) {
  std::string out;
  out.reserve(path.size());
  for (const char c : path) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  return out;
}

namespace {

// scale + pad to the canvas, keeping aspect.
std::string fit_filter(const EncoderOptions& o) {
  return fmt::format(
      "scale={0}:{1}:force_original_aspect_ratio=decrease,pad={0}:{1}:(ow-iw)/2:(oh-ih)/2",
      o.width, o.height);
}

std::string motion_filter(const EncoderOptions& o, MotionStyle motion) {
  switch (motion) {
    case MotionStyle::ZoomOut:
      return fmt::format(
          "zoompan=z='if(lte(on,1),1.08,max(1.0,zoom-0.0008))':"
          "x='iw/2-(iw/zoom/2)':y='ih/2-(ih/zoom/2)':d=1:s={}x{}:fps={}",
          o.width, o.height, o.fps);
    case MotionStyle::None:
      return fmt::format("fps={}", o.fps);
    case MotionStyle::ZoomIn:
      break;
  }
  return fmt::format(
      "zoompan=z='min(zoom+0.0008,1.08)':"
      "x='iw/2-(iw/zoom/2)':y='ih/2-(ih/zoom/2)':d=1:s={}x{}:fps={}",
      o.width, o.height, o.fps);
}

}  // namespace

std::string_view to_string(MotionStyle style) noexcept {
  switch (style) {
    case MotionStyle::ZoomIn: return "zoom_in";
    case MotionStyle::ZoomOut: return "zoom_out";
    case MotionStyle::None: return "none";
  }
  return "unknown";
}

bool parse_motion_style(std::string_view text, MotionStyle& out) noexcept {
  if (text == "zoom_in") out = MotionStyle::ZoomIn;
  else if (text == "zoom_out") out = MotionStyle::ZoomOut;
  else if (text == "none") out = MotionStyle::None;
  else return false;
  return true;
}

FfmpegVideoEncoder::FfmpegVideoEncoder(EncoderOptions options) : options_(std::move(options)) {
  if (options_.width <= 0 || options_.height <= 0 || options_.fps <= 0) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidConfig,
                              "encoder width, height and fps must be positive");
  }
}

void FfmpegVideoEncoder::run(const std::vector<std::string>& args, const char* what) const {
  spdlog::debug("ffmpeg {}: {} args", what, args.size());
  detail::ProcessResult proc;
  try {
    proc = detail::run_process(args);
  } catch (const std::system_error& e) {
    throw mc::PipelineFailure(mc::PipelineError::EncoderFailed,
                              fmt::format("ffmpeg {} could not start: {}", what, e.what()));
  }
  if (proc.exit_code != 0) {
    std::string msg = proc.stderr_text;
    const auto end = msg.find_last_not_of(" \t\r\n");
    msg.erase(end == std::string::npos ? 0 : end + 1);
    if (msg.empty()) msg = fmt::format("ffmpeg {} failed (exit {})", what, proc.exit_code);
    spdlog::error("ffmpeg {} failed with exit code {}", what, proc.exit_code);
    throw mc::PipelineFailure(mc::PipelineError::EncoderFailed, msg);
  }
}

void FfmpegVideoEncoder::encode_frames(const std::vector<mc::Frame>& frames,
                                       const std::string& output_path) {
  if (frames.empty()) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument, "encode_frames: no frames");
  }
  ensure_parent(output_path);

  detail::ScopedTempDir tmp("memoria_frames_");
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const auto file = tmp.path() / fmt::format("frame_{:06d}.png", i);
    if (auto saved = vision::save_frame_to_image(frames[i], file.string()); !saved) {
      throw mc::PipelineFailure(mc::PipelineError::EncoderFailed,
                                fmt::format("cannot write frame {}: {}", i, mc::to_string(saved.error())));
    }
  }

  const std::string fps = std::to_string(options_.fps);
  run({options_.ffmpeg_path, "-y", "-framerate", fps,
       "-i", (tmp.path() / "frame_%06d.png").string(),
       "-r", fps, "-pix_fmt", options_.pixel_format, "-c:v", options_.video_codec, output_path},
      "frame-to-video");
}

std::vector<std::string> FfmpegVideoEncoder::crossfade_args(const std::string& image_a_path,
                                                            const std::string& image_b_path,
                                                            const std::string& output_path,
                                                            int duration_seconds) const {
  const double fade = std::max(0.0, options_.crossfade_seconds);
  const double offset = std::max(0.0, duration_seconds - fade);
  const std::string input_chain =
      fmt::format("{},format={},fps={}", fit_filter(options_), options_.pixel_format, options_.fps);
  const std::string filter = fmt::format(
      "[0:v]{0}[v0];[1:v]{0}[v1];[v0][v1]xfade=transition=fade:duration={1}:offset={2},format={3}",
      input_chain, fade, offset, options_.pixel_format);
  const std::string d = std::to_string(duration_seconds);
  return {options_.ffmpeg_path, "-y",
          "-loop", "1", "-t", d, "-i", image_a_path,
          "-loop", "1", "-t", d, "-i", image_b_path,
          "-filter_complex", filter,
          "-t", d, "-r", std::to_string(options_.fps),
          "-pix_fmt", options_.pixel_format, "-c:v", options_.video_codec, output_path};
}

void FfmpegVideoEncoder::build_crossfade(const std::string& image_a_path,
                                         const std::string& image_b_path,
                                         const std::string& output_path,
                                         int duration_seconds) {
  require_file(image_a_path, "transition image");
  require_file(image_b_path, "transition image");
  ensure_parent(output_path);
  run(crossfade_args(image_a_path, image_b_path, output_path, duration_seconds), "crossfade");
}

std::vector<std::string> FfmpegVideoEncoder::still_clip_args(const std::string& image_path,
                                                             const std::string& output_path,
                                                             int duration_seconds,
                                                             MotionStyle motion) const {
  const std::string vf = fmt::format("{},{},format={}", fit_filter(options_),
                                     motion_filter(options_, motion), options_.pixel_format);
  const std::string d = std::to_string(duration_seconds);
  return {options_.ffmpeg_path, "-y", "-loop", "1", "-t", d, "-i", image_path,
          "-vf", vf, "-t", d, "-r", std::to_string(options_.fps),
          "-pix_fmt", options_.pixel_format, "-c:v", options_.video_codec, output_path};
}

void FfmpegVideoEncoder::build_still_clip(const std::string& image_path,
                                          const std::string& output_path,
                                          int duration_seconds,
                                          MotionStyle motion) {
  require_file(image_path, "still image");
  ensure_parent(output_path);
  run(still_clip_args(image_path, output_path, duration_seconds, motion), "still clip");
}

void FfmpegVideoEncoder::concat(const std::vector<std::string>& clip_paths,
                                const std::string& output_path,
                                const std::optional<std::string>& bgm_path,
                                double bgm_volume) {
  if (clip_paths.empty()) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument, "concat: no clips");
  }
  for (const auto& clip : clip_paths) require_file(clip, "clip");
  if (bgm_path) require_file(*bgm_path, "bgm");
  ensure_parent(output_path);

  const std::string fps = std::to_string(options_.fps);
  detail::ScopedTempDir tmp("memoria_concat_");

  // Normalize every clip so the concat demuxer sees identical streams.
  const std::string vf = fmt::format("{}:black,fps={},setsar=1,format={}", fit_filter(options_),
                                     options_.fps, options_.pixel_format);
  std::vector<fs::path> normalized;
  normalized.reserve(clip_paths.size());
  for (std::size_t i = 0; i < clip_paths.size(); ++i) {
    const auto out = tmp.path() / fmt::format("norm_{:04d}.mp4", i);
    run({options_.ffmpeg_path, "-y", "-i", absolute_string(clip_paths[i]), "-vf", vf, "-an",
         "-r", fps, "-pix_fmt", options_.pixel_format, "-c:v", options_.video_codec, out.string()},
        "normalize clip");
    normalized.push_back(out);
  }

  const auto list_file = tmp.path() / "clips.txt";
  {
    std::ofstream list(list_file);
    for (const auto& clip : normalized) {
      list << "file '" << concat_quote(absolute_string(clip)) << "'\n";
    }
    if (!list) {
      throw mc::PipelineFailure(mc::PipelineError::EncoderFailed, "cannot write concat list");
    }
  }

  std::vector<std::string> args{options_.ffmpeg_path, "-y", "-f", "concat", "-safe", "0",
                                "-i", list_file.string()};
  if (bgm_path) {
    args.insert(args.end(), {"-stream_loop", "-1", "-i", absolute_string(*bgm_path),
                             "-map", "0:v:0", "-map", "1:a:0",
                             "-filter:a", fmt::format("volume={}", bgm_volume), "-shortest"});
  } else {
    args.insert(args.end(), {"-map", "0:v:0", "-an"});
  }
  args.insert(args.end(), {"-r", fps, "-pix_fmt", options_.pixel_format,
                           "-c:v", options_.video_codec});
  if (bgm_path) args.insert(args.end(), {"-c:a", "aac"});
  args.push_back(output_path);
  run(args, "final render");
}

}  // namespace memoria::video
