#pragma once

#include <memoria/core/frame.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memoria::video {

/// Camera motion of the closing still clip.
enum class MotionStyle : std::uint8_t {
  ZoomIn,
  ZoomOut,
  None,
};

[[nodiscard]] std::string_view to_string(MotionStyle style) noexcept;

/// Parses "zoom_in" / "zoom_out" / "none"; false on anything else.
[[nodiscard]] bool parse_motion_style(std::string_view text, MotionStyle& out) noexcept;

/// Output geometry and codec settings shared by every encoder call.
struct EncoderOptions {
  std::string ffmpeg_path{"ffmpeg"};
  std::int32_t width{1600};
  std::int32_t height{900};
  std::int32_t fps{24};
  std::string pixel_format{"yuv420p"};
  std::string video_codec{"libx264"};
  double crossfade_seconds{1.0};
};

/// External video encoding boundary. Every call creates the parent directory of its
/// output and throws core::PipelineFailure{EncoderFailed} when encoding fails
/// (core::PipelineFailure{NotFound} for missing inputs). Calls block until done.
class IVideoEncoder {
 public:
  virtual ~IVideoEncoder() = default;

  /// Encodes BGR8 \p frames, in order, as a clip at the configured fps.
  virtual void encode_frames(const std::vector<core::Frame>& frames,
                             const std::string& output_path) = 0;

  /// Classic cross-fade clip of \p duration_seconds between two still images.
  virtual void build_crossfade(const std::string& image_a_path,
                               const std::string& image_b_path,
                               const std::string& output_path,
                               int duration_seconds) = 0;

  /// Still-image clip with optional zoom motion.
  virtual void build_still_clip(const std::string& image_path,
                                const std::string& output_path,
                                int duration_seconds,
                                MotionStyle motion) = 0;

  /// Normalizes and concatenates \p clip_paths; with \p bgm_path, loops it under the
  /// video at \p bgm_volume and cuts to the shorter stream.
  virtual void concat(const std::vector<std::string>& clip_paths,
                      const std::string& output_path,
                      const std::optional<std::string>& bgm_path,
                      double bgm_volume) = 0;
};

}  // namespace memoria::video
