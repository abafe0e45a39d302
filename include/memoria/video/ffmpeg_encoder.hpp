#pragma once

#include <memoria/video/video_encoder.hpp>
#include <string>
#include <vector>

namespace memoria::video {

/// Escapes \p path for a single-quoted `file '...'` line of an ffmpeg concat list.
[[nodiscard]] std::string concat_quote(const std::string& path);

/// IVideoEncoder driving the ffmpeg command-line tool as a child process.
/// Stateless apart from its options; safe to share between sequential runs.
class FfmpegVideoEncoder : public IVideoEncoder {
 public:
  explicit FfmpegVideoEncoder(EncoderOptions options);

  void encode_frames(const std::vector<core::Frame>& frames,
                     const std::string& output_path) override;

  void build_crossfade(const std::string& image_a_path,
                       const std::string& image_b_path,
                       const std::string& output_path,
                       int duration_seconds) override;

  void build_still_clip(const std::string& image_path,
                        const std::string& output_path,
                        int duration_seconds,
                        MotionStyle motion) override;

  void concat(const std::vector<std::string>& clip_paths,
              const std::string& output_path,
              const std::optional<std::string>& bgm_path,
              double bgm_volume) override;

  [[nodiscard]] const EncoderOptions& options() const noexcept { return options_; }

  // Argument builders, exposed for tests.
  [[nodiscard]] std::vector<std::string> crossfade_args(const std::string& image_a_path,
                                                        const std::string& image_b_path,
                                                        const std::string& output_path,
                                                        int duration_seconds) const;
  [[nodiscard]] std::vector<std::string> still_clip_args(const std::string& image_path,
                                                         const std::string& output_path,
                                                         int duration_seconds,
                                                         MotionStyle motion) const;

 private:
  void run(const std::vector<std::string>& args, const char* what) const;

  EncoderOptions options_;
};

}  // namespace memoria::video
