// FfmpegVideoEncoder tests. Argument construction and error mapping run without ffmpeg;
// no test here needs a working ffmpeg binary. The SIGINT tests stand in a /bin/sh script.
#include <memoria/core/error.hpp>
#include <memoria/vision/load_image.hpp>
#include <memoria/video/ffmpeg_encoder.hpp>
#include "support/test_frames.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

namespace mc = memoria::core;
namespace mv = memoria::vision;
namespace mvid = memoria::video;
using memoria::testing::TempDir;

namespace {

bool contains(const std::vector<std::string>& args, const std::string& needle) {
  return std::any_of(args.begin(), args.end(),
                     [&](const std::string& a) { return a.find(needle) != std::string::npos; });
}

volatile std::sig_atomic_t g_sigint_seen = 0;

void record_sigint(int) { g_sigint_seen = 1; }

// Installs record_sigint for the lifetime of the guard.
class SigintGuard {
 public:
  SigintGuard() : previous_(std::signal(SIGINT, record_sigint)) { g_sigint_seen = 0; }
  ~SigintGuard() { std::signal(SIGINT, previous_); }

 private:
  void (*previous_)(int);
};

std::string write_script(const TempDir& dir, const std::string& name, const std::string& body) {
  const auto path = dir.file(name);
  std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::add);
  return path;
}

mc::PipelineError error_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const mc::PipelineFailure& e) {
    return e.code();
  }
  return mc::PipelineError::None;
}

}  // namespace

TEST(FfmpegVideoEncoder, RejectsNonPositiveDimensions) {
  mvid::EncoderOptions options;
  options.width = 0;
  EXPECT_THROW(mvid::FfmpegVideoEncoder{options}, mc::PipelineFailure);
}

TEST(FfmpegVideoEncoder, CrossfadeArgsUseXfadeAtCanvasSize) {
  mvid::EncoderOptions options;
  options.ffmpeg_path = "/opt/ffmpeg/bin/ffmpeg";
  mvid::FfmpegVideoEncoder encoder(options);
  const auto args = encoder.crossfade_args("a.jpg", "b.jpg", "out.mp4", 6);

  ASSERT_FALSE(args.empty());
  EXPECT_EQ(args.front(), "/opt/ffmpeg/bin/ffmpeg");
  EXPECT_EQ(args.back(), "out.mp4");
  EXPECT_TRUE(contains(args, "xfade=transition=fade"));
  EXPECT_TRUE(contains(args, "scale=1600:900"));
  EXPECT_TRUE(contains(args, "a.jpg"));
  EXPECT_TRUE(contains(args, "b.jpg"));
  EXPECT_TRUE(contains(args, "libx264"));
}

TEST(FfmpegVideoEncoder, StillClipArgsFollowMotionStyle) {
  mvid::FfmpegVideoEncoder encoder(mvid::EncoderOptions{});
  EXPECT_TRUE(contains(encoder.still_clip_args("c.jpg", "o.mp4", 4, mvid::MotionStyle::ZoomIn),
                       "zoompan=z='min(zoom"));
  EXPECT_TRUE(contains(encoder.still_clip_args("c.jpg", "o.mp4", 4, mvid::MotionStyle::ZoomOut),
                       "zoompan=z='if(lte(on,1)"));
  EXPECT_FALSE(contains(encoder.still_clip_args("c.jpg", "o.mp4", 4, mvid::MotionStyle::None),
                        "zoompan"));
}

TEST(FfmpegVideoEncoder, MissingInputIsNotFound) {
  TempDir dir("ffmpeg_missing");
  mvid::FfmpegVideoEncoder encoder(mvid::EncoderOptions{});
  EXPECT_EQ(error_of([&] {
              encoder.build_crossfade(dir.file("a.jpg"), dir.file("b.jpg"), dir.file("t.mp4"), 6);
            }),
            mc::PipelineError::NotFound);
  EXPECT_EQ(error_of([&] {
              encoder.build_still_clip(dir.file("a.jpg"), dir.file("s.mp4"), 4,
                                       mvid::MotionStyle::ZoomIn);
            }),
            mc::PipelineError::NotFound);
  EXPECT_EQ(error_of([&] { encoder.concat({dir.file("x.mp4")}, dir.file("f.mp4"), std::nullopt, 0.1); }),
            mc::PipelineError::NotFound);
}

TEST(FfmpegVideoEncoder, EmptyInputsAreInvalidArguments) {
  mvid::FfmpegVideoEncoder encoder(mvid::EncoderOptions{});
  EXPECT_EQ(error_of([&] { encoder.encode_frames({}, "out.mp4"); }),
            mc::PipelineError::InvalidArgument);
  EXPECT_EQ(error_of([&] { encoder.concat({}, "out.mp4", std::nullopt, 0.1); }),
            mc::PipelineError::InvalidArgument);
}

TEST(FfmpegVideoEncoder, UnlaunchableBinaryIsEncoderFailure) {
  TempDir dir("ffmpeg_unlaunchable");
  const auto still = dir.file("still.png");
  ASSERT_TRUE(mv::save_frame_to_image(memoria::testing::gray_bgr(16, 9, 10), still).has_value());

  mvid::EncoderOptions options;
  options.ffmpeg_path = dir.file("no-such-ffmpeg");
  mvid::FfmpegVideoEncoder encoder(options);
  EXPECT_EQ(error_of([&] {
              encoder.build_still_clip(still, dir.file("s.mp4"), 4, mvid::MotionStyle::None);
            }),
            mc::PipelineError::EncoderFailed);
}

TEST(FfmpegVideoEncoder, SigintToProcessGroupDoesNotKillChild) {
  TempDir dir("ffmpeg_sigint_group");
  const auto still = dir.file("still.png");
  ASSERT_TRUE(mv::save_frame_to_image(memoria::testing::gray_bgr(16, 9, 10), still).has_value());

  mvid::EncoderOptions options;
  options.ffmpeg_path = write_script(dir, "fake-ffmpeg", "kill -INT 0\nsleep 1\nexit 0");
  mvid::FfmpegVideoEncoder encoder(options);

  SigintGuard guard;
  EXPECT_EQ(error_of([&] {
              encoder.build_still_clip(still, dir.file("s.mp4"), 4, mvid::MotionStyle::None);
            }),
            mc::PipelineError::None);
  EXPECT_EQ(static_cast<int>(g_sigint_seen), 0);
}

TEST(FfmpegVideoEncoder, SigintDuringCallIsSeenAsCancelAtNextPoll) {
  TempDir dir("ffmpeg_sigint_parent");
  const auto still = dir.file("still.png");
  ASSERT_TRUE(mv::save_frame_to_image(memoria::testing::gray_bgr(16, 9, 10), still).has_value());

  mvid::EncoderOptions options;
  options.ffmpeg_path = write_script(dir, "fake-ffmpeg", "kill -INT $PPID\nsleep 1\nexit 0");
  mvid::FfmpegVideoEncoder encoder(options);

  SigintGuard guard;
  const auto poll_cancel = [] {
    if (g_sigint_seen) throw mc::Canceled("canceled by SIGINT");
  };
  EXPECT_EQ(error_of([&] {
              encoder.build_still_clip(still, dir.file("s.mp4"), 4, mvid::MotionStyle::None);
            }),
            mc::PipelineError::None);
  EXPECT_EQ(static_cast<int>(g_sigint_seen), 1);
  EXPECT_THROW(poll_cancel(), mc::Canceled);
}

TEST(ConcatQuote, EscapesSingleQuotes) {
  EXPECT_EQ(mvid::concat_quote("/tmp/clips/a.mp4"), "/tmp/clips/a.mp4");
  EXPECT_EQ(mvid::concat_quote("/tmp/mom's day/a.mp4"), "/tmp/mom'\\''s day/a.mp4");
  EXPECT_EQ(mvid::concat_quote("''"), "'\\'''\\''");
}

TEST(MotionStyle, ParseAndPrint) {
  mvid::MotionStyle style = mvid::MotionStyle::ZoomIn;
  EXPECT_TRUE(mvid::parse_motion_style("zoom_out", style));
  EXPECT_EQ(style, mvid::MotionStyle::ZoomOut);
  EXPECT_EQ(mvid::to_string(mvid::MotionStyle::None), "none");
  EXPECT_FALSE(mvid::parse_motion_style("pan", style));
  EXPECT_EQ(style, mvid::MotionStyle::ZoomOut);
}
