#include <memoria/app/config.hpp>
#include <memoria/app/pipeline_orchestrator.hpp>
#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/vision/load_image.hpp>
#include <memoria/vision/mirror_outpaint_backend.hpp>
#include <memoria/vision/null_animal_detector.hpp>
#include "support/fake_backends.hpp"
#include "support/fake_video_encoder.hpp"
#include "support/test_frames.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace memoria::app;
using namespace memoria::core;
using memoria::testing::RecordingVideoEncoder;
using memoria::testing::TempDir;
using memoria::testing::gray_bgr;

struct ProgressEvent {
  std::string stage;
  int percent;
  std::optional<std::string> detail;
};

PipelineConfig small_config() {
  PipelineConfig c = default_config();
  c.target_width = 320;
  c.target_height = 180;
  c.target_fps = 3;
  c.outpaint_min_width_for_generation = 200;
  c.transition_provider = TransitionProvider::Classic;
  return c;
}

PipelineServices reference_services(std::shared_ptr<RecordingVideoEncoder> encoder) {
  PipelineServices s;
  s.outpaint = std::make_shared<memoria::vision::MirrorOutpaintBackend>();
  s.detector = std::make_shared<memoria::vision::NullAnimalDetector>();
  s.transition = std::make_shared<memoria::testing::FakeTransitionBackend>();
  s.encoder = std::move(encoder);
  return s;
}

PipelineRequest make_request(const TempDir& dir, const std::vector<Frame>& photos) {
  PipelineRequest r;
  for (std::size_t i = 0; i < photos.size(); ++i) {
    const auto path = dir.file("photo_" + std::to_string(i) + ".png");
    EXPECT_TRUE(memoria::vision::save_frame_to_image(photos[i], path).has_value());
    r.image_paths.push_back(path);
  }
  r.working_dir = dir.file("work");
  r.final_output_path = dir.file("final.mp4");
  r.transition_prompt = "soft morning light";
  return r;
}

}  // namespace

TEST(FullPipeline, TwoWidePhotosWithClassicTransition) {
  TempDir dir("pipeline_classic");
  auto config = default_config();
  config.transition_provider = TransitionProvider::Classic;
  auto encoder = std::make_shared<RecordingVideoEncoder>();
  PipelineOrchestrator orchestrator(config, reference_services(encoder));
  const auto request = make_request(dir, {gray_bgr(1600, 900, 60), gray_bgr(1600, 900, 180)});

  std::vector<ProgressEvent> events;
  const auto summary = orchestrator.run(
      request, [&](std::string_view stage, int percent, const std::optional<std::string>& detail) {
        events.push_back({std::string(stage), percent, detail});
      });

  ASSERT_EQ(summary.canvas_paths.size(), 2u);
  for (const auto& p : summary.canvas_paths) {
    auto canvas = memoria::vision::load_frame_from_image(p);
    ASSERT_TRUE(canvas.has_value()) << p;
    EXPECT_EQ(canvas->width(), 1600u);
    EXPECT_EQ(canvas->height(), 900u);
  }
  ASSERT_EQ(summary.transition_paths.size(), 1u);
  EXPECT_EQ(summary.canvas_fallback_count, 0u);
  EXPECT_EQ(summary.transition_fallback_count, 1u);
  EXPECT_EQ(summary.fallback_count, 1u);
  EXPECT_EQ(summary.safety_failed_count, 0u);
  EXPECT_EQ(summary.final_output_path, request.final_output_path);

  ASSERT_EQ(encoder->crossfades.size(), 1u);
  EXPECT_EQ(encoder->crossfades[0].duration, 6);
  ASSERT_EQ(encoder->stills.size(), 1u);
  EXPECT_EQ(encoder->stills[0].image, summary.canvas_paths.back());
  EXPECT_EQ(encoder->stills[0].duration, 4);
  ASSERT_EQ(encoder->concats.size(), 1u);
  EXPECT_EQ(encoder->concats[0].clips,
            (std::vector<std::string>{summary.transition_paths[0], summary.last_clip_path}));
  EXPECT_EQ(encoder->concats[0].output, request.final_output_path);
  EXPECT_TRUE(std::filesystem::exists(request.final_output_path));

  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.front().stage, "prepare");
  EXPECT_EQ(events.front().percent, 0);
  for (std::size_t i = 1; i < events.size(); ++i) {
    EXPECT_GE(events[i].percent, events[i - 1].percent) << events[i].stage;
  }
  EXPECT_EQ(events.back().stage, "completed");
  EXPECT_EQ(events.back().percent, 100);
  EXPECT_EQ(events.back().detail, std::optional<std::string>(request.final_output_path));
}

TEST(FullPipeline, GenerativeTransitionIsEncodedFromFrames) {
  TempDir dir("pipeline_generative");
  auto config = small_config();
  config.transition_provider = TransitionProvider::Auto;
  config.strict_safety_checks = false;
  auto encoder = std::make_shared<RecordingVideoEncoder>();
  PipelineOrchestrator orchestrator(config, reference_services(encoder));
  auto request = make_request(dir, {gray_bgr(320, 180, 60), gray_bgr(320, 180, 180)});
  request.bgm_path = dir.file("music.mp3");
  { std::ofstream(*request.bgm_path) << "audio"; }

  const auto summary = orchestrator.run(request);
  ASSERT_EQ(encoder->encodes.size(), 1u);
  EXPECT_EQ(encoder->encodes[0].frames.size(), 18u);
  EXPECT_TRUE(encoder->crossfades.empty());
  EXPECT_EQ(summary.transition_fallback_count, 0u);
  EXPECT_EQ(summary.fallback_count, 0u);
  ASSERT_EQ(encoder->concats.size(), 1u);
  EXPECT_EQ(encoder->concats[0].bgm, request.bgm_path);
  EXPECT_DOUBLE_EQ(encoder->concats[0].volume, 0.15);
}

TEST(FullPipeline, NarrowPhotosUseSafePadding) {
  TempDir dir("pipeline_narrow");
  auto encoder = std::make_shared<RecordingVideoEncoder>();
  PipelineOrchestrator orchestrator(small_config(), reference_services(encoder));
  const auto request = make_request(dir, {gray_bgr(100, 180, 90), gray_bgr(60, 120, 30)});

  const auto summary = orchestrator.run(request);
  EXPECT_EQ(summary.canvas_fallback_count, 2u);
  EXPECT_EQ(summary.safety_failed_count, 0u);
  EXPECT_EQ(summary.fallback_count, 3u);  // two canvases and the classic transition
}

TEST(FullPipeline, SingleImageHasNoTransitions) {
  TempDir dir("pipeline_single");
  auto encoder = std::make_shared<RecordingVideoEncoder>();
  PipelineOrchestrator orchestrator(small_config(), reference_services(encoder));
  auto request = make_request(dir, {gray_bgr(320, 180, 60)});
  request.last_clip_motion = memoria::video::MotionStyle::None;

  std::vector<ProgressEvent> events;
  const auto summary = orchestrator.run(
      request, [&](std::string_view stage, int percent, const std::optional<std::string>& detail) {
        events.push_back({std::string(stage), percent, detail});
      });

  EXPECT_TRUE(summary.transition_paths.empty());
  EXPECT_TRUE(encoder->crossfades.empty());
  ASSERT_EQ(encoder->stills.size(), 1u);
  EXPECT_EQ(encoder->stills[0].motion, memoria::video::MotionStyle::None);
  ASSERT_EQ(encoder->concats.size(), 1u);
  EXPECT_EQ(encoder->concats[0].clips, (std::vector<std::string>{summary.last_clip_path}));

  bool saw_single = false;
  for (const auto& e : events) {
    if (e.stage == "transition" && e.detail == std::optional<std::string>("single image")) {
      saw_single = true;
    }
  }
  EXPECT_TRUE(saw_single);
}

TEST(FullPipeline, CancelDuringTransitionsAbortsBeforeRender) {
  TempDir dir("pipeline_cancel");
  auto encoder = std::make_shared<RecordingVideoEncoder>();
  PipelineOrchestrator orchestrator(small_config(), reference_services(encoder));
  const auto request = make_request(dir, {gray_bgr(320, 180, 60), gray_bgr(320, 180, 120)});

  std::string stage_seen;
  const auto progress = [&](std::string_view stage, int, const std::optional<std::string>&) {
    stage_seen = std::string(stage);
  };
  const auto cancel = [&] {
    if (stage_seen == "transition") throw Canceled();
  };

  EXPECT_THROW((void)orchestrator.run(request, progress, cancel), Canceled);
  EXPECT_TRUE(encoder->crossfades.empty());
  EXPECT_TRUE(encoder->stills.empty());
  EXPECT_TRUE(encoder->concats.empty());
}

TEST(FullPipeline, RejectsInvalidRequests) {
  TempDir dir("pipeline_invalid");
  auto encoder = std::make_shared<RecordingVideoEncoder>();
  PipelineOrchestrator orchestrator(small_config(), reference_services(encoder));

  auto code_of = [&](const PipelineRequest& r) {
    try {
      (void)orchestrator.run(r);
    } catch (const PipelineFailure& e) {
      return e.code();
    }
    return PipelineError::None;
  };

  const auto valid = make_request(dir, {gray_bgr(320, 180, 60)});

  auto r = valid;
  r.image_paths.clear();
  EXPECT_EQ(code_of(r), PipelineError::InvalidArgument);

  r = valid;
  r.transition_prompt = "   ";
  EXPECT_EQ(code_of(r), PipelineError::InvalidArgument);

  r = valid;
  r.transition_duration_seconds = 7;
  EXPECT_EQ(code_of(r), PipelineError::InvalidArgument);

  r = valid;
  r.last_clip_duration_seconds = 30;
  EXPECT_EQ(code_of(r), PipelineError::InvalidArgument);

  r = valid;
  r.bgm_volume = 1.5;
  EXPECT_EQ(code_of(r), PipelineError::InvalidArgument);

  r = valid;
  r.image_paths.push_back(dir.file("missing.png"));
  EXPECT_EQ(code_of(r), PipelineError::NotFound);

  r = valid;
  r.bgm_path = dir.file("missing.mp3");
  EXPECT_EQ(code_of(r), PipelineError::NotFound);

  EXPECT_TRUE(encoder->stills.empty());
}

TEST(FullPipeline, ConstructorRejectsMissingServicesAndBadConfig) {
  auto services = reference_services(std::make_shared<RecordingVideoEncoder>());
  services.encoder.reset();
  EXPECT_THROW(PipelineOrchestrator(small_config(), services), PipelineFailure);

  auto config = small_config();
  config.target_fps = 0;
  EXPECT_THROW(
      PipelineOrchestrator(config, reference_services(std::make_shared<RecordingVideoEncoder>())),
      PipelineFailure);
}
