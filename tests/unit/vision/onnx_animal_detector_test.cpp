// Unit tests for OnnxAnimalDetector.
// One test runs without a model (constructor with missing file). The rest require a real
// YOLO-style .onnx detector: set MEMORIA_TEST_DETECTOR_MODEL to the path. They are skipped
// if the env var is unset or the file is missing, so CI without a model still passes.
#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/vision/onnx_animal_detector.hpp>
#include "support/test_frames.hpp"
#include "vision/onnx_model.hpp"
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace mc = memoria::core;
namespace mv = memoria::vision;

static std::string get_test_model_path() {
  const char* env = std::getenv("MEMORIA_TEST_DETECTOR_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

TEST(OnnxAnimalDetector, ConstructorThrowsWhenFileMissing) {
  EXPECT_THROW(
      { mv::OnnxAnimalDetector detector("nonexistent_detector_12345_should_not_exist.onnx", 0.25f); },
      Ort::Exception);
}

TEST(OnnxModel, SessionsShareOneEnvironment) {
  Ort::Env& env = mv::detail::shared_ort_env();
  EXPECT_EQ(&env, &mv::detail::shared_ort_env());
  EXPECT_THROW({ mv::detail::OnnxModel model("missing_a_12345.onnx", "first"); }, Ort::Exception);
  EXPECT_THROW({ mv::detail::OnnxModel model("missing_b_12345.onnx", "second"); }, Ort::Exception);
  EXPECT_EQ(&env, &mv::detail::shared_ort_env());
}

TEST(OnnxAnimalDetector, RejectsNonBgrInput) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set MEMORIA_TEST_DETECTOR_MODEL to run (path to .onnx file)";
  }
  mv::OnnxAnimalDetector detector(path, 0.25f);
  auto result = detector.detect(mc::Frame::filled(64, 64, mc::PixelFormat::Grayscale8, 0));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), mc::PipelineError::InvalidFrame);
}

TEST(OnnxAnimalDetector, BlankImageYieldsBoxesInsideFrame) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set MEMORIA_TEST_DETECTOR_MODEL to run (path to .onnx file)";
  }
  mv::OnnxAnimalDetector detector(path, 0.25f);
  EXPECT_TRUE(detector.available());
  EXPECT_EQ(detector.kind(), mv::BackendKind::Model);
  auto result = detector.detect(memoria::testing::gray_bgr(320, 180, 127));
  ASSERT_TRUE(result.has_value());
  for (const auto& d : *result) {
    EXPECT_GE(d.confidence, 0.25f);
    EXPECT_GE(d.x1, 0);
    EXPECT_LE(d.x2, 320);
    EXPECT_LE(d.y2, 180);
  }
}
