#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/vision/load_image.hpp>
#include "support/test_frames.hpp"
#include <gtest/gtest.h>
#include <filesystem>

namespace mc = memoria::core;
namespace mv = memoria::vision;
using memoria::testing::TempDir;

TEST(LoadImage, MissingFileReturnsNullopt) {
  EXPECT_FALSE(mv::load_frame_from_image("nonexistent_image_12345_should_not_exist.png").has_value());
}

TEST(LoadImage, SaveCreatesParentDirectoriesAndLoadsBack) {
  TempDir dir("load_image");
  auto frame = memoria::testing::gray_bgr(12, 8, 40);
  memoria::testing::set_pixel(frame, 3, 4, 1, 2, 250);
  const auto path = dir.file("nested/deeper/frame.png");

  auto saved = mv::save_frame_to_image(frame, path);
  ASSERT_TRUE(saved.has_value());
  ASSERT_TRUE(std::filesystem::exists(path));

  auto loaded = mv::load_frame_from_image(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->format(), mc::PixelFormat::BGR8);
  EXPECT_TRUE(loaded->same_pixels(frame));  // PNG is lossless
}

TEST(LoadImage, SaveRejectsMask) {
  TempDir dir("save_mask");
  auto saved = mv::save_frame_to_image(
      mc::Frame::filled(4, 4, mc::PixelFormat::Grayscale8, 255), dir.file("mask.png"));
  ASSERT_FALSE(saved.has_value());
  EXPECT_EQ(saved.error(), mc::PipelineError::InvalidFrame);
}
