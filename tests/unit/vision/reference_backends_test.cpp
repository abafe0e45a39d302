#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/vision/identity_transition_backend.hpp>
#include <memoria/vision/mirror_outpaint_backend.hpp>
#include <memoria/vision/null_animal_detector.hpp>
#include "support/test_frames.hpp"
#include <gtest/gtest.h>

namespace mc = memoria::core;
namespace mv = memoria::vision;
using memoria::testing::gray_bgr;
using memoria::testing::rect_mask;
using memoria::testing::set_pixel;

TEST(MirrorOutpaintBackend, FillsMaskedColumnsFromNearestUnmaskedColumn) {
  // 10x2 image, unmasked columns [3, 7) carry distinct edge colours.
  auto base = gray_bgr(10, 2, 50);
  for (std::uint32_t y = 0; y < 2; ++y) {
    set_pixel(base, 3, y, 10, 20, 30);
    set_pixel(base, 6, y, 200, 210, 220);
  }
  auto mask = rect_mask(10, 2, 0, 0, 3, 2);
  const auto right = rect_mask(10, 2, 7, 0, 3, 2);
  for (std::size_t i = 0; i < mask.size_bytes(); ++i) {
    if (right.data()[i] != std::byte{0}) mask.data()[i] = std::byte{255};
  }

  mv::MirrorOutpaintBackend mirror;
  auto out = mirror.outpaint(base, mask, {});
  ASSERT_TRUE(out.has_value());
  for (std::uint32_t y = 0; y < 2; ++y) {
    for (std::uint32_t x = 0; x < 3; ++x) {
      EXPECT_EQ(out->at(x, y, 0), 10);
      EXPECT_EQ(out->at(x, y, 2), 30);
    }
    for (std::uint32_t x = 7; x < 10; ++x) {
      EXPECT_EQ(out->at(x, y, 0), 200);
      EXPECT_EQ(out->at(x, y, 2), 220);
    }
    EXPECT_EQ(out->at(4, y, 0), 50);
  }
  // Input untouched.
  EXPECT_EQ(base.at(0, 0, 0), 50);
}

TEST(MirrorOutpaintBackend, FullyMaskedRowIsLeftAsIs) {
  const auto base = gray_bgr(4, 1, 77);
  mv::MirrorOutpaintBackend mirror;
  auto out = mirror.outpaint(base, mc::Frame::filled(4, 1, mc::PixelFormat::Grayscale8, 255), {});
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->same_pixels(base));
}

TEST(MirrorOutpaintBackend, RejectsMaskOfOtherSize) {
  mv::MirrorOutpaintBackend mirror;
  auto out = mirror.outpaint(gray_bgr(4, 4, 0), rect_mask(5, 4, 0, 0, 1, 4), {});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), mc::PipelineError::InvalidFrame);
}

TEST(MirrorOutpaintBackend, IsReferenceKind) {
  mv::MirrorOutpaintBackend mirror;
  EXPECT_EQ(mirror.kind(), mv::BackendKind::Reference);
  EXPECT_EQ(mirror.name(), "mirror");
}

TEST(NullAnimalDetector, UnavailableAndEmpty) {
  mv::NullAnimalDetector detector;
  EXPECT_FALSE(detector.available());
  auto dets = detector.detect(gray_bgr(8, 8, 0));
  ASSERT_TRUE(dets.has_value());
  EXPECT_TRUE(dets->empty());
  EXPECT_EQ(detector.kind(), mv::BackendKind::Reference);
}

TEST(IdentityTransitionBackend, ReturnsInputUnchanged) {
  mv::IdentityTransitionBackend backend;
  EXPECT_FALSE(backend.available());
  auto blend = gray_bgr(6, 4, 90);
  set_pixel(blend, 2, 2, 1, 2, 3);
  auto out = backend.generate_frame(blend, "soft light", std::nullopt);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->same_pixels(blend));
  EXPECT_EQ(backend.kind(), mv::BackendKind::Reference);
}
