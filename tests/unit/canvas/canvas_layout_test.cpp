#include <memoria/canvas/canvas_layout.hpp>
#include <memoria/canvas/canvas_options.hpp>
#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include "support/test_frames.hpp"
#include <gtest/gtest.h>

namespace mc = memoria::core;
namespace mcv = memoria::canvas;
using memoria::testing::gray_bgr;
using memoria::testing::set_pixel;

TEST(FitPlacement, PortraitPhotoIsCenteredWithSideGaps) {
  const auto p = mcv::fit_placement(900, 1600, 1600, 900);
  EXPECT_EQ(p.height, 900);
  EXPECT_EQ(p.width, 506);  // round(900 * 900 / 1600)
  EXPECT_EQ(p.x, 547);
  EXPECT_EQ(p.y, 0);
}

TEST(FitPlacement, MatchingAspectFillsCanvas) {
  const auto p = mcv::fit_placement(3200, 1800, 1600, 900);
  EXPECT_EQ(p.x, 0);
  EXPECT_EQ(p.y, 0);
  EXPECT_EQ(p.width, 1600);
  EXPECT_EQ(p.height, 900);
}

TEST(FitPlacement, PanoramaLeavesOnlyTopAndBottomGaps) {
  const auto p = mcv::fit_placement(4000, 1000, 1600, 900);
  EXPECT_EQ(p.width, 1600);
  EXPECT_EQ(p.height, 400);
  EXPECT_EQ(p.x, 0);
  EXPECT_EQ(p.y, 250);
}

TEST(FitPlacement, ZeroSizeThrows) {
  EXPECT_THROW((void)mcv::fit_placement(0, 10, 1600, 900), mc::PipelineFailure);
}

TEST(MakeMasks, ProtectedAndGenerationAreDisjointAndCoverFullHeightColumns) {
  const mc::Placement p{3, 0, 4, 5};
  const auto masks = mcv::make_masks(10, 5, p);
  for (std::uint32_t y = 0; y < 5; ++y) {
    for (std::uint32_t x = 0; x < 10; ++x) {
      const bool inside = x >= 3 && x < 7;
      EXPECT_EQ(masks.protected_mask.at(x, y), inside ? 255 : 0);
      EXPECT_EQ(masks.generation_mask.at(x, y), inside ? 0 : 255);
    }
  }
}

TEST(MakeMasks, TopBottomPaddingIsNeverGenerated) {
  const mc::Placement p{0, 2, 10, 4};
  const auto masks = mcv::make_masks(10, 8, p);
  for (std::size_t i = 0; i < masks.generation_mask.size_bytes(); ++i) {
    EXPECT_EQ(masks.generation_mask.data()[i], std::byte{0});
  }
  EXPECT_EQ(masks.protected_mask.at(0, 0), 0);
  EXPECT_EQ(masks.protected_mask.at(0, 2), 255);
}

TEST(MakeMasks, PlacementOutsideCanvasThrows) {
  EXPECT_THROW((void)mcv::make_masks(10, 5, mc::Placement{8, 0, 4, 5}), mc::PipelineFailure);
}

TEST(ComposeCenter, CopiesPhotoExactlyAndRampsAdjacentBackground) {
  const auto background = gray_bgr(12, 4, 0);
  const auto photo = gray_bgr(4, 4, 255);
  const mc::Placement p{4, 0, 4, 4};

  const auto canvas = mcv::compose_center(background, photo, p, 4);
  for (std::uint32_t x = 4; x < 8; ++x) EXPECT_EQ(canvas.at(x, 2), 255);
  // Photo weight 1 - d / (b + 1) at distance d from the edge.
  EXPECT_EQ(canvas.at(3, 0), 204);
  EXPECT_EQ(canvas.at(0, 0), 51);
  EXPECT_EQ(canvas.at(8, 3), 204);
  EXPECT_EQ(canvas.at(11, 3), 51);
}

TEST(ComposeCenter, NoBlendLeavesBackgroundUntouched) {
  const auto canvas = mcv::compose_center(gray_bgr(12, 4, 0), gray_bgr(4, 4, 255),
                                          mc::Placement{4, 0, 4, 4}, 0);
  EXPECT_EQ(canvas.at(3, 0), 0);
  EXPECT_EQ(canvas.at(8, 0), 0);
}

TEST(ComposeCenter, ResizedSizeMismatchThrows) {
  EXPECT_THROW((void)mcv::compose_center(gray_bgr(12, 4, 0), gray_bgr(3, 4, 255),
                                         mc::Placement{4, 0, 4, 4}, 0),
               mc::PipelineFailure);
}

TEST(RestoreProtected, PlacementComesFromReference) {
  const auto restored = mcv::restore_protected(gray_bgr(10, 2, 200), gray_bgr(10, 2, 10),
                                               mc::Placement{2, 0, 3, 2});
  EXPECT_EQ(restored.at(1, 0), 200);
  EXPECT_EQ(restored.at(2, 0), 10);
  EXPECT_EQ(restored.at(4, 1), 10);
  EXPECT_EQ(restored.at(5, 1), 200);
}

TEST(FastModeRamp, SafeWeightRunsFromSeamToOuterEdge) {
  const auto candidate = gray_bgr(10, 2, 255);
  const auto safe = gray_bgr(10, 2, 0);
  const mc::Placement p{4, 0, 2, 2};

  const auto out = mcv::fast_mode_ramp(candidate, safe, p, 0.8, 0.2);
  EXPECT_EQ(out.at(3, 0), 51);   // seam: 80% safe
  EXPECT_EQ(out.at(0, 0), 204);  // outer edge: 20% safe
  EXPECT_EQ(out.at(6, 1), 51);
  EXPECT_EQ(out.at(9, 1), 204);
  EXPECT_EQ(out.at(4, 0), 255);  // placement untouched
  EXPECT_EQ(out.at(5, 0), 255);
}

TEST(BuildBackground, EdgeReflectMirrorsPhotoEdges) {
  auto resized = gray_bgr(4, 4, 100);
  for (std::uint32_t y = 0; y < 4; ++y) {
    set_pixel(resized, 0, y, 10, 10, 10);
    set_pixel(resized, 3, y, 250, 250, 250);
  }
  mcv::CanvasOptions options;
  options.target_width = 10;
  options.target_height = 4;
  options.background_style = mcv::BackgroundStyle::EdgeReflect;

  const auto bg = mcv::build_background(resized, resized, mc::Placement{3, 0, 4, 4}, options);
  ASSERT_EQ(bg.width(), 10u);
  ASSERT_EQ(bg.height(), 4u);
  EXPECT_EQ(bg.at(2, 1), 10);
  EXPECT_EQ(bg.at(7, 1), 250);
}

TEST(BuildBackground, BlurredCoverOfUniformPhotoIsUniform) {
  mcv::CanvasOptions options;
  options.target_width = 64;
  options.target_height = 36;
  options.background_blur_sigma = 4.0;
  const auto photo = gray_bgr(20, 40, 90);
  const auto p = mcv::fit_placement(20, 40, 64, 36);
  const auto bg = mcv::build_background(photo, mcv::resize_to_placement(photo, p), p, options);
  ASSERT_EQ(bg.width(), 64u);
  ASSERT_EQ(bg.height(), 36u);
  EXPECT_NEAR(bg.at(0, 0), 90, 1);
  EXPECT_NEAR(bg.at(63, 35), 90, 1);
}

TEST(LayoutCanvas, ProducesTargetSizedSafeCanvasAndMasks) {
  mcv::CanvasOptions options;
  options.target_width = 160;
  options.target_height = 90;
  const auto layout = mcv::layout_canvas(gray_bgr(90, 160, 128), options);
  EXPECT_EQ(layout.safe_canvas.width(), 160u);
  EXPECT_EQ(layout.safe_canvas.height(), 90u);
  EXPECT_EQ(layout.safe_canvas.format(), mc::PixelFormat::BGR8);
  EXPECT_EQ(layout.placement.height, 90);
  EXPECT_EQ(layout.masks.generation_mask.width(), 160u);
  EXPECT_EQ(layout.masks.generation_mask.at(0, 0), 255);
  EXPECT_EQ(layout.masks.protected_mask.at(80, 45), 255);
}

TEST(LayoutCanvas, RejectsMaskInput) {
  mcv::CanvasOptions options;
  try {
    (void)mcv::layout_canvas(mc::Frame::filled(16, 9, mc::PixelFormat::Grayscale8, 0), options);
    FAIL() << "expected PipelineFailure";
  } catch (const mc::PipelineFailure& e) {
    EXPECT_EQ(e.code(), mc::PipelineError::InvalidFrame);
  }
}

TEST(LayoutCanvas, RejectsNonPositiveTarget) {
  mcv::CanvasOptions options;
  options.target_width = 0;
  try {
    (void)mcv::layout_canvas(gray_bgr(16, 9, 0), options);
    FAIL() << "expected PipelineFailure";
  } catch (const mc::PipelineFailure& e) {
    EXPECT_EQ(e.code(), mc::PipelineError::InvalidConfig);
  }
}

TEST(BackgroundStyle, ParseAndPrint) {
  mcv::BackgroundStyle style = mcv::BackgroundStyle::BlurredCover;
  EXPECT_TRUE(mcv::parse_background_style("edge_reflect", style));
  EXPECT_EQ(style, mcv::BackgroundStyle::EdgeReflect);
  EXPECT_EQ(mcv::to_string(style), "edge_reflect");
  EXPECT_FALSE(mcv::parse_background_style("sepia", style));
  EXPECT_EQ(style, mcv::BackgroundStyle::EdgeReflect);
}
