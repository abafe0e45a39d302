#include <memoria/canvas/canvas_layout.hpp>
#include <memoria/core/error.hpp>
#include "vision/frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace memoria::canvas {

namespace mc = memoria::core;
namespace detail = memoria::vision::detail;

namespace {

cv::Mat bgr_view(const mc::Frame& frame, const char* what) {
  if (frame.format() != mc::PixelFormat::BGR8) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidFrame,
                              fmt::format("{}: expected a BGR8 image", what));
  }
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidFrame,
                              fmt::format("{}: empty or truncated image", what));
  }
  return *mat;
}

cv::Rect to_rect(const mc::Placement& p) { return cv::Rect(p.x, p.y, p.width, p.height); }

void require_inside(const mc::Placement& p, const cv::Mat& canvas, const char* what) {
  if (p.x < 0 || p.y < 0 || p.width <= 0 || p.height <= 0 ||
      p.x + p.width > canvas.cols || p.y + p.height > canvas.rows) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument,
                              fmt::format("{}: placement outside canvas", what));
  }
}

cv::Vec3b mix(const cv::Vec3b& a, const cv::Vec3b& b, double weight_b) {
  cv::Vec3b out;
  for (int c = 0; c < 3; ++c) {
    out[c] = cv::saturate_cast<std::uint8_t>(a[c] * (1.0 - weight_b) + b[c] * weight_b);
  }
  return out;
}

}  // namespace

std::string_view to_string(BackgroundStyle style) noexcept {
  switch (style) {
    case BackgroundStyle::BlurredCover: return "blurred_cover";
    case BackgroundStyle::EdgeReflect: return "edge_reflect";
  }
  return "unknown";
}

bool parse_background_style(std::string_view text, BackgroundStyle& out) noexcept {
  if (text == "blurred_cover") {
    out = BackgroundStyle::BlurredCover;
    return true;
  }
  if (text == "edge_reflect") {
    out = BackgroundStyle::EdgeReflect;
    return true;
  }
  return false;
}

mc::Placement fit_placement(std::uint32_t src_w, std::uint32_t src_h,
                            std::int32_t target_w, std::int32_t target_h) {
  if (src_w == 0 || src_h == 0 || target_w <= 0 || target_h <= 0) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidArgument,
                              "fit_placement: dimensions must be positive");
  }
  const double s = std::min(static_cast<double>(target_w) / src_w,
                            static_cast<double>(target_h) / src_h);
  const auto w1 = std::clamp(static_cast<std::int32_t>(std::lround(src_w * s)), 1, target_w);
  const auto h1 = std::clamp(static_cast<std::int32_t>(std::lround(src_h * s)), 1, target_h);
  return mc::Placement{(target_w - w1) / 2, (target_h - h1) / 2, w1, h1};
}

mc::Frame resize_to_placement(const mc::Frame& photo, const mc::Placement& placement) {
  const cv::Mat src = bgr_view(photo, "resize_to_placement");
  cv::Mat out;
  cv::resize(src, out, cv::Size(placement.width, placement.height), 0, 0, cv::INTER_LANCZOS4);
  return detail::mat_to_frame(out, mc::PixelFormat::BGR8);
}

mc::Frame build_background(const mc::Frame& photo,
                           const mc::Frame& resized,
                           const mc::Placement& placement,
                           const CanvasOptions& options) {
  const int tw = options.target_width;
  const int th = options.target_height;
  cv::Mat out;

  if (options.background_style == BackgroundStyle::EdgeReflect) {
    const cv::Mat fg = bgr_view(resized, "build_background");
    if (fg.cols != placement.width || fg.rows != placement.height) {
      throw mc::PipelineFailure(mc::PipelineError::InvalidFrame,
                                "build_background: resized photo does not match placement");
    }
    cv::copyMakeBorder(fg, out, placement.y, th - placement.y - placement.height,
                       placement.x, tw - placement.x - placement.width, cv::BORDER_REFLECT);
    return detail::mat_to_frame(out, mc::PixelFormat::BGR8);
  }

  const cv::Mat src = bgr_view(photo, "build_background");
  const double s = std::max(static_cast<double>(tw) / src.cols,
                            static_cast<double>(th) / src.rows);
  const int cover_w = std::max(tw, static_cast<int>(std::lround(src.cols * s)));
  const int cover_h = std::max(th, static_cast<int>(std::lround(src.rows * s)));
  cv::Mat cover;
  cv::resize(src, cover, cv::Size(cover_w, cover_h), 0, 0, cv::INTER_LANCZOS4);
  const cv::Rect crop((cover_w - tw) / 2, (cover_h - th) / 2, tw, th);
  if (options.background_blur_sigma > 0.0) {
    cv::GaussianBlur(cover(crop), out, cv::Size(0, 0), options.background_blur_sigma);
  } else {
    out = cover(crop).clone();
  }
  return detail::mat_to_frame(out, mc::PixelFormat::BGR8);
}

mc::Frame compose_center(const mc::Frame& background,
                         const mc::Frame& resized,
                         const mc::Placement& placement,
                         std::int32_t edge_blend_px) {
  cv::Mat canvas = bgr_view(background, "compose_center").clone();
  const cv::Mat fg = bgr_view(resized, "compose_center");
  require_inside(placement, canvas, "compose_center");
  if (fg.cols != placement.width || fg.rows != placement.height) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidFrame,
                              "compose_center: resized photo does not match placement");
  }
  fg.copyTo(canvas(to_rect(placement)));

  const int b = std::max(0, edge_blend_px);
  const int px = placement.x;
  const int py = placement.y;
  const int right = placement.x + placement.width;   // first column past the photo
  const int bottom = placement.y + placement.height;  // first row past the photo
  for (int d = 1; d <= b; ++d) {
    const double w_photo = 1.0 - static_cast<double>(d) / (b + 1);
    for (int y = py; y < bottom; ++y) {
      auto* row = canvas.ptr<cv::Vec3b>(y);
      const auto* src = fg.ptr<cv::Vec3b>(y - py);
      if (px - d >= 0) row[px - d] = mix(row[px - d], src[0], w_photo);
      if (right - 1 + d < canvas.cols) {
        row[right - 1 + d] = mix(row[right - 1 + d], src[fg.cols - 1], w_photo);
      }
    }
    if (py - d >= 0) {
      auto* row = canvas.ptr<cv::Vec3b>(py - d);
      const auto* src = fg.ptr<cv::Vec3b>(0);
      for (int x = px; x < right; ++x) row[x] = mix(row[x], src[x - px], w_photo);
    }
    if (bottom - 1 + d < canvas.rows) {
      auto* row = canvas.ptr<cv::Vec3b>(bottom - 1 + d);
      const auto* src = fg.ptr<cv::Vec3b>(fg.rows - 1);
      for (int x = px; x < right; ++x) row[x] = mix(row[x], src[x - px], w_photo);
    }
  }
  return detail::mat_to_frame(canvas, mc::PixelFormat::BGR8);
}

CanvasMasks make_masks(std::int32_t target_w, std::int32_t target_h,
                       const mc::Placement& placement) {
  cv::Mat protected_mask = cv::Mat::zeros(target_h, target_w, CV_8UC1);
  require_inside(placement, protected_mask, "make_masks");
  protected_mask(to_rect(placement)).setTo(255);

  cv::Mat generation = cv::Mat::zeros(target_h, target_w, CV_8UC1);
  if (placement.x > 0) {
    generation(cv::Rect(0, 0, placement.x, target_h)).setTo(255);
  }
  const int right_start = placement.x + placement.width;
  if (right_start < target_w) {
    generation(cv::Rect(right_start, 0, target_w - right_start, target_h)).setTo(255);
  }
  return CanvasMasks{detail::mat_to_frame(protected_mask, mc::PixelFormat::Grayscale8),
                     detail::mat_to_frame(generation, mc::PixelFormat::Grayscale8)};
}

mc::Frame restore_protected(const mc::Frame& candidate,
                            const mc::Frame& reference,
                            const mc::Placement& placement) {
  cv::Mat out = bgr_view(candidate, "restore_protected").clone();
  const cv::Mat ref = bgr_view(reference, "restore_protected");
  if (ref.size() != out.size()) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidFrame,
                              "restore_protected: size mismatch");
  }
  require_inside(placement, out, "restore_protected");
  ref(to_rect(placement)).copyTo(out(to_rect(placement)));
  return detail::mat_to_frame(out, mc::PixelFormat::BGR8);
}

mc::Frame fast_mode_ramp(const mc::Frame& candidate,
                         const mc::Frame& safe,
                         const mc::Placement& placement,
                         double seam_weight,
                         double outer_weight) {
  cv::Mat out = bgr_view(candidate, "fast_mode_ramp").clone();
  const cv::Mat base = bgr_view(safe, "fast_mode_ramp");
  if (base.size() != out.size()) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidFrame, "fast_mode_ramp: size mismatch");
  }
  require_inside(placement, out, "fast_mode_ramp");
  seam_weight = std::clamp(seam_weight, 0.0, 1.0);
  outer_weight = std::clamp(outer_weight, 0.0, 1.0);

  const int left_band = placement.x;
  const int right_start = placement.x + placement.width;
  const int right_band = out.cols - right_start;
  auto safe_weight = [&](int d, int band) {
    const double t = band > 1 ? static_cast<double>(d - 1) / (band - 1) : 0.0;
    return seam_weight + (outer_weight - seam_weight) * t;
  };

  for (int y = 0; y < out.rows; ++y) {
    auto* row = out.ptr<cv::Vec3b>(y);
    const auto* s = base.ptr<cv::Vec3b>(y);
    for (int x = 0; x < left_band; ++x) {
      row[x] = mix(row[x], s[x], safe_weight(left_band - x, left_band));
    }
    for (int x = right_start; x < out.cols; ++x) {
      row[x] = mix(row[x], s[x], safe_weight(x - right_start + 1, right_band));
    }
  }
  return detail::mat_to_frame(out, mc::PixelFormat::BGR8);
}

CanvasLayout layout_canvas(const mc::Frame& photo, const CanvasOptions& options) {
  if (options.target_width <= 0 || options.target_height <= 0) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidConfig,
                              "canvas target size must be positive");
  }
  (void)bgr_view(photo, "layout_canvas");
  const auto placement =
      fit_placement(photo.width(), photo.height(), options.target_width, options.target_height);
  const auto resized = resize_to_placement(photo, placement);
  const auto background = build_background(photo, resized, placement, options);
  return CanvasLayout{placement,
                      compose_center(background, resized, placement, options.edge_blend_px),
                      make_masks(options.target_width, options.target_height, placement)};
}

}  // namespace memoria::canvas
