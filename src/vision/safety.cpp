#include <memoria/vision/safety.hpp>
#include "frame_cv_utils.hpp"
#include <memoria/core/frame.hpp>
#include <opencv2/core.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace memoria::vision {

namespace {

namespace mc = memoria::core;

struct Views {
  cv::Mat image;
  cv::Mat first_mask;
  cv::Mat second_mask;
};

inline int max_channel_diff(const std::uint8_t* a, const std::uint8_t* b) {
  const int d0 = std::abs(static_cast<int>(a[0]) - static_cast<int>(b[0]));
  const int d1 = std::abs(static_cast<int>(a[1]) - static_cast<int>(b[1]));
  const int d2 = std::abs(static_cast<int>(a[2]) - static_cast<int>(b[2]));
  return std::max({d0, d1, d2});
}

bool mask_any(const cv::Mat& mask) { return cv::countNonZero(mask) > 0; }

/// numpy-style percentile with linear interpolation between closest ranks.
double percentile(std::vector<float> values, double pct) {
  if (values.empty()) return 0.0;
  std::sort(values.begin(), values.end());
  const double rank = pct / 100.0 * static_cast<double>(values.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(rank));
  const auto hi = static_cast<std::size_t>(std::ceil(rank));
  const double frac = rank - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

/// Resolves a BGR8 image plus two masks of the same size; sets reason on mismatch.
bool resolve_views(const mc::Frame& image,
                   const mc::Frame& protected_mask,
                   const mc::Frame& generation_mask,
                   Views& out,
                   std::string& reason) {
  auto img = image.format() == mc::PixelFormat::BGR8 ? detail::frame_to_mat(image)
                                                     : std::nullopt;
  if (!img) {
    reason = "candidate image is not a BGR8 raster";
    return false;
  }
  auto prot = detail::mask_to_mat(protected_mask);
  if (!prot || prot->size() != img->size()) {
    reason = "protected mask shape mismatch";
    return false;
  }
  auto gen = detail::mask_to_mat(generation_mask);
  if (!gen || gen->size() != img->size()) {
    reason = "generation mask shape mismatch";
    return false;
  }
  out.image = *img;
  out.first_mask = *prot;
  out.second_mask = *gen;
  return true;
}

struct RegionStats {
  std::array<double, 3> mean{};
  std::array<double, 3> std{};
  double grad_mean{0.0};
  double edge_density{0.0};
  std::size_t count{0};
};

/// Central-difference gradient magnitude of the luma channel; border rows/cols use 0.
cv::Mat gradient_magnitude(const cv::Mat& bgr) {
  cv::Mat gray(bgr.rows, bgr.cols, CV_32FC1);
  for (int y = 0; y < bgr.rows; ++y) {
    const auto* src = bgr.ptr<std::uint8_t>(y);
    auto* dst = gray.ptr<float>(y);
    for (int x = 0; x < bgr.cols; ++x) {
      dst[x] = static_cast<float>(src[x * 3 + 0]) * 0.114f +
               static_cast<float>(src[x * 3 + 1]) * 0.587f +
               static_cast<float>(src[x * 3 + 2]) * 0.299f;
    }
  }

  cv::Mat grad = cv::Mat::zeros(bgr.rows, bgr.cols, CV_32FC1);
  for (int y = 0; y < gray.rows; ++y) {
    const auto* row = gray.ptr<float>(y);
    const float* above = y > 0 ? gray.ptr<float>(y - 1) : nullptr;
    const float* below = y + 1 < gray.rows ? gray.ptr<float>(y + 1) : nullptr;
    auto* out = grad.ptr<float>(y);
    for (int x = 0; x < gray.cols; ++x) {
      const float gx = (x > 0 && x + 1 < gray.cols) ? row[x + 1] - row[x - 1] : 0.f;
      const float gy = (above && below) ? below[x] - above[x] : 0.f;
      out[x] = std::hypot(gx, gy);
    }
  }
  return grad;
}

/// Statistics over pixels where \p mask is active and x lies in [x_begin, x_end).
RegionStats region_stats(const cv::Mat& bgr,
                         const cv::Mat& grad,
                         const cv::Mat& mask,
                         int x_begin,
                         int x_end,
                         double edge_threshold) {
  RegionStats s;
  std::array<double, 3> sum{};
  std::array<double, 3> sum_sq{};
  double grad_sum = 0.0;
  std::size_t edges = 0;

  x_begin = std::max(0, x_begin);
  x_end = std::min(bgr.cols, x_end);
  for (int y = 0; y < bgr.rows; ++y) {
    const auto* px = bgr.ptr<std::uint8_t>(y);
    const auto* m = mask.ptr<std::uint8_t>(y);
    const auto* g = grad.ptr<float>(y);
    for (int x = x_begin; x < x_end; ++x) {
      if (m[x] == 0) continue;
      for (int c = 0; c < 3; ++c) {
        const double v = px[x * 3 + c];
        sum[c] += v;
        sum_sq[c] += v * v;
      }
      grad_sum += g[x];
      if (g[x] >= edge_threshold) ++edges;
      ++s.count;
    }
  }
  if (s.count == 0) return s;

  const double n = static_cast<double>(s.count);
  for (int c = 0; c < 3; ++c) {
    s.mean[c] = sum[c] / n;
    s.std[c] = std::sqrt(std::max(0.0, sum_sq[c] / n - s.mean[c] * s.mean[c]));
  }
  s.grad_mean = grad_sum / n;
  s.edge_density = static_cast<double>(edges) / n;
  return s;
}

double norm3(const std::array<double, 3>& a, const std::array<double, 3>& b) {
  const double d0 = a[0] - b[0];
  const double d1 = a[1] - b[1];
  const double d2 = a[2] - b[2];
  return std::sqrt(d0 * d0 + d1 * d1 + d2 * d2);
}

double symmetric_ratio(double a, double b) {
  constexpr double kEps = 1e-4;
  return std::max(a / (b + kEps), b / (a + kEps));
}

/// Empty string when the side is acceptable or has too few pixels to judge.
std::string judge_side(const char* side,
                       const RegionStats& gen,
                       const RegionStats& ref,
                       const SafetyThresholds& limits) {
  if (gen.count < limits.naturalness_min_pixels_per_side ||
      ref.count < limits.naturalness_min_pixels_per_side) {
    return {};
  }
  const double mean_delta = norm3(gen.mean, ref.mean) / 255.0;
  const double std_delta = norm3(gen.std, ref.std) / 255.0;
  const double grad_ratio = symmetric_ratio(gen.grad_mean, ref.grad_mean);
  const double edge_ratio = symmetric_ratio(gen.edge_density, ref.edge_density);

  if (mean_delta > limits.naturalness_max_mean_delta ||
      std_delta > limits.naturalness_max_std_delta ||
      grad_ratio > limits.naturalness_max_grad_ratio ||
      edge_ratio > limits.naturalness_max_edge_density_ratio) {
    return fmt::format("{}(mean={:.4f},std={:.4f},grad={:.4f},edge={:.4f})", side,
                       mean_delta, std_delta, grad_ratio, edge_ratio);
  }
  return {};
}

}  // namespace

SafetyCheckResult check_protected_region_unchanged(const mc::Frame& base,
                                                   const mc::Frame& candidate,
                                                   const mc::Frame& protected_mask,
                                                   double max_changed_ratio,
                                                   int diff_threshold) {
  auto b = base.format() == mc::PixelFormat::BGR8 ? detail::frame_to_mat(base) : std::nullopt;
  auto c = candidate.format() == mc::PixelFormat::BGR8 ? detail::frame_to_mat(candidate)
                                                       : std::nullopt;
  if (!b || !c) {
    return SafetyCheckResult::fail("base and candidate must be BGR8 rasters");
  }
  if (b->size() != c->size()) {
    return SafetyCheckResult::fail(
        fmt::format("base and candidate shape mismatch: base={}x{}, candidate={}x{}",
                    b->cols, b->rows, c->cols, c->rows));
  }
  auto m = detail::mask_to_mat(protected_mask);
  if (!m || m->size() != b->size()) {
    return SafetyCheckResult::fail("protected mask shape mismatch");
  }

  std::size_t changed = 0;
  std::size_t total = 0;
  for (int y = 0; y < b->rows; ++y) {
    const auto* pb = b->ptr<std::uint8_t>(y);
    const auto* pc = c->ptr<std::uint8_t>(y);
    const auto* pm = m->ptr<std::uint8_t>(y);
    for (int x = 0; x < b->cols; ++x) {
      if (pm[x] == 0) continue;
      ++total;
      if (max_channel_diff(pb + x * 3, pc + x * 3) > diff_threshold) ++changed;
    }
  }

  if (total == 0) {
    return SafetyCheckResult::fail("protected mask is empty");
  }
  const double ratio = static_cast<double>(changed) / static_cast<double>(total);
  if (ratio > max_changed_ratio) {
    return SafetyCheckResult::fail(
        fmt::format("protected region changed too much: ratio={:.6f}, threshold={:.6f}",
                    ratio, max_changed_ratio));
  }
  return SafetyCheckResult::pass();
}

SafetyCheckResult check_no_new_animals_in_generated_region(const mc::Frame& candidate,
                                                           const mc::Frame& generation_mask,
                                                           IAnimalDetector& detector,
                                                           bool strict_mode) {
  auto img = detail::frame_to_mat(candidate);
  auto mask = detail::mask_to_mat(generation_mask);
  if (!img || !mask || mask->size() != img->size()) {
    return SafetyCheckResult::fail("generation mask shape mismatch");
  }

  if (!detector.available()) {
    if (strict_mode && mask_any(*mask)) {
      return SafetyCheckResult::fail("animal detector unavailable in strict mode");
    }
    return SafetyCheckResult::pass();
  }

  auto detections = detector.detect(candidate);
  if (!detections) {
    return SafetyCheckResult::fail(
        fmt::format("animal detector failed: {}", mc::to_string(detections.error())));
  }

  const int w = img->cols;
  const int h = img->rows;
  for (const auto& det : *detections) {
    const int x1 = std::clamp(det.x1, 0, w - 1);
    const int y1 = std::clamp(det.y1, 0, h - 1);
    const int x2 = std::clamp(det.x2, 0, w);
    const int y2 = std::clamp(det.y2, 0, h);
    if (x2 <= x1 || y2 <= y1) continue;

    const cv::Mat region = (*mask)(cv::Rect(x1, y1, x2 - x1, y2 - y1));
    if (mask_any(region)) {
      return SafetyCheckResult::fail(fmt::format(
          "new animal detected in generated region: {}({:.2f})", det.label, det.confidence));
    }
  }
  return SafetyCheckResult::pass();
}

SafetyCheckResult check_generation_boundary_continuity(const mc::Frame& candidate,
                                                       const mc::Frame& protected_mask,
                                                       const mc::Frame& generation_mask,
                                                       const SafetyThresholds& limits) {
  Views v;
  std::string reason;
  if (!resolve_views(candidate, protected_mask, generation_mask, v, reason)) {
    return SafetyCheckResult::fail(reason);
  }
  const cv::Mat& img = v.image;
  const cv::Mat& prot = v.first_mask;
  const cv::Mat& gen = v.second_mask;

  if (img.rows == 0 || img.cols < 2) return SafetyCheckResult::pass();
  if (!mask_any(gen)) return SafetyCheckResult::pass();

  std::vector<float> seam;
  for (int y = 0; y < img.rows; ++y) {
    const auto* px = img.ptr<std::uint8_t>(y);
    const auto* p = prot.ptr<std::uint8_t>(y);
    const auto* g = gen.ptr<std::uint8_t>(y);
    for (int x = 0; x + 1 < img.cols; ++x) {
      const bool left_pair = g[x] != 0 && p[x + 1] != 0;
      const bool right_pair = p[x] != 0 && g[x + 1] != 0;
      if (left_pair || right_pair) {
        seam.push_back(static_cast<float>(max_channel_diff(px + x * 3, px + (x + 1) * 3)));
      }
    }
  }

  if (seam.empty() || seam.size() < limits.boundary_min_pair_count) {
    return SafetyCheckResult::pass();
  }

  double sum = 0.0;
  for (float d : seam) sum += d;
  const double mean_diff = sum / static_cast<double>(seam.size());
  const double p95_diff = percentile(seam, 95.0);

  if (mean_diff > limits.boundary_max_mean_diff || p95_diff > limits.boundary_max_p95_diff) {
    return SafetyCheckResult::fail(fmt::format(
        "generation boundary mismatch: mean_diff={:.4f}, p95_diff={:.4f}, pairs={}, "
        "limit_mean={:.4f}, limit_p95={:.4f}",
        mean_diff, p95_diff, seam.size(), limits.boundary_max_mean_diff,
        limits.boundary_max_p95_diff));
  }
  return SafetyCheckResult::pass();
}

SafetyCheckResult check_generated_region_naturalness(const mc::Frame& candidate,
                                                     const mc::Frame& protected_mask,
                                                     const mc::Frame& generation_mask,
                                                     const SafetyThresholds& limits) {
  Views v;
  std::string reason;
  if (!resolve_views(candidate, protected_mask, generation_mask, v, reason)) {
    return SafetyCheckResult::fail(reason);
  }
  const cv::Mat& img = v.image;
  const cv::Mat& prot = v.first_mask;
  const cv::Mat& gen = v.second_mask;

  const int w = img.cols;
  if (img.rows == 0 || w == 0) return SafetyCheckResult::pass();
  if (!mask_any(gen) || !mask_any(prot)) return SafetyCheckResult::pass();

  int left_boundary = w;
  int right_boundary = 0;
  for (int y = 0; y < prot.rows; ++y) {
    const auto* p = prot.ptr<std::uint8_t>(y);
    for (int x = 0; x < w; ++x) {
      if (p[x] == 0) continue;
      left_boundary = std::min(left_boundary, x);
      right_boundary = std::max(right_boundary, x + 1);
    }
  }

  const cv::Mat grad = gradient_magnitude(img);
  const int band = limits.naturalness_ref_band_width;
  const double edge = limits.naturalness_edge_threshold;
  std::vector<std::string> failures;

  if (left_boundary > 0) {
    const auto g = region_stats(img, grad, gen, 0, left_boundary, edge);
    const auto r = region_stats(img, grad, prot, left_boundary, left_boundary + band, edge);
    if (auto side = judge_side("left", g, r, limits); !side.empty()) {
      failures.push_back(std::move(side));
    }
  }
  if (right_boundary < w) {
    const auto g = region_stats(img, grad, gen, right_boundary, w, edge);
    const auto r = region_stats(img, grad, prot, right_boundary - band, right_boundary, edge);
    if (auto side = judge_side("right", g, r, limits); !side.empty()) {
      failures.push_back(std::move(side));
    }
  }

  if (!failures.empty()) {
    std::string joined;
    for (const auto& f : failures) {
      if (!joined.empty()) joined += ", ";
      joined += f;
    }
    return SafetyCheckResult::fail("generated region unnatural: " + joined);
  }
  return SafetyCheckResult::pass();
}

}  // namespace memoria::vision
