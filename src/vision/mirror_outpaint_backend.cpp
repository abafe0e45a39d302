#include <memoria/vision/mirror_outpaint_backend.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <cstdint>

namespace memoria::vision {

std::expected<memoria::core::Frame, memoria::core::PipelineError>
MirrorOutpaintBackend::outpaint(const memoria::core::Frame& base,
                                const memoria::core::Frame& generation_mask,
                                const OutpaintParams& /*params*/) {
  using memoria::core::PipelineError;
  using memoria::core::PixelFormat;

  if (base.format() != PixelFormat::BGR8) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  auto src = detail::frame_to_mat(base);
  auto mask = detail::mask_to_mat(generation_mask);
  if (!src || !mask || mask->size() != src->size()) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  cv::Mat out = src->clone();
  const int w = out.cols;
  for (int y = 0; y < out.rows; ++y) {
    const auto* m = mask->ptr<std::uint8_t>(y);
    int first_valid = -1;
    int last_valid = -1;
    for (int x = 0; x < w; ++x) {
      if (m[x] != 0) continue;
      if (first_valid < 0) first_valid = x;
      last_valid = x;
    }
    if (first_valid < 0) continue;  // whole row masked: nothing to copy from

    auto* row = out.ptr<cv::Vec3b>(y);
    for (int x = 0; x < first_valid; ++x) {
      if (m[x] != 0) row[x] = row[first_valid];
    }
    for (int x = last_valid + 1; x < w; ++x) {
      if (m[x] != 0) row[x] = row[last_valid];
    }
  }
  return detail::mat_to_frame(out, PixelFormat::BGR8);
}

}  // namespace memoria::vision
