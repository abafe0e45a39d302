#include "frame_cv_utils.hpp"
#include <memoria/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace memoria::vision::detail {

namespace mc = memoria::core;

std::optional<cv::Mat> frame_to_mat(const mc::Frame& frame) {
  if (frame.empty()) return std::nullopt;
  if (frame.size_bytes() < mc::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* ptr = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case mc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, ptr);
    case mc::PixelFormat::RGB8:
    case mc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, ptr);
    case mc::PixelFormat::Float32Planar:
      return cv::Mat(h, w, CV_32FC3, ptr);
    case mc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

mc::Frame mat_to_frame(const cv::Mat& mat, mc::PixelFormat format) {
  if (mat.empty()) return mc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return mc::Frame(w, h, format, std::move(buffer));
}

std::optional<cv::Mat> mask_to_mat(const mc::Frame& mask) {
  if (mask.format() != mc::PixelFormat::Grayscale8) return std::nullopt;
  return frame_to_mat(mask);
}

}  // namespace memoria::vision::detail
