#include <memoria/core/frame.hpp>
#include <algorithm>
#include <cstddef>

namespace memoria::core {

Frame Frame::filled(std::uint32_t width,
                    std::uint32_t height,
                    PixelFormat format,
                    std::uint8_t value) {
  std::vector<std::byte> buffer(min_bytes(width, height, format), std::byte{value});
  return Frame(width, height, format, std::move(buffer));
}

std::size_t Frame::channels() const noexcept {
  switch (format_) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
    case PixelFormat::RGB8:
      return 3;
    case PixelFormat::Float32Planar:
      return 3 * sizeof(float);
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::Float32Planar:
      return pixels * 3 * sizeof(float);  // HWC, 3 channels
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Frame::same_pixels(const Frame& other) const noexcept {
  return width_ == other.width_ && height_ == other.height_ &&
         format_ == other.format_ &&
         std::equal(buffer_.begin(), buffer_.end(), other.buffer_.begin(),
                    other.buffer_.end());
}

}  // namespace memoria::core
