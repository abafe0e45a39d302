#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace memoria::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// copies are deep, moves are cheap. Stages never mutate a Frame they did not
/// just produce; every transform returns a new Frame.
/// Thread-safety: distinct Frame instances are independent.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,     // masks: 0 = inactive, 255 = active
  BGR8,           // raster images, origin top-left
  RGB8,
  Float32Planar,  // HWC float, model input/output
};

/// Raster image or mask: dimensions, format, and owned buffer (tightly packed rows).
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  /// Frame of the given size with every byte set to \p value.
  [[nodiscard]] static Frame filled(std::uint32_t width,
                                    std::uint32_t height,
                                    PixelFormat format,
                                    std::uint8_t value = 0);

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }
  [[nodiscard]] std::size_t channels() const noexcept;

  /// Byte value at (x, y, channel). No bounds checking.
  [[nodiscard]] std::uint8_t at(std::uint32_t x, std::uint32_t y,
                                std::size_t channel = 0) const noexcept {
    return static_cast<std::uint8_t>(
        buffer_[(static_cast<std::size_t>(y) * width_ + x) * channels() + channel]);
  }

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  /// True when dimensions, format and every byte match.
  [[nodiscard]] bool same_pixels(const Frame& other) const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace memoria::core
