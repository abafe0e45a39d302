#include <memoria/core/frame.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

namespace mc = memoria::core;

TEST(Frame, DefaultEmpty) {
  mc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(f.size_bytes(), 0u);
  EXPECT_EQ(f.format(), mc::PixelFormat::Unknown);
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 60 * 3);
  mc::Frame f(100, 60, mc::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 60u);
  EXPECT_EQ(f.format(), mc::PixelFormat::BGR8);
  EXPECT_FALSE(f.empty());
  EXPECT_EQ(f.size_bytes(), 100u * 60 * 3);
  EXPECT_EQ(f.channels(), 3u);
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(mc::Frame::min_bytes(10, 10, mc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(mc::Frame::min_bytes(10, 10, mc::PixelFormat::BGR8), 300u);
  EXPECT_EQ(mc::Frame::min_bytes(10, 10, mc::PixelFormat::Float32Planar), 10u * 10 * 3 * 4);
  EXPECT_EQ(mc::Frame::min_bytes(10, 10, mc::PixelFormat::Unknown), 0u);
}

TEST(Frame, FilledSetsEveryByte) {
  const auto mask = mc::Frame::filled(4, 3, mc::PixelFormat::Grayscale8, 255);
  EXPECT_EQ(mask.size_bytes(), 12u);
  EXPECT_EQ(mask.channels(), 1u);
  for (std::uint32_t y = 0; y < 3; ++y) {
    for (std::uint32_t x = 0; x < 4; ++x) EXPECT_EQ(mask.at(x, y), 255);
  }
}

TEST(Frame, AtAddressesChannels) {
  std::vector<std::byte> buf(2 * 2 * 3, std::byte{0});
  buf[(1 * 2 + 1) * 3 + 2] = std::byte{200};  // (1,1) channel 2
  mc::Frame f(2, 2, mc::PixelFormat::BGR8, std::move(buf));
  EXPECT_EQ(f.at(1, 1, 2), 200);
  EXPECT_EQ(f.at(1, 1, 0), 0);
  EXPECT_EQ(f.at(0, 1, 2), 0);
}

TEST(Frame, CopyIsDeep) {
  auto a = mc::Frame::filled(2, 2, mc::PixelFormat::BGR8, 10);
  mc::Frame b = a;
  b.data()[0] = std::byte{99};
  EXPECT_EQ(a.at(0, 0), 10);
  EXPECT_EQ(b.at(0, 0), 99);
}

TEST(Frame, SamePixels) {
  const auto a = mc::Frame::filled(3, 3, mc::PixelFormat::BGR8, 7);
  auto b = a;
  EXPECT_TRUE(a.same_pixels(b));
  b.data()[5] = std::byte{8};
  EXPECT_FALSE(a.same_pixels(b));
  EXPECT_FALSE(a.same_pixels(mc::Frame::filled(3, 3, mc::PixelFormat::RGB8, 7)));
  EXPECT_FALSE(a.same_pixels(mc::Frame::filled(3, 2, mc::PixelFormat::BGR8, 7)));
}
