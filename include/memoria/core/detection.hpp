#pragma once

#include <cstdint>
#include <string>

namespace memoria::core {

/// Single detector hit in pixel space: label, confidence, box (x1,y1) inclusive, (x2,y2) exclusive.
/// Consumed only by safety validators; never persisted.
struct Detection {
  std::string label;
  float confidence{0.f};
  std::int32_t x1{0};
  std::int32_t y1{0};
  std::int32_t x2{0};
  std::int32_t y2{0};
};

}  // namespace memoria::core
