#pragma once

#include <cstdint>

namespace memoria::vision {

/// Closed set of capability variants: deterministic reference or model-backed.
enum class BackendKind : std::uint8_t {
  Reference,
  Model,
};

}  // namespace memoria::vision
