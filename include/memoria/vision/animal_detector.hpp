#pragma once

#include <memoria/core/detection.hpp>
#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/vision/backend_kind.hpp>
#include <expected>
#include <string>
#include <vector>

namespace memoria::vision {

/// Animal detector capability: BGR8 Frame -> pixel-space detections of animals only.
/// Instances are read-only after construction and reusable across runs.
class IAnimalDetector {
 public:
  virtual ~IAnimalDetector() = default;

  /// False when no model is wired; detect() then returns an empty list.
  [[nodiscard]] virtual bool available() const = 0;

  [[nodiscard]] virtual std::expected<std::vector<memoria::core::Detection>,
                                      memoria::core::PipelineError>
  detect(const memoria::core::Frame& image) = 0;

  [[nodiscard]] virtual BackendKind kind() const noexcept = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace memoria::vision
