#pragma once

#include <memoria/vision/animal_detector.hpp>

namespace memoria::vision {

/// Reference detector used when no model is configured: unavailable, never detects.
class NullAnimalDetector : public IAnimalDetector {
 public:
  [[nodiscard]] bool available() const override { return false; }

  [[nodiscard]] std::expected<std::vector<memoria::core::Detection>,
                              memoria::core::PipelineError>
  detect(const memoria::core::Frame& image) override;

  [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Reference; }
  [[nodiscard]] std::string name() const override { return "null"; }
};

}  // namespace memoria::vision
