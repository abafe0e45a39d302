#include <memoria/vision/null_animal_detector.hpp>

namespace memoria::vision {

std::expected<std::vector<memoria::core::Detection>, memoria::core::PipelineError>
NullAnimalDetector::detect(const memoria::core::Frame& /*image*/) {
  return std::vector<memoria::core::Detection>{};
}

}  // namespace memoria::vision
