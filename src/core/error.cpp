#include <memoria/core/error.hpp>

namespace memoria::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "none";
    case PipelineError::InvalidFrame:
      return "invalid frame";
    case PipelineError::LoadFailed:
      return "load failed";
    case PipelineError::InferenceFailed:
      return "inference failed";
    case PipelineError::InvalidConfig:
      return "invalid config";
    case PipelineError::InvalidArgument:
      return "invalid argument";
    case PipelineError::NotFound:
      return "not found";
    case PipelineError::EncoderFailed:
      return "encoder failed";
    case PipelineError::BackendUnavailable:
      return "backend unavailable";
  }
  return "unknown";
}

}  // namespace memoria::core
