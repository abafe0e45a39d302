#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace memoria::core {

/// Pipeline error codes; used with std::expected for recoverable failures
/// and carried by PipelineFailure for hard failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  InferenceFailed,
  InvalidConfig,
  InvalidArgument,
  NotFound,
  EncoderFailed,
  BackendUnavailable,
};

[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;

/// Hard failure of a run: policy/validation errors, missing inputs, encoder failures.
/// Never thrown for safety or generation failures; those degrade to a fallback.
class PipelineFailure : public std::runtime_error {
 public:
  PipelineFailure(PipelineError code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  [[nodiscard]] PipelineError code() const noexcept { return code_; }

 private:
  PipelineError code_;
};

/// Thrown by a cancel-check callback when the caller requested cancellation.
/// The pipeline does not catch it; the run aborts.
class Canceled : public std::runtime_error {
 public:
  Canceled() : std::runtime_error("pipeline run canceled") {}
  explicit Canceled(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace memoria::core
