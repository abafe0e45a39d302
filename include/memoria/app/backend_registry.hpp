#pragma once

#include <memoria/app/config.hpp>
#include <memoria/vision/animal_detector.hpp>
#include <memoria/vision/outpaint_backend.hpp>
#include <memoria/vision/transition_frame_backend.hpp>
#include <memory>

namespace memoria::app {

// Process-wide capability instances. Each accessor constructs its capability on
// first use from \p config (under a mutex) and returns the same instance on every
// later call, whatever config is passed then; call reset_default_backends() to
// re-resolve. Provider selection:
//   mirror / null / classic -> reference variant
//   onnx -> ONNX Runtime variant; a missing model path or load error throws
//   auto -> ONNX variant when a model path is set and loads, else reference (logged)

[[nodiscard]] std::shared_ptr<vision::IOutpaintBackend> default_outpaint_backend(
    const PipelineConfig& config);

[[nodiscard]] std::shared_ptr<vision::IAnimalDetector> default_animal_detector(
    const PipelineConfig& config);

[[nodiscard]] std::shared_ptr<vision::ITransitionFrameBackend> default_transition_backend(
    const PipelineConfig& config);

/// Drops the cached instances (callers holding a shared_ptr keep theirs alive).
void reset_default_backends();

}  // namespace memoria::app
