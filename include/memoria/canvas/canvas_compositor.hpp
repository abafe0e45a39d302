#pragma once

#include <memoria/canvas/canvas_options.hpp>
#include <memoria/core/build_result.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/core/progress.hpp>
#include <memoria/vision/animal_detector.hpp>
#include <memoria/vision/outpaint_backend.hpp>
#include <memory>
#include <string>

namespace memoria::canvas {

/// Builds the fixed-size canvas for one photo and, when policy allows, extends
/// it with the outpaint capability under the safety gate.
///
/// The compositor never throws on a safety or generation failure: those degrade
/// to the safe composite (blurred or reflected background, photo centered),
/// which is computed before any attempt. It throws core::PipelineFailure for
/// malformed input and propagates whatever the cancel check throws.
/// Backends are shared and must outlive no particular compositor; one instance
/// may be used by sequential calls.
class CanvasCompositor {
 public:
  /// Throws core::PipelineFailure{InvalidArgument} if a backend is null.
  CanvasCompositor(CanvasOptions options,
                   std::shared_ptr<vision::IOutpaintBackend> outpaint,
                   std::shared_ptr<vision::IAnimalDetector> detector);

  /// Canvas for a BGR8 \p photo. Up to max_attempts attempts (one in fast mode).
  /// If \p cancel is non-null it is invoked before and after each attempt.
  [[nodiscard]] core::CanvasBuildResult build_canvas(const core::Frame& photo,
                                                     bool fast_mode,
                                                     bool enable_animal_detection,
                                                     const core::CancelCheck* cancel = nullptr) const;

  /// Loads \p input_path, builds the canvas and saves it to \p output_path.
  /// Throws core::PipelineFailure{LoadFailed} or the save error code.
  core::CanvasBuildResult run_canvas_job(const std::string& input_path,
                                         const std::string& output_path,
                                         bool fast_mode,
                                         bool enable_animal_detection,
                                         const core::CancelCheck* cancel = nullptr) const;

  [[nodiscard]] const CanvasOptions& options() const noexcept { return options_; }

 private:
  CanvasOptions options_;
  std::shared_ptr<vision::IOutpaintBackend> outpaint_;
  std::shared_ptr<vision::IAnimalDetector> detector_;
};

}  // namespace memoria::canvas
