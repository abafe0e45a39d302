#pragma once

#include <memoria/core/build_result.hpp>
#include <memoria/core/frame.hpp>
#include <memoria/core/progress.hpp>
#include <memoria/vision/animal_detector.hpp>
#include <memoria/vision/transition_frame_backend.hpp>
#include <memoria/video/video_encoder.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace memoria::video {

/// Transition generator settings.
struct TransitionOptions {
  std::int32_t target_width{1600};
  std::int32_t target_height{900};
  std::int32_t fps{24};
  std::int32_t max_attempts{2};
  std::int32_t generation_step{8};
  std::int32_t safety_sample_step{8};
  std::int32_t allowed_extra_animals{0};
  std::int32_t protected_diff_threshold{8};
  bool strict_safety{true};
  /// Skip generation entirely and always build the classic cross-fade.
  bool classic_provider{false};
};

/// True for the supported transition lengths (6 and 10 seconds).
[[nodiscard]] bool is_allowed_transition_duration(int seconds) noexcept;

/// Interior frame indices checked for extra animals: 1, 1+step, ... below total-1,
/// plus total-2. Empty when total_frames <= 2.
[[nodiscard]] std::vector<std::size_t> transition_sample_indices(std::size_t total_frames,
                                                                 int step);

/// Builds one transition clip between two canvases under the frame-sampled safety
/// gate, falling back to the encoder's classic cross-fade when no generative attempt
/// is accepted.
///
/// Throws core::PipelineFailure{InvalidArgument} for a bad duration or blank prompt,
/// core::PipelineFailure{LoadFailed} for an unreadable canvas, and lets encoder
/// failures and cancellation propagate. Generation and safety failures never throw.
class TransitionGenerator {
 public:
  /// Throws core::PipelineFailure{InvalidArgument} if any collaborator is null.
  TransitionGenerator(TransitionOptions options,
                      std::shared_ptr<vision::ITransitionFrameBackend> backend,
                      std::shared_ptr<vision::IAnimalDetector> detector,
                      std::shared_ptr<IVideoEncoder> encoder);

  core::TransitionBuildResult build_transition(const std::string& canvas_a_path,
                                               const std::string& canvas_b_path,
                                               const std::string& output_path,
                                               int duration_seconds,
                                               const std::string& prompt,
                                               const std::optional<std::string>& negative_prompt,
                                               const core::CancelCheck* cancel = nullptr) const;

  /// duration x fps frames (at least 2) cross-dissolving \p frame_a into \p frame_b.
  /// Every generation_step-th interior frame is passed through the backend; the first
  /// and last frames are copies of the inputs. Throws core::PipelineFailure when the
  /// backend fails or the inputs differ in size.
  [[nodiscard]] std::vector<core::Frame> render_transition_frames(
      const core::Frame& frame_a,
      const core::Frame& frame_b,
      int duration_seconds,
      const std::string& prompt,
      const std::optional<std::string>& negative_prompt,
      const core::CancelCheck* cancel = nullptr) const;

  /// First/last exactness, then animal counts on sampled frames against the
  /// larger of the two endpoint counts. Returns the failure reason, or nullopt.
  [[nodiscard]] std::optional<std::string> validate_frames(const std::vector<core::Frame>& frames,
                                                           const core::Frame& frame_a,
                                                           const core::Frame& frame_b) const;

  [[nodiscard]] const TransitionOptions& options() const noexcept { return options_; }

 private:
  core::Frame load_canvas(const std::string& path) const;

  TransitionOptions options_;
  std::shared_ptr<vision::ITransitionFrameBackend> backend_;
  std::shared_ptr<vision::IAnimalDetector> detector_;
  std::shared_ptr<IVideoEncoder> encoder_;
};

}  // namespace memoria::video
