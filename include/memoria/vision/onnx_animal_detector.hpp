#pragma once

#include <memoria/vision/animal_detector.hpp>
#include <memory>
#include <string>
#include <vector>

namespace memoria::vision {

/// ONNX Runtime animal detector for YOLO-style exports.
///
/// Expected model: one float image input ([1,3,H,W] or [1,H,W,3], RGB in [0,1])
/// and a single output [1, N, 6] or [1, 6, N] with (xmin, ymin, xmax, ymax, score,
/// class_id) per detection in model-input pixels (e.g. YOLOv10 exports).
/// Images are letterboxed into the model input; boxes are mapped back to the
/// source image. Only classes whose label is an animal are reported.
class OnnxAnimalDetector : public IAnimalDetector {
 public:
  /// \param model_path Path to the .onnx model file. Throws Ort::Exception if it cannot be loaded.
  /// \param confidence_threshold Detections below this score are dropped.
  /// \param class_labels Class id -> label; defaults to the 80 COCO labels.
  OnnxAnimalDetector(const std::string& model_path,
                     float confidence_threshold,
                     std::vector<std::string> class_labels = {});
  ~OnnxAnimalDetector() override;

  OnnxAnimalDetector(const OnnxAnimalDetector&) = delete;
  OnnxAnimalDetector& operator=(const OnnxAnimalDetector&) = delete;

  [[nodiscard]] bool available() const override { return true; }

  [[nodiscard]] std::expected<std::vector<memoria::core::Detection>,
                              memoria::core::PipelineError>
  detect(const memoria::core::Frame& image) override;

  [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Model; }
  [[nodiscard]] std::string name() const override { return "onnx-detector"; }

  /// True for labels counted as animals (bird, cat, dog, horse, sheep, cow, elephant, bear, zebra, giraffe).
  [[nodiscard]] static bool is_animal_label(const std::string& label);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace memoria::vision
