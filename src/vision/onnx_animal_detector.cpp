#include <memoria/vision/onnx_animal_detector.hpp>
#include "frame_cv_utils.hpp"
#include "onnx_model.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace memoria::vision {

namespace {

constexpr std::int64_t kNumChannels = 3;
constexpr int kLetterboxFill = 114;

const std::vector<std::string>& coco_labels() {
  static const std::vector<std::string> labels = {
      "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck",
      "boat", "traffic light", "fire hydrant", "stop sign", "parking meter", "bench",
      "bird", "cat", "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra",
      "giraffe", "backpack", "umbrella", "handbag", "tie", "suitcase", "frisbee",
      "skis", "snowboard", "sports ball", "kite", "baseball bat", "baseball glove",
      "skateboard", "surfboard", "tennis racket", "bottle", "wine glass", "cup",
      "fork", "knife", "spoon", "bowl", "banana", "apple", "sandwich", "orange",
      "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair", "couch",
      "potted plant", "bed", "dining table", "toilet", "tv", "laptop", "mouse",
      "remote", "keyboard", "cell phone", "microwave", "oven", "toaster", "sink",
      "refrigerator", "book", "clock", "vase", "scissors", "teddy bear",
      "hair drier", "toothbrush"};
  return labels;
}

}  // namespace

struct OnnxAnimalDetector::Impl {
  Impl(const std::string& path, float threshold, std::vector<std::string> labels)
      : model(path, "memoria-detector"),
        confidence_threshold(threshold),
        class_labels(labels.empty() ? coco_labels() : std::move(labels)) {}

  detail::OnnxModel model;
  float confidence_threshold;
  std::vector<std::string> class_labels;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};
};

OnnxAnimalDetector::OnnxAnimalDetector(const std::string& model_path,
                                       float confidence_threshold,
                                       std::vector<std::string> class_labels)
    : impl_(std::make_unique<Impl>(model_path, confidence_threshold, std::move(class_labels))) {
  if (impl_->model.input_count() == 0) {
    throw std::runtime_error("OnnxAnimalDetector: model has no inputs");
  }
  if (impl_->model.output_count() != 1u) {
    throw std::runtime_error("OnnxAnimalDetector: expected a single YOLO-style output");
  }

  const std::vector<std::int64_t> dims = impl_->model.input_shape(0);
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxAnimalDetector: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]
  if (dims[1] == kNumChannels && dims[2] > 0 && dims[3] > 0) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels && dims[1] > 0 && dims[2] > 0) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxAnimalDetector: expected fixed input shape [1,3,H,W] or [1,H,W,3]");
  }
}

OnnxAnimalDetector::~OnnxAnimalDetector() = default;

bool OnnxAnimalDetector::is_animal_label(const std::string& label) {
  static const std::array<const char*, 10> kAnimals = {
      "bird", "cat", "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra", "giraffe"};
  return std::any_of(kAnimals.begin(), kAnimals.end(),
                     [&](const char* a) { return label == a; });
}

std::expected<std::vector<memoria::core::Detection>, memoria::core::PipelineError>
OnnxAnimalDetector::detect(const memoria::core::Frame& image) {
  using memoria::core::PipelineError;

  if (image.format() != memoria::core::PixelFormat::BGR8) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  auto src = detail::frame_to_mat(image);
  if (!src) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  // Letterbox into the model input, anchored top-left so boxes map back by 1/scale.
  const int in_w = static_cast<int>(impl_->input_width);
  const int in_h = static_cast<int>(impl_->input_height);
  const double scale = std::min(static_cast<double>(in_w) / src->cols,
                                static_cast<double>(in_h) / src->rows);
  const int rw = std::max(1, static_cast<int>(std::lround(src->cols * scale)));
  const int rh = std::max(1, static_cast<int>(std::lround(src->rows * scale)));
  cv::Mat resized;
  cv::resize(*src, resized, cv::Size(rw, rh), 0, 0, cv::INTER_LINEAR);
  cv::Mat letterbox(in_h, in_w, CV_8UC3, cv::Scalar::all(kLetterboxFill));
  resized.copyTo(letterbox(cv::Rect(0, 0, std::min(rw, in_w), std::min(rh, in_h))));

  std::vector<float> input = detail::bgr_to_rgb_planar(letterbox);
  std::vector<Ort::Value> inputs;
  if (impl_->input_is_nchw) {
    inputs.push_back(detail::make_nchw_tensor(input, kNumChannels, in_h, in_w));
  } else {
    // Model wants NHWC: interleave the planar buffer.
    std::vector<float> nhwc(input.size());
    const std::size_t hw = static_cast<std::size_t>(in_h) * in_w;
    for (std::size_t i = 0; i < hw; ++i) {
      for (std::size_t c = 0; c < 3; ++c) nhwc[i * 3 + c] = input[c * hw + i];
    }
    input.swap(nhwc);
    static const Ort::MemoryInfo mem_info =
        Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    const std::array<std::int64_t, 4> shape{1, in_h, in_w, kNumChannels};
    inputs.push_back(Ort::Value::CreateTensor<float>(mem_info, input.data(), input.size(),
                                                     shape.data(), shape.size()));
  }

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->model.run(inputs);
  } catch (const Ort::Exception& e) {
    spdlog::warn("animal detector inference failed: {}", e.what());
    return std::unexpected(PipelineError::InferenceFailed);
  }
  if (outputs.size() != 1u) {
    return std::unexpected(PipelineError::InferenceFailed);
  }

  // [1, N, 6] or [1, 6, N] : (xmin, ymin, xmax, ymax, score, class_id)
  const auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  const float* data = outputs[0].GetTensorData<float>();
  std::int64_t n = 0;
  bool rows_are_n6 = false;
  if (shape.size() == 3u && shape[0] == 1 && shape[2] == 6) {
    n = shape[1];
    rows_are_n6 = true;
  } else if (shape.size() == 3u && shape[0] == 1 && shape[1] == 6) {
    n = shape[2];
  } else {
    return std::unexpected(PipelineError::InferenceFailed);
  }

  std::vector<memoria::core::Detection> detections;
  const auto field = [&](std::int64_t i, int k) {
    return rows_are_n6 ? data[i * 6 + k] : data[static_cast<std::int64_t>(k) * n + i];
  };
  for (std::int64_t i = 0; i < n; ++i) {
    const float score = field(i, 4);
    if (score < impl_->confidence_threshold) continue;
    const auto cls = static_cast<std::int64_t>(field(i, 5));
    if (cls < 0 || static_cast<std::size_t>(cls) >= impl_->class_labels.size()) continue;
    const std::string& label = impl_->class_labels[static_cast<std::size_t>(cls)];
    if (!is_animal_label(label)) continue;

    memoria::core::Detection d;
    d.label = label;
    d.confidence = score;
    d.x1 = static_cast<std::int32_t>(std::floor(field(i, 0) / scale));
    d.y1 = static_cast<std::int32_t>(std::floor(field(i, 1) / scale));
    d.x2 = static_cast<std::int32_t>(std::ceil(field(i, 2) / scale));
    d.y2 = static_cast<std::int32_t>(std::ceil(field(i, 3) / scale));
    detections.push_back(std::move(d));
  }
  return detections;
}

}  // namespace memoria::vision
