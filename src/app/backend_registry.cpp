#include <memoria/app/backend_registry.hpp>
#include <memoria/core/error.hpp>
#include <memoria/vision/identity_transition_backend.hpp>
#include <memoria/vision/mirror_outpaint_backend.hpp>
#include <memoria/vision/null_animal_detector.hpp>
#include <memoria/vision/onnx_animal_detector.hpp>
#include <memoria/vision/onnx_outpaint_backend.hpp>
#include <memoria/vision/onnx_transition_backend.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <mutex>

namespace memoria::app {

namespace mc = memoria::core;
namespace mv = memoria::vision;

namespace {

struct Registry {
  std::mutex mutex;
  std::shared_ptr<mv::IOutpaintBackend> outpaint;
  std::shared_ptr<mv::IAnimalDetector> detector;
  std::shared_ptr<mv::ITransitionFrameBackend> transition;
};

Registry& registry() {
  static Registry r;
  return r;
}

void require_model_path(const std::string& path, const char* key) {
  if (path.empty()) {
    throw mc::PipelineFailure(mc::PipelineError::InvalidConfig,
                              std::string(key) + " is required for the onnx provider");
  }
}

// Builds the model variant under auto policy; nullptr (logged) when it cannot.
template <typename Make>
auto try_model(const char* capability, const std::string& path, Make make) -> decltype(make()) {
  if (path.empty()) {
    spdlog::info("{}: no model configured, using reference variant", capability);
    return nullptr;
  }
  try {
    return make();
  } catch (const std::exception& e) {
    spdlog::warn("{}: cannot load model '{}' ({}), using reference variant", capability, path,
                 e.what());
    return nullptr;
  }
}

}  // namespace

std::shared_ptr<mv::IOutpaintBackend> default_outpaint_backend(const PipelineConfig& config) {
  auto& r = registry();
  std::lock_guard lock(r.mutex);
  if (r.outpaint) return r.outpaint;

  auto make_onnx = [&]() -> std::shared_ptr<mv::IOutpaintBackend> {
    return std::make_shared<mv::OnnxOutpaintBackend>(config.outpaint_model_path,
                                                     config.outpaint_fast_max_side);
  };
  switch (config.outpaint_provider) {
    case OutpaintProvider::Mirror:
      break;
    case OutpaintProvider::Onnx:
      require_model_path(config.outpaint_model_path, "outpaint_model_path");
      r.outpaint = make_onnx();
      break;
    case OutpaintProvider::Auto:
      r.outpaint = try_model("outpaint", config.outpaint_model_path, make_onnx);
      break;
  }
  if (!r.outpaint) r.outpaint = std::make_shared<mv::MirrorOutpaintBackend>();
  spdlog::info("outpaint backend: {}", r.outpaint->name());
  return r.outpaint;
}

std::shared_ptr<mv::IAnimalDetector> default_animal_detector(const PipelineConfig& config) {
  auto& r = registry();
  std::lock_guard lock(r.mutex);
  if (r.detector) return r.detector;

  auto make_onnx = [&]() -> std::shared_ptr<mv::IAnimalDetector> {
    return std::make_shared<mv::OnnxAnimalDetector>(config.animal_detector_model_path,
                                                    config.animal_detector_confidence_threshold);
  };
  switch (config.animal_detector_provider) {
    case DetectorProvider::Null:
      break;
    case DetectorProvider::Onnx:
      require_model_path(config.animal_detector_model_path, "animal_detector_model_path");
      r.detector = make_onnx();
      break;
    case DetectorProvider::Auto:
      r.detector = try_model("animal detector", config.animal_detector_model_path, make_onnx);
      break;
  }
  if (!r.detector) r.detector = std::make_shared<mv::NullAnimalDetector>();
  spdlog::info("animal detector: {} (available={})", r.detector->name(), r.detector->available());
  return r.detector;
}

std::shared_ptr<mv::ITransitionFrameBackend> default_transition_backend(
    const PipelineConfig& config) {
  auto& r = registry();
  std::lock_guard lock(r.mutex);
  if (r.transition) return r.transition;

  auto make_onnx = [&]() -> std::shared_ptr<mv::ITransitionFrameBackend> {
    return std::make_shared<mv::OnnxTransitionBackend>(config.transition_model_path,
                                                       config.transition_generation_width,
                                                       config.transition_generation_height);
  };
  switch (config.transition_provider) {
    case TransitionProvider::Classic:
      break;
    case TransitionProvider::Onnx:
      require_model_path(config.transition_model_path, "transition_model_path");
      r.transition = make_onnx();
      break;
    case TransitionProvider::Auto:
      r.transition = try_model("transition", config.transition_model_path, make_onnx);
      break;
  }
  if (!r.transition) r.transition = std::make_shared<mv::IdentityTransitionBackend>();
  spdlog::info("transition backend: {}", r.transition->name());
  return r.transition;
}

void reset_default_backends() {
  auto& r = registry();
  std::lock_guard lock(r.mutex);
  r.outpaint.reset();
  r.detector.reset();
  r.transition.reset();
}

}  // namespace memoria::app
