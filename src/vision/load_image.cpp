#include <memoria/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <memoria/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <system_error>

namespace memoria::vision {

std::optional<memoria::core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) return std::nullopt;
  return detail::mat_to_frame(mat, memoria::core::PixelFormat::BGR8);
}

std::expected<void, memoria::core::PipelineError>
save_frame_to_image(const memoria::core::Frame& frame, const std::string& path) {
  using memoria::core::PipelineError;
  if (frame.format() != memoria::core::PixelFormat::BGR8) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) return std::unexpected(PipelineError::LoadFailed);
  }
  try {
    if (!cv::imwrite(path, *mat)) {
      return std::unexpected(PipelineError::LoadFailed);
    }
  } catch (const cv::Exception&) {
    return std::unexpected(PipelineError::LoadFailed);
  }
  return {};
}

}  // namespace memoria::vision
