#pragma once

#include <memoria/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace memoria::vision::detail {

/// Wrap Frame as cv::Mat (non-owning view; valid while the Frame lives and is
/// not resized). Returns nullopt if the format is unsupported. Callers must not
/// write through a view of a caller-owned Frame.
std::optional<cv::Mat> frame_to_mat(const memoria::core::Frame& frame);

/// Convert cv::Mat to Frame (deep copy).
memoria::core::Frame mat_to_frame(const cv::Mat& mat,
                                  memoria::core::PixelFormat format);

/// Single-channel 8-bit view of a mask Frame; nullopt unless Grayscale8.
std::optional<cv::Mat> mask_to_mat(const memoria::core::Frame& mask);

}  // namespace memoria::vision::detail
