#pragma once

#include <memoria/core/error.hpp>
#include <memoria/core/frame.hpp>
#include <expected>
#include <optional>
#include <string>

namespace memoria::vision {

/// Load an image file into a BGR8 Frame (grayscale and alpha inputs are converted).
/// Returns nullopt on failure.
std::optional<memoria::core::Frame> load_frame_from_image(const std::string& path);

/// Write a BGR8 Frame to \p path (format from extension); creates parent directories.
[[nodiscard]] std::expected<void, memoria::core::PipelineError>
save_frame_to_image(const memoria::core::Frame& frame, const std::string& path);

}  // namespace memoria::vision
