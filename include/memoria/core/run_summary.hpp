#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace memoria::core {

/// Terminal output of a pipeline run: produced artifact paths and fallback bookkeeping.
struct PipelineRunSummary {
  std::string final_output_path;
  std::vector<std::string> canvas_paths;
  std::vector<std::string> transition_paths;
  std::string last_clip_path;

  std::size_t fallback_count{0};
  std::size_t canvas_fallback_count{0};
  std::size_t transition_fallback_count{0};
  std::size_t safety_failed_count{0};
};

}  // namespace memoria::core
