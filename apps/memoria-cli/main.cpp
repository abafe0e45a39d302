/**
 * memoria-cli: build a memorial video from still photos.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/memoria_cli --image a.jpg --image b.jpg --output out/memorial.mp4 --prompt "..."
 * Ctrl-C requests cancellation; the run stops at the next poll point (exit code 130).
 */

#include <memoria/app/config.hpp>
#include <memoria/app/pipeline_orchestrator.hpp>
#include <memoria/core/error.hpp>
#include <memoria/video/video_encoder.hpp>

#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;

void on_sigint(int) { g_cancel_requested = 1; }

void print_usage() {
  std::cout << "Usage: memoria_cli --image <path> [--image <path>...] --output <video> --prompt <text> [options]\n"
            << "  --config <path>           Pipeline config (key=value file); default: built-in\n"
            << "  --workdir <dir>           Working directory for intermediates (default: <output dir>/work)\n"
            << "  --duration 6|10           Transition duration in seconds (default 6)\n"
            << "  --negative-prompt <text>  Negative prompt for generated transition frames\n"
            << "  --last-duration <N>       Closing clip duration, 2..20 seconds (default 4)\n"
            << "  --motion <style>          Closing clip motion: zoom_in | zoom_out | none\n"
            << "  --bgm <path>              Background music file\n"
            << "  --bgm-volume <V>          Background music volume, 0..1 (default 0.15)\n"
            << "\nEnvironment variables MEMORIA_<KEY> override config keys (e.g. MEMORIA_TARGET_FPS=30).\n";
}

int parse_int(const std::string& flag, const std::string& value) {
  try {
    return std::stoi(value);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
  }
}

double parse_double(const std::string& flag, const std::string& value) {
  try {
    return std::stod(value);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string workdir;
  memoria::app::PipelineRequest request;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      const bool has_value = i + 1 < argc;
      if (arg == "--help" || arg == "-h") {
        print_usage();
        return 0;
      } else if (arg == "--image" && has_value) {
        request.image_paths.emplace_back(argv[++i]);
      } else if (arg == "--output" && has_value) {
        request.final_output_path = argv[++i];
      } else if (arg == "--prompt" && has_value) {
        request.transition_prompt = argv[++i];
      } else if (arg == "--config" && has_value) {
        config_path = argv[++i];
      } else if (arg == "--workdir" && has_value) {
        workdir = argv[++i];
      } else if (arg == "--duration" && has_value) {
        request.transition_duration_seconds = parse_int(arg, argv[++i]);
      } else if (arg == "--negative-prompt" && has_value) {
        request.transition_negative_prompt = argv[++i];
      } else if (arg == "--last-duration" && has_value) {
        request.last_clip_duration_seconds = parse_int(arg, argv[++i]);
      } else if (arg == "--motion" && has_value) {
        const std::string value = argv[++i];
        if (!memoria::video::parse_motion_style(value, request.last_clip_motion)) {
          throw std::invalid_argument("--motion expects zoom_in, zoom_out or none");
        }
      } else if (arg == "--bgm" && has_value) {
        request.bgm_path = argv[++i];
      } else if (arg == "--bgm-volume" && has_value) {
        request.bgm_volume = parse_double(arg, argv[++i]);
      } else {
        throw std::invalid_argument("unknown or incomplete argument: " + arg);
      }
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    print_usage();
    return 1;
  }

  if (request.final_output_path.empty()) {
    std::cerr << "--output is required\n";
    return 1;
  }
  if (workdir.empty()) {
    workdir = (std::filesystem::path(request.final_output_path).parent_path() / "work").string();
  }
  request.working_dir = workdir;

  try {
    memoria::app::PipelineConfig cfg = config_path.empty() ? memoria::app::default_config()
                                                           : memoria::app::load_config(config_path);
    memoria::app::apply_env_overrides(cfg);
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    std::signal(SIGINT, on_sigint);

    memoria::app::PipelineOrchestrator orchestrator(cfg, memoria::app::default_services(cfg));
    const auto summary = orchestrator.run(
        request,
        [](std::string_view stage, int percent, const std::optional<std::string>& detail) {
          spdlog::info("[{:>3}%] {}{}", percent, stage, detail ? ": " + *detail : std::string());
        },
        []() {
          if (g_cancel_requested) throw memoria::core::Canceled("canceled by SIGINT");
        });

    std::cout << "output=" << summary.final_output_path
              << " canvases=" << summary.canvas_paths.size()
              << " transitions=" << summary.transition_paths.size()
              << " fallbacks=" << summary.fallback_count
              << " (canvas=" << summary.canvas_fallback_count
              << ", transition=" << summary.transition_fallback_count << ")"
              << " safety_failed=" << summary.safety_failed_count << "\n";
  } catch (const memoria::core::Canceled& e) {
    spdlog::warn("{}", e.what());
    return 130;
  } catch (const memoria::core::PipelineFailure& e) {
    spdlog::error("pipeline failed ({}): {}", memoria::core::to_string(e.code()), e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("pipeline failed: {}", e.what());
    return 1;
  }
  return 0;
}
