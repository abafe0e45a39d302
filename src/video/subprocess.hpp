#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace memoria::video::detail {

/// Exit status and captured stderr of a finished child process.
struct ProcessResult {
  int exit_code{-1};
  std::string stderr_text;
};

/// Runs argv[0] (looked up in PATH) with \p argv, waits for it and captures stderr.
/// stdout and stdin are redirected to /dev/null. exit_code is 127 when exec fails
/// and 128 + signal when the child was killed. Throws std::system_error if the
/// process cannot be started.
ProcessResult run_process(const std::vector<std::string>& argv);

/// Unique directory under the system temp dir, removed (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(const std::string& prefix);
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace memoria::video::detail
