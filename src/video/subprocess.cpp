#include "subprocess.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace memoria::video::detail {

namespace {

// Bound on retained stderr; ffmpeg can be chatty on long encodes.
constexpr std::size_t kMaxStderrBytes = 64 * 1024;

}  // namespace

ProcessResult run_process(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument), "run_process: empty argv");
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  int err_pipe[2];
  if (::pipe(err_pipe) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int e = errno;
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    throw std::system_error(e, std::generic_category(), "fork");
  }
  if (pid == 0) {
    // Keep terminal Ctrl-C away from the child: only the parent sees it and
    // turns it into a cancel request at its next poll point.
    ::setpgid(0, 0);
    std::signal(SIGINT, SIG_IGN);
    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
      ::close(devnull);
    }
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    ::execvp(args[0], args.data());
    std::fprintf(stderr, "execvp(%s) failed: %s\n", args[0], std::strerror(errno));
    std::_Exit(127);
  }

  ::close(err_pipe[1]);
  ProcessResult result;
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(err_pipe[0], buf, sizeof(buf));
    if (n > 0) {
      if (result.stderr_text.size() < kMaxStderrBytes) {
        result.stderr_text.append(buf, static_cast<std::size_t>(n));
      }
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  ::close(err_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

ScopedTempDir::ScopedTempDir(const std::string& prefix) {
  static std::atomic<unsigned> counter{0};
  const auto base = std::filesystem::temp_directory_path();
  for (int tries = 0; tries < 100; ++tries) {
    auto candidate = base / (prefix + std::to_string(::getpid()) + "_" +
                             std::to_string(counter.fetch_add(1)));
    if (std::filesystem::create_directory(candidate)) {
      path_ = std::move(candidate);
      return;
    }
  }
  throw std::system_error(std::make_error_code(std::errc::file_exists),
                          "cannot create temporary directory for " + prefix);
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) spdlog::debug("temp dir cleanup failed for {}: {}", path_.string(), ec.message());
}

}  // namespace memoria::video::detail
