#include "snapshot/snapshot.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <functional>
#include <sstream>

#include "core/config.hpp"

namespace coderun {

namespace fs = std::filesystem;

Result<std::string> run_process(const std::vector<std::string> &argv, const fs::path &cwd) {
  if (argv.empty()) {
    return Result<std::string>::failure("Empty command");
  }

  // Create a pipe for capturing stdout+stderr
  int pipe_fd[2];
  if (pipe(pipe_fd) == -1) {
    return Result<std::string>::failure("Failed to create pipe: " + std::string(strerror(errno)));
  }

  pid_t pid = fork();
  if (pid == -1) {
    close(pipe_fd[0]);
    close(pipe_fd[1]);
    return Result<std::string>::failure("Failed to fork process: " + std::string(strerror(errno)));
  }

  if (pid == 0) {
    // Child process
    close(pipe_fd[0]);
    dup2(pipe_fd[1], STDOUT_FILENO);
    dup2(pipe_fd[1], STDERR_FILENO);
    close(pipe_fd[1]);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
      _exit(126);
    }

    std::vector<char *> args;
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    execvp(args[0], args.data());
    _exit(127);  // exec failed
  }

  // Parent process
  close(pipe_fd[1]);

  std::string output;
  std::array<char, 4096> buffer;
  while (true) {
    ssize_t bytes_read = read(pipe_fd[0], buffer.data(), buffer.size());
    if (bytes_read > 0) {
      output.append(buffer.data(), static_cast<size_t>(bytes_read));
    } else if (bytes_read == 0) {
      break;
    } else if (errno != EINTR) {
      break;
    }
  }
  close(pipe_fd[0]);

  int status = 0;
  if (waitpid(pid, &status, 0) == -1) {
    return Result<std::string>::failure("waitpid failed: " + std::string(strerror(errno)));
  }

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<std::string>::failure(argv[0] + " exited with code " + std::to_string(code) + ": " + trim_end(output));
  }

  return Result<std::string>::success(output);
}

// --- GitSnapshot ---

GitSnapshot::GitSnapshot(fs::path worktree, fs::path git_dir) : worktree_(std::move(worktree)), git_dir_(std::move(git_dir)) {}

fs::path GitSnapshot::default_git_dir(const fs::path &worktree) {
  auto absolute = fs::absolute(worktree).lexically_normal().string();
  std::stringstream ss;
  ss << std::hex << std::hash<std::string>{}(absolute);
  return config_paths::data_dir() / "snapshot" / ss.str();
}

Result<std::string> GitSnapshot::git(const std::vector<std::string> &args) {
  std::vector<std::string> argv = {"git", "--git-dir", git_dir_.string(), "--work-tree", worktree_.string()};
  argv.insert(argv.end(), args.begin(), args.end());
  return run_process(argv, worktree_);
}

bool GitSnapshot::ensure_initialized() {
  if (initialized_) return true;

  std::error_code ec;
  if (!fs::exists(git_dir_ / "HEAD")) {
    fs::create_directories(git_dir_, ec);
    if (ec) {
      spdlog::warn("[Snapshot] Failed to create {}: {}", git_dir_.string(), ec.message());
      return false;
    }

    auto init = git({"init", "--quiet"});
    if (!init.ok()) {
      spdlog::warn("[Snapshot] git init failed: {}", *init.error);
      return false;
    }

    // Line endings must be recorded as-is for diffs to be meaningful
    auto autocrlf = git({"config", "core.autocrlf", "false"});
    if (!autocrlf.ok()) {
      spdlog::warn("[Snapshot] git config failed: {}", *autocrlf.error);
    }
    spdlog::info("[Snapshot] Initialized {}", git_dir_.string());
  }

  initialized_ = true;
  return true;
}

std::optional<std::string> GitSnapshot::track() {
  if (!ensure_initialized()) {
    return std::nullopt;
  }

  auto add = git({"add", "."});
  if (!add.ok()) {
    spdlog::warn("[Snapshot] git add failed: {}", *add.error);
    return std::nullopt;
  }

  auto tree = git({"write-tree"});
  if (!tree.ok()) {
    spdlog::warn("[Snapshot] git write-tree failed: {}", *tree.error);
    return std::nullopt;
  }

  auto hash = trim_end(*tree.value);
  spdlog::debug("[Snapshot] Tracked {}", hash);
  return hash;
}

Patch GitSnapshot::patch(const std::string &hash) {
  Patch result{hash, {}};
  if (!ensure_initialized()) {
    return result;
  }

  auto add = git({"add", "."});
  if (!add.ok()) {
    spdlog::warn("[Snapshot] git add failed: {}", *add.error);
    return result;
  }

  auto diff = git({"-c", "core.quotepath=false", "diff", "--no-ext-diff", "--name-only", hash, "--", "."});
  if (!diff.ok()) {
    spdlog::warn("[Snapshot] Failed to diff against {}: {}", hash, *diff.error);
    return result;
  }

  std::istringstream lines(*diff.value);
  std::string line;
  while (std::getline(lines, line)) {
    line = trim_end(line);
    if (line.empty()) continue;
    result.files.push_back((worktree_ / line).lexically_normal().string());
  }
  return result;
}

}  // namespace coderun
