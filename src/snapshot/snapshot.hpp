#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace coderun {

// Files changed since a tracked snapshot
struct Patch {
  std::string hash;
  std::vector<std::string> files;
};

// Working tree checkpoints
class Snapshot {
 public:
  virtual ~Snapshot() = default;

  // Record the current tree; nullopt when tracking is unavailable
  virtual std::optional<std::string> track() = 0;

  // Absolute paths of files changed since hash
  virtual Patch patch(const std::string &hash) = 0;
};

// Snapshots kept in a private git directory so the user's repository is
// never touched: git --git-dir <git_dir> --work-tree <worktree> ...
class GitSnapshot : public Snapshot {
 public:
  GitSnapshot(std::filesystem::path worktree, std::filesystem::path git_dir);

  // Default git dir: <data_dir>/snapshot/<project id>
  static std::filesystem::path default_git_dir(const std::filesystem::path &worktree);

  std::optional<std::string> track() override;
  Patch patch(const std::string &hash) override;

 private:
  Result<std::string> git(const std::vector<std::string> &args);
  bool ensure_initialized();

  std::filesystem::path worktree_;
  std::filesystem::path git_dir_;
  bool initialized_ = false;
};

// Run a program with arguments in cwd; stdout and stderr are captured
// together. Fails on spawn errors and non-zero exit codes.
Result<std::string> run_process(const std::vector<std::string> &argv, const std::filesystem::path &cwd);

}  // namespace coderun
