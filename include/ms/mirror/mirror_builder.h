#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <vector>

#include "ms/core/cancellation.h"
#include "ms/core/failure_policy.h"
#include "ms/fs/filesystem.h"
#include "ms/fs/walk.h"

namespace ms::mirror {

// Slow mode pauses after this many created directories.
inline constexpr int kDirCreationBatch = 50;
inline constexpr std::chrono::milliseconds kDirCreationPause{1000};

struct MirrorOptions {
  std::filesystem::path mirror_root;
  std::filesystem::path target_root;
  std::vector<std::filesystem::path> excludes;
  int init_depth{-1};  // negative: unlimited, 0: direct children of the target only
  bool skip_failed{false};
  bool slow_mode{false};
  bool dry_run{false};
};

struct MirrorOutcome {
  bool has_partial_failures{false};
  int created_dirs{0};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// True when no non-directory exists anywhere below root. With report_files
// every file found is logged and the walk continues; otherwise it stops at
// the first one. Any walk error is fatal.
bool IsEmptyStructure(fs::Filesystem& fs,
                      const std::filesystem::path& root,
                      const core::CancellationToken& token,
                      bool report_files);

// Recreates the directory structure of the target tree inside the mirror
// tree. An existing mirror is only replaced when it holds no files.
class MirrorBuilder {
public:
  MirrorBuilder(fs::Filesystem& fs, MirrorOptions options, const core::CancellationToken& token);

  MirrorOutcome Run();

  [[nodiscard]] const MirrorOutcome& Outcome() const noexcept { return outcome_; }

  void SetSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
  void CheckPreconditions();
  void ResetMirrorRoot();
  fs::WalkAction Visit(const fs::WalkEntry& entry);

  fs::Filesystem& fs_;
  MirrorOptions options_;
  const core::CancellationToken& token_;
  core::FailurePolicy policy_;
  Sleeper sleeper_;
  MirrorOutcome outcome_;
  int batch_{0};
};

} // namespace ms::mirror
