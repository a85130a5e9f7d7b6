#pragma once

#include <filesystem>
#include <vector>

#include "ms/core/cancellation.h"
#include "ms/core/failure_policy.h"
#include "ms/fs/filesystem.h"
#include "ms/fs/walk.h"
#include "ms/transfer/file_mover.h"

namespace ms::transfer {

struct MoveOptions {
  std::filesystem::path mirror_root;
  std::filesystem::path target_root;
  std::vector<std::filesystem::path> excludes;  // cleaned, absolute
  bool direct{false};
  bool verify{false};
  bool skip_failed{false};
  bool dry_run{false};
};

struct MoveOutcome {
  bool has_partial_failures{false};
  bool has_unmoved_files{false};  // a destination already existed
  int moved_files{0};
  int created_dirs{0};
};

// Walks the mirror tree and promotes every file into the same relative
// location under the target tree, creating missing directories on the way.
// Existing destination files are never overwritten.
class TreeMover {
public:
  TreeMover(fs::Filesystem& fs, MoveOptions options, const core::CancellationToken& token);

  // Throws on the first unabsorbed error or on cancellation; Outcome() still
  // reflects the work done up to that point.
  MoveOutcome Run();

  [[nodiscard]] const MoveOutcome& Outcome() const noexcept { return outcome_; }

  void SetTransferHooks(TransferHooks hooks) { hooks_ = std::move(hooks); }

private:
  void CheckPreconditions();
  fs::WalkAction Visit(const fs::WalkEntry& entry);
  fs::WalkAction VisitDirectory(const std::filesystem::path& destination);
  fs::WalkAction VisitFile(const std::filesystem::path& source,
                           const std::filesystem::path& destination);

  fs::Filesystem& fs_;
  MoveOptions options_;
  const core::CancellationToken& token_;
  core::FailurePolicy policy_;
  FileMover mover_;
  TransferHooks hooks_;
  MoveOutcome outcome_;
};

} // namespace ms::transfer
