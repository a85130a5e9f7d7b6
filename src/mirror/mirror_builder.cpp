#include "ms/mirror/mirror_builder.h"

#include "ms/common.h"
#include "ms/core/exclusion.h"
#include "ms/errors.h"
#include "ms/orchestrator/event_bus.h"

#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace ms::mirror {
namespace {

using orchestrator::BoolField;
using orchestrator::EventSeverity;
using orchestrator::NumericField;
using orchestrator::PublishEvent;

constexpr const char* kOp = "init";

void PublishSkipped(EventSeverity severity, const std::filesystem::path& path, const char* reason) {
  PublishEvent(severity, "path_skipped", "path skipped",
               {{"op", kOp}, {"path", PathToUtf8String(path)}, {"reason", reason}});
}

std::optional<fs::FileInfo> StatOrThrow(fs::Filesystem& fs, const std::filesystem::path& path) {
  try {
    return fs::StatIfExists(fs, path);
  } catch (const Error& stat_error) {
    RethrowWithContext(stat_error, "failed to stat: " + QuotePath(path));
  }
}

} // namespace

bool IsEmptyStructure(fs::Filesystem& fs,
                      const std::filesystem::path& root,
                      const core::CancellationToken& token,
                      bool report_files) {
  bool empty = true;
  fs::Walk(fs, core::CleanPath(root.generic_string()), [&](const fs::WalkEntry& entry) {
    token.ThrowIfCancelled("failed checking context");
    if (entry.error) {
      throw WithContext(*entry.error, "failed to walk: " + QuotePath(entry.path));
    }
    if (entry.IsDirectory()) {
      return fs::WalkAction::kContinue;
    }
    empty = false;
    if (!report_files) {
      return fs::WalkAction::kStop;
    }
    PublishEvent(EventSeverity::kWarning, "unmoved_file_found", "unmoved file found",
                 {{"op", kOp}, {"path", PathToUtf8String(entry.path)}});
    return fs::WalkAction::kContinue;
  });
  return empty;
}

MirrorBuilder::MirrorBuilder(fs::Filesystem& fs,
                             MirrorOptions options,
                             const core::CancellationToken& token)
    : fs_(fs),
      options_(std::move(options)),
      token_(token),
      policy_(options_.skip_failed, kOp),
      sleeper_([](std::chrono::milliseconds pause) { std::this_thread::sleep_for(pause); }) {}

void MirrorBuilder::CheckPreconditions() {
  if (!StatOrThrow(fs_, options_.target_root)) {
    throw Error{ErrorDomain::IO, errors::io::kTargetMissing,
                std::string(errors::msg::kTargetNotExist) + ": " + QuotePath(options_.target_root),
                ENOENT};
  }

  const auto parent = options_.mirror_root.parent_path();
  const auto parent_info = StatOrThrow(fs_, parent);
  if (!parent_info) {
    throw Error{ErrorDomain::IO, errors::io::kMirrorParentMissing,
                std::string(errors::msg::kMirrorParentNotExist) + ": " + QuotePath(parent), ENOENT};
  }
  if (!parent_info->is_directory) {
    throw Error{ErrorDomain::IO, errors::io::kMirrorParentNotDirectory,
                std::string(errors::msg::kMirrorParentNotDir) + ": " + QuotePath(parent), ENOTDIR};
  }
}

void MirrorBuilder::ResetMirrorRoot() {
  const auto& mirror = options_.mirror_root;
  if (StatOrThrow(fs_, mirror)) {
    PublishEvent(EventSeverity::kInfo, "mirror_emptiness_check",
                 "testing if the existing mirror structure is empty...", {{"op", kOp}});
    bool empty = false;
    try {
      empty = IsEmptyStructure(fs_, mirror, token_, true);
    } catch (const Error& walk_error) {
      RethrowWithContext(walk_error, "failed checking for emptiness: " + QuotePath(mirror));
    }
    if (!empty) {
      throw Error{ErrorDomain::State, errors::state::kMirrorNotEmpty,
                  std::string(errors::msg::kMirrorNotEmpty)};
    }
    if (!options_.dry_run) {
      try {
        fs_.RemoveAll(mirror);
      } catch (const Error& remove_error) {
        RethrowWithContext(remove_error, "failed to remove: " + QuotePath(mirror));
      }
    }
    PublishEvent(EventSeverity::kInfo, "mirror_removed", "mirror directory removed",
                 {{"op", kOp}, {"path", PathToUtf8String(mirror)},
                  BoolField("dry-run", options_.dry_run)});
  }

  if (!options_.dry_run) {
    try {
      fs_.Mkdir(mirror);
    } catch (const Error& mkdir_error) {
      RethrowWithContext(mkdir_error, "failed to create: " + QuotePath(mirror));
    }
    ++outcome_.created_dirs;
  }
  PublishEvent(EventSeverity::kInfo, "mirror_created", "mirror directory created",
               {{"op", kOp}, {"path", PathToUtf8String(mirror)},
                BoolField("dry-run", options_.dry_run)});
}

MirrorOutcome MirrorBuilder::Run() {
  outcome_ = MirrorOutcome{};
  policy_.Reset();
  batch_ = 0;
  CheckPreconditions();
  ResetMirrorRoot();
  fs::Walk(fs_, options_.target_root, [this](const fs::WalkEntry& entry) { return Visit(entry); });
  outcome_.has_partial_failures = policy_.HasPartialFailures();
  return outcome_;
}

fs::WalkAction MirrorBuilder::Visit(const fs::WalkEntry& entry) {
  token_.ThrowIfCancelled("failed checking context");

  if (entry.error) {
    if (IsNotFound(*entry.error)) {
      PublishSkipped(EventSeverity::kWarning, entry.path, "no_longer_exists");
      return fs::WalkAction::kContinue;
    }
    const auto action =
        policy_.Absorb(WithContext(*entry.error, "failed to walk: " + QuotePath(entry.path)),
                       entry.IsDirectory());
    outcome_.has_partial_failures = policy_.HasPartialFailures();
    return action;
  }

  if (!entry.IsDirectory()) {
    return fs::WalkAction::kContinue;
  }

  if (entry.path == options_.mirror_root) {
    PublishSkipped(EventSeverity::kWarning, entry.path, "is_mirror_root");
    return fs::WalkAction::kSkipSubtree;
  }

  if (core::IsExcluded(entry.path, options_.excludes)) {
    PublishSkipped(EventSeverity::kWarning, entry.path, "is_user_excluded");
    return fs::WalkAction::kSkipSubtree;
  }

  const auto rel = entry.path.lexically_relative(options_.target_root);
  const auto mirror_path = core::JoinClean(options_.mirror_root, rel);

  if (options_.init_depth >= 0) {
    const int depth = core::DirectoryDepth(rel);
    if (depth > options_.init_depth) {
      PublishEvent(EventSeverity::kDebug, "path_skipped", "path skipped",
                   {{"op", kOp}, {"path", PathToUtf8String(entry.path)},
                    NumericField("dir_depth", depth), {"reason", "exceeds_init_depth"}});
      return fs::WalkAction::kSkipSubtree;
    }
  }

  if (mirror_path == options_.mirror_root) {
    return fs::WalkAction::kContinue;  // created by ResetMirrorRoot
  }

  if (!options_.dry_run) {
    try {
      fs_.Mkdir(mirror_path);
    } catch (const Error& mkdir_error) {
      const auto action =
          policy_.Absorb(WithContext(mkdir_error, "failed to create: " + QuotePath(mirror_path)), true);
      outcome_.has_partial_failures = policy_.HasPartialFailures();
      return action;
    }
    ++outcome_.created_dirs;
    ++batch_;
    if (options_.slow_mode && batch_ >= kDirCreationBatch) {
      sleeper_(kDirCreationPause);
      batch_ = 0;
    }
  }

  std::vector<orchestrator::EventField> fields{{"op", kOp}, {"path", PathToUtf8String(mirror_path)},
                                               BoolField("slow-mode", options_.slow_mode)};
  if (options_.slow_mode && !options_.dry_run) {
    fields.emplace_back("slow-batch",
                        std::to_string(batch_) + "/" + std::to_string(kDirCreationBatch));
  }
  fields.push_back(BoolField("dry-run", options_.dry_run));
  PublishEvent(EventSeverity::kInfo, "directory_created", "directory created", std::move(fields));
  return fs::WalkAction::kContinue;
}

} // namespace ms::mirror
