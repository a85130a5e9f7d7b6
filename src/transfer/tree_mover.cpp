#include "ms/transfer/tree_mover.h"

#include "ms/common.h"
#include "ms/core/exclusion.h"
#include "ms/errors.h"
#include "ms/orchestrator/event_bus.h"

#include <optional>
#include <utility>

namespace ms::transfer {
namespace {

using orchestrator::BoolField;
using orchestrator::EventSeverity;
using orchestrator::PublishEvent;

constexpr const char* kOp = "move";

void PublishSkipped(const std::filesystem::path& path, const char* reason) {
  PublishEvent(EventSeverity::kWarning, "path_skipped", "path skipped",
               {{"op", kOp}, {"path", PathToUtf8String(path)}, {"reason", reason}});
}

void RequireRoot(fs::Filesystem& fs, const std::filesystem::path& root, int code,
                 std::string_view missing_message) {
  std::optional<fs::FileInfo> info;
  try {
    info = fs::StatIfExists(fs, root);
  } catch (const Error& stat_error) {
    RethrowWithContext(stat_error, "failed to stat: " + QuotePath(root));
  }
  if (!info) {
    throw Error{ErrorDomain::IO, code, std::string(missing_message) + ": " + QuotePath(root), ENOENT};
  }
}

} // namespace

TreeMover::TreeMover(fs::Filesystem& fs, MoveOptions options, const core::CancellationToken& token)
    : fs_(fs),
      options_(std::move(options)),
      token_(token),
      policy_(options_.skip_failed, kOp),
      mover_(fs, TransferOptions{options_.direct, options_.verify}, token, kOp) {}

void TreeMover::CheckPreconditions() {
  RequireRoot(fs_, options_.mirror_root, errors::io::kMirrorMissing, errors::msg::kMirrorNotExist);
  RequireRoot(fs_, options_.target_root, errors::io::kTargetMissing, errors::msg::kTargetNotExist);
}

MoveOutcome TreeMover::Run() {
  outcome_ = MoveOutcome{};
  policy_.Reset();
  CheckPreconditions();
  fs::Walk(fs_, options_.mirror_root, [this](const fs::WalkEntry& entry) { return Visit(entry); });
  outcome_.has_partial_failures = policy_.HasPartialFailures();
  return outcome_;
}

fs::WalkAction TreeMover::Visit(const fs::WalkEntry& entry) {
  token_.ThrowIfCancelled("failed checking context");
  outcome_.has_partial_failures = policy_.HasPartialFailures();

  if (entry.error) {
    if (IsNotFound(*entry.error)) {
      PublishSkipped(entry.path, "no_longer_exists");
      return fs::WalkAction::kContinue;
    }
    return policy_.Absorb(WithContext(*entry.error, "failed to walk: " + QuotePath(entry.path)),
                          entry.IsDirectory());
  }

  const bool is_directory = entry.IsDirectory();
  if (core::IsExcluded(entry.path, options_.excludes)) {
    PublishSkipped(entry.path, "is_user_excluded");
    return is_directory ? fs::WalkAction::kSkipSubtree : fs::WalkAction::kContinue;
  }

  const auto rel = entry.path.lexically_relative(options_.mirror_root);
  const auto destination = core::JoinClean(options_.target_root, rel);

  if (destination == options_.mirror_root) {
    PublishSkipped(destination, "mirror_into_mirror");
    return fs::WalkAction::kSkipSubtree;
  }

  if (core::IsExcluded(destination, options_.excludes)) {
    PublishSkipped(destination, "is_user_excluded");
    return is_directory ? fs::WalkAction::kSkipSubtree : fs::WalkAction::kContinue;
  }

  if (is_directory) {
    return VisitDirectory(destination);
  }
  return VisitFile(entry.path, destination);
}

fs::WalkAction TreeMover::VisitDirectory(const std::filesystem::path& destination) {
  std::optional<fs::FileInfo> existing;
  try {
    existing = fs::StatIfExists(fs_, destination);
  } catch (const Error& stat_error) {
    return policy_.Absorb(WithContext(stat_error, "failed to stat: " + QuotePath(destination)), true);
  }
  if (existing) {
    return fs::WalkAction::kContinue;
  }

  if (!options_.dry_run) {
    try {
      fs_.Mkdir(destination);
    } catch (const Error& mkdir_error) {
      return policy_.Absorb(WithContext(mkdir_error, "failed to create: " + QuotePath(destination)),
                            true);
    }
    ++outcome_.created_dirs;
  }
  PublishEvent(EventSeverity::kInfo, "directory_created", "directory created",
               {{"op", kOp}, {"path", PathToUtf8String(destination)},
                BoolField("dry-run", options_.dry_run)});
  return fs::WalkAction::kContinue;
}

fs::WalkAction TreeMover::VisitFile(const std::filesystem::path& source,
                                    const std::filesystem::path& destination) {
  std::optional<fs::FileInfo> existing;
  try {
    existing = fs::StatIfExists(fs_, destination);
  } catch (const Error& stat_error) {
    return policy_.Absorb(WithContext(stat_error, "failed to stat: " + QuotePath(destination)), false);
  }
  if (existing) {
    outcome_.has_unmoved_files = true;
    PublishEvent(EventSeverity::kWarning, "target_exists", "target already exists",
                 {{"op", kOp}, {"src", PathToUtf8String(source)},
                  {"dst", PathToUtf8String(destination)}, {"action", "skipped"}});
    return fs::WalkAction::kContinue;
  }

  if (options_.dry_run) {
    PublishEvent(EventSeverity::kInfo, "file_moved", "file moved",
                 {{"op", kOp}, {"mode", ""}, {"src", PathToUtf8String(source)},
                  {"dst", PathToUtf8String(destination)}, BoolField("dry-run", true)});
    return fs::WalkAction::kContinue;
  }

  TransferResult result;
  try {
    result = mover_.Move(source, destination, hooks_);
  } catch (const Error& move_error) {
    return policy_.Absorb(WithContext(move_error, "failed to move: " + QuotePath(source) + " -x-> " +
                                                      QuotePath(destination)),
                          false);
  }
  ++outcome_.moved_files;

  std::vector<orchestrator::EventField> fields{{"op", kOp},
                                               {"mode", TransferMethodName(result.method)},
                                               {"src", PathToUtf8String(source)},
                                               {"dst", PathToUtf8String(destination)}};
  if (result.method == TransferMethod::kCopyAndRemove) {
    fields.emplace_back("srcHash", result.source_digest);
    fields.emplace_back("dstHash", result.written_digest);
    fields.emplace_back("verifyHash", result.verify_digest);
    fields.push_back(BoolField("verify", options_.verify));
  }
  fields.push_back(BoolField("dry-run", false));
  PublishEvent(EventSeverity::kInfo, "file_moved", "file moved", std::move(fields));
  return fs::WalkAction::kContinue;
}

} // namespace ms::transfer
