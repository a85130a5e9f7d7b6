#include "ms/fs/memory_filesystem.h"
#include "ms/transfer/tree_mover.h"

#include "event_recorder.h"

#include <cassert>
#include <cerrno>
#include <span>
#include <string>
#include <utility>

namespace {

using ms::fs::MakeInjectedFault;
using ms::fs::MemoryFilesystem;
using ms::transfer::MoveOptions;
using ms::transfer::MoveOutcome;
using ms::transfer::TreeMover;

MoveOptions Defaults() {
  MoveOptions options;
  options.mirror_root = "/mirror";
  options.target_root = "/real";
  return options;
}

MoveOutcome RunMove(MemoryFilesystem& fs, MoveOptions options = Defaults()) {
  ms::core::CancellationToken token;
  TreeMover mover(fs, std::move(options), token);
  return mover.Run();
}

void TestMovesSingleFile() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "content");
  fs.MakeDirectories("/real");

  const auto outcome = RunMove(fs);
  assert(!outcome.has_partial_failures && !outcome.has_unmoved_files);
  assert(outcome.moved_files == 1);
  assert(fs.ReadFile("/real/file.txt") == std::string("content"));
  assert(!fs.Exists("/mirror/file.txt"));
  assert(fs.IsDirectory("/mirror"));
}

void TestCreatesMissingDirectories() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/a/b/file.txt", "nested");
  fs.MakeDirectories("/real");

  const auto outcome = RunMove(fs);
  assert(outcome.created_dirs == 2);
  assert(fs.IsDirectory("/real/a") && fs.IsDirectory("/real/a/b"));
  assert(fs.ReadFile("/real/a/b/file.txt") == std::string("nested"));
  assert(fs.IsDirectory("/mirror/a/b"));
  assert(recorder.Count("directory_created") == 2);
  assert(recorder.Count("file_moved", "mode", "c+r") == 1);
}

void TestExistingTargetIsNotOverwritten() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "new");
  fs.WriteFile("/real/file.txt", "old");

  const auto outcome = RunMove(fs);
  assert(outcome.has_unmoved_files);
  assert(!outcome.has_partial_failures);
  assert(outcome.moved_files == 0);
  assert(fs.ReadFile("/mirror/file.txt") == std::string("new"));
  assert(fs.ReadFile("/real/file.txt") == std::string("old"));
  assert(recorder.Count("target_exists") == 1);
}

void TestDestinationExclusion() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/secret.txt", "secret");
  fs.WriteFile("/mirror/public.txt", "public");
  fs.MakeDirectories("/real");

  auto options = Defaults();
  options.excludes = {"/real/secret.txt"};
  RunMove(fs, options);
  assert(fs.ReadFile("/mirror/secret.txt") == std::string("secret"));
  assert(!fs.Exists("/real/secret.txt"));
  assert(fs.Exists("/real/public.txt"));
  assert(recorder.Count("path_skipped", "reason", "is_user_excluded") == 1);
}

void TestSourceExclusionSkipsSubtree() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/private/a.txt", "a");
  fs.WriteFile("/mirror/private/deeper/b.txt", "b");
  fs.MakeDirectories("/real");

  auto options = Defaults();
  options.excludes = {"/mirror/private"};
  RunMove(fs, options);
  assert(!fs.Exists("/real/private"));
  assert(fs.Exists("/mirror/private/a.txt"));
  assert(fs.Exists("/mirror/private/deeper/b.txt"));
}

void TestSkipFailedRecordsPartialFailure() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/fail.txt", "fail");
  fs.WriteFile("/mirror/ok.txt", "ok");
  fs.MakeDirectories("/real");
  fs.Hooks().before_rename = [](const std::filesystem::path& from, const std::filesystem::path& to) {
    if (from.generic_string().find("fail.txt") != std::string::npos) {
      throw MakeInjectedFault(EIO, "rename", to);
    }
  };

  auto options = Defaults();
  options.skip_failed = true;
  const auto outcome = RunMove(fs, options);
  assert(outcome.has_partial_failures);
  assert(outcome.moved_files == 1);
  assert(fs.ReadFile("/real/ok.txt") == std::string("ok"));
  assert(fs.ReadFile("/mirror/fail.txt") == std::string("fail"));
  assert(!fs.Exists("/real/fail.txt"));
  assert(!fs.Exists("/real/fail.txt.mirsht"));
  assert(recorder.Count("path_skipped", "reason", "error_occurred") == 1);
}

void TestFailureAbortsWithoutSkipFailed() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/a.txt", "a");
  fs.WriteFile("/mirror/b.txt", "b");
  fs.MakeDirectories("/real");
  fs.Hooks().before_create = [](const std::filesystem::path& path) {
    if (path.filename() == "a.txt.mirsht") {
      throw MakeInjectedFault(ENOSPC, "open", path);
    }
  };

  ms::core::CancellationToken token;
  TreeMover mover(fs, Defaults(), token);
  bool threw = false;
  try {
    mover.Run();
  } catch (const ms::Error& err) {
    threw = true;
    assert(err.native_code == ENOSPC);
    assert(std::string(err.what()).find("failed to move: \"/mirror/a.txt\" -x-> \"/real/a.txt\"") == 0);
  }
  assert(threw);
  assert(fs.Exists("/mirror/a.txt"));
  assert(fs.Exists("/mirror/b.txt") && "walk stops at the first failure");
  assert(!fs.Exists("/real/b.txt"));
}

void TestCancelledBeforeStart() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "content");
  fs.WriteFile("/mirror/dir/other.txt", "other");
  fs.MakeDirectories("/real");

  ms::core::CancellationToken token;
  token.Cancel();
  auto options = Defaults();
  options.skip_failed = true;
  TreeMover mover(fs, options, token);
  bool cancelled = false;
  try {
    mover.Run();
  } catch (const ms::CancelledError&) {
    cancelled = true;
  }
  assert(cancelled);
  assert(!mover.Outcome().has_partial_failures);
  assert(fs.MutationCount() == 0);
  assert(fs.Exists("/mirror/file.txt") && fs.Exists("/mirror/dir/other.txt"));
}

void TestCancelledMidWalkIsNeverAbsorbed() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/a.txt", std::string(3 * ms::core::kCopyChunkSize, 'a'));
  fs.WriteFile("/mirror/b.txt", "b");
  fs.MakeDirectories("/real");

  ms::core::CancellationToken token;
  auto options = Defaults();
  options.skip_failed = true;
  TreeMover mover(fs, options, token);
  ms::transfer::TransferHooks hooks;
  hooks.after_read = [&](std::span<uint8_t>) { token.Cancel(); };
  mover.SetTransferHooks(hooks);
  bool cancelled = false;
  try {
    mover.Run();
  } catch (const ms::CancelledError&) {
    cancelled = true;
  }
  assert(cancelled);
  assert(!mover.Outcome().has_partial_failures);
  assert(fs.Exists("/mirror/a.txt") && fs.Exists("/mirror/b.txt"));
  assert(!fs.Exists("/real/a.txt") && !fs.Exists("/real/a.txt.mirsht"));
}

void TestMirrorNestedInsideTarget() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/real/incoming/docs/report.txt", "report");
  fs.WriteFile("/real/incoming/incoming/loop.txt", "loop");
  fs.MakeDirectories("/real/docs");

  MoveOptions options;
  options.mirror_root = "/real/incoming";
  options.target_root = "/real";
  const auto outcome = RunMove(fs, options);
  assert(outcome.moved_files == 1);
  assert(fs.ReadFile("/real/docs/report.txt") == std::string("report"));
  assert(fs.Exists("/real/incoming/incoming/loop.txt"));
  assert(!fs.Exists("/real/incoming/loop.txt"));
  assert(recorder.Count("path_skipped", "reason", "mirror_into_mirror") == 1);
}

void TestDryRunTouchesNothing() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/new/file.txt", "content");
  fs.WriteFile("/mirror/clash.txt", "new");
  fs.WriteFile("/real/clash.txt", "old");
  const auto mutations = fs.MutationCount();

  auto options = Defaults();
  options.dry_run = true;
  options.direct = true;
  options.verify = true;
  const auto outcome = RunMove(fs, options);
  assert(fs.MutationCount() == mutations);
  assert(outcome.has_unmoved_files);
  assert(outcome.moved_files == 0 && outcome.created_dirs == 0);
  assert(!fs.Exists("/real/new"));
  assert(recorder.Count("directory_created", "dry-run", "true") == 1);
  assert(recorder.Count("file_moved", "dry-run", "true") == 1);
  assert(recorder.Count("target_exists") == 1);
}

void TestRerunAfterInterruptedCommit() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "content");
  fs.WriteFile("/real/file.txt", "content");
  fs.WriteFile("/real/other.txt.mirsht", "partial");
  fs.WriteFile("/mirror/other.txt", "other");

  const auto outcome = RunMove(fs);
  assert(outcome.has_unmoved_files);
  assert(fs.ReadFile("/mirror/file.txt") == std::string("content"));
  assert(fs.ReadFile("/real/other.txt") == std::string("other"));
  assert(!fs.Exists("/real/other.txt.mirsht"));
}

void TestDirectoryErrorSkipsSubtree() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/locked/inner.txt", "inner");
  fs.WriteFile("/mirror/open.txt", "open");
  fs.MakeDirectories("/real");
  fs.Hooks().before_mkdir = [](const std::filesystem::path& path) {
    if (path == "/real/locked") {
      throw MakeInjectedFault(EACCES, "create", path);
    }
  };

  auto options = Defaults();
  options.skip_failed = true;
  const auto outcome = RunMove(fs, options);
  assert(outcome.has_partial_failures);
  assert(fs.Exists("/mirror/locked/inner.txt"));
  assert(fs.Exists("/real/open.txt"));
}

void TestVanishedEntryIsNotAFailure() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/ghost.txt", "boo");
  fs.WriteFile("/mirror/real.txt", "here");
  fs.MakeDirectories("/real");
  fs.Hooks().before_stat = [](const std::filesystem::path& path) {
    if (path == "/mirror/ghost.txt") {
      throw MakeInjectedFault(ENOENT, "stat", path);
    }
  };

  const auto outcome = RunMove(fs);
  assert(!outcome.has_partial_failures);
  assert(fs.Exists("/real/real.txt"));
  assert(recorder.Count("path_skipped", "reason", "no_longer_exists") == 1);
}

void TestRerunStartsWithCleanOutcome() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "content");
  fs.MakeDirectories("/real");
  fs.Hooks().before_create = [](const std::filesystem::path& path) {
    throw MakeInjectedFault(EIO, "open", path);
  };

  auto options = Defaults();
  options.skip_failed = true;
  ms::core::CancellationToken token;
  TreeMover mover(fs, options, token);

  const auto first = mover.Run();
  assert(first.has_partial_failures);
  assert(first.moved_files == 0);
  assert(fs.Exists("/mirror/file.txt"));

  fs.Hooks().before_create = nullptr;
  const auto second = mover.Run();
  assert(!second.has_partial_failures);
  assert(!second.has_unmoved_files);
  assert(second.moved_files == 1);
  assert(fs.ReadFile("/real/file.txt") == std::string("content"));
}

void TestMissingRoots() {
  MemoryFilesystem fs;
  fs.MakeDirectories("/real");
  ms::core::CancellationToken token;
  bool threw = false;
  try {
    TreeMover(fs, Defaults(), token).Run();
  } catch (const ms::Error& err) {
    threw = err.code == ms::errors::io::kMirrorMissing;
  }
  assert(threw);

  MemoryFilesystem other;
  other.MakeDirectories("/mirror");
  threw = false;
  try {
    TreeMover(other, Defaults(), token).Run();
  } catch (const ms::Error& err) {
    threw = err.code == ms::errors::io::kTargetMissing;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestMovesSingleFile();
  TestCreatesMissingDirectories();
  TestExistingTargetIsNotOverwritten();
  TestDestinationExclusion();
  TestSourceExclusionSkipsSubtree();
  TestSkipFailedRecordsPartialFailure();
  TestFailureAbortsWithoutSkipFailed();
  TestCancelledBeforeStart();
  TestCancelledMidWalkIsNeverAbsorbed();
  TestMirrorNestedInsideTarget();
  TestDryRunTouchesNothing();
  TestRerunAfterInterruptedCommit();
  TestDirectoryErrorSkipsSubtree();
  TestVanishedEntryIsNotAFailure();
  TestMissingRoots();
  TestRerunStartsWithCleanOutcome();
  return 0;
}
