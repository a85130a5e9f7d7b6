#include "ms/fs/memory_filesystem.h"
#include "ms/orchestrator/program.h"

#include "event_recorder.h"

#include <cassert>
#include <cerrno>
#include <string>
#include <utility>

namespace {

using ms::fs::MakeInjectedFault;
using ms::fs::MemoryFilesystem;
using ms::orchestrator::Mode;
using ms::orchestrator::Options;
using ms::orchestrator::Program;

Options MoveOptions() {
  Options options;
  options.mode = "move";
  options.mirror_root = "/mirror";
  options.target_root = "/real";
  options.log_level = "info";
  return options;
}

int RunProgram(MemoryFilesystem& fs, Options options, Mode mode, bool cancelled = false) {
  ms::core::CancellationToken token;
  if (cancelled) {
    token.Cancel();
  }
  Program program(fs, std::move(options), mode);
  program.SetSleeper([](std::chrono::milliseconds) {});
  return program.Run(token);
}

void FailRenamesOf(MemoryFilesystem& fs, const std::string& needle) {
  fs.Hooks().before_rename = [needle](const std::filesystem::path& from,
                                      const std::filesystem::path& to) {
    if (from.generic_string().find(needle) != std::string::npos) {
      throw MakeInjectedFault(EIO, "rename", to);
    }
  };
}

void TestMoveSucceeds() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "content");
  fs.MakeDirectories("/real");

  assert(RunProgram(fs, MoveOptions(), Mode::kMove) == ms::orchestrator::kExitSuccess);
  assert(fs.ReadFile("/real/file.txt") == std::string("content"));
  assert(recorder.Count("mode_started") == 1);
  assert(recorder.Count("mode_completed", "files_moved", "1") == 1);
  assert(recorder.Count("mode_failed") == 0);
}

void TestUnmovedFilesStatus() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "new");
  fs.WriteFile("/real/file.txt", "old");
  assert(RunProgram(fs, MoveOptions(), Mode::kMove) == ms::orchestrator::kExitUnmovedFiles);
}

void TestPartialFailureStatus() {
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/fail.txt", "fail");
  fs.WriteFile("/mirror/ok.txt", "ok");
  fs.WriteFile("/mirror/clash.txt", "new");
  fs.WriteFile("/real/clash.txt", "old");
  FailRenamesOf(fs, "fail.txt");

  auto options = MoveOptions();
  options.skip_failed = true;
  assert(RunProgram(fs, options, Mode::kMove) == ms::orchestrator::kExitPartialFailure);
  assert(fs.Exists("/real/ok.txt"));
  assert(fs.Exists("/mirror/fail.txt"));
}

void TestFatalFailureStatus() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/fail.txt", "fail");
  fs.MakeDirectories("/real");
  FailRenamesOf(fs, "fail.txt");

  assert(RunProgram(fs, MoveOptions(), Mode::kMove) == ms::orchestrator::kExitFailure);
  assert(recorder.Count("mode_failed", "error-type", "fatal") == 1);

  MemoryFilesystem missing;
  missing.MakeDirectories("/real");
  assert(RunProgram(missing, MoveOptions(), Mode::kMove) == ms::orchestrator::kExitFailure);
}

void TestCancellationStatus() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "content");
  fs.MakeDirectories("/real");

  assert(RunProgram(fs, MoveOptions(), Mode::kMove, true) == ms::orchestrator::kExitFailure);
  assert(fs.Exists("/mirror/file.txt"));
  assert(!fs.Exists("/real/file.txt"));
  assert(recorder.Count("mode_failed") == 0);
}

void TestInitStatuses() {
  auto options = MoveOptions();
  options.mode = "init";

  MemoryFilesystem fs;
  fs.MakeDirectories("/real/a/b");
  assert(RunProgram(fs, options, Mode::kInit) == ms::orchestrator::kExitSuccess);
  assert(fs.IsDirectory("/mirror/a/b"));

  fs.WriteFile("/mirror/a/pending.txt", "x");
  assert(RunProgram(fs, options, Mode::kInit) == ms::orchestrator::kExitMirrorNotEmpty);
  assert(fs.Exists("/mirror/a/pending.txt"));
}

void TestDryRunBanner() {
  ms::testing::EventRecorder recorder;
  MemoryFilesystem fs;
  fs.WriteFile("/mirror/file.txt", "content");
  fs.MakeDirectories("/real");

  auto options = MoveOptions();
  options.dry_run = true;
  assert(RunProgram(fs, options, Mode::kMove) == ms::orchestrator::kExitSuccess);
  assert(recorder.Count("dry_run") == 1);
  assert(fs.Exists("/mirror/file.txt"));
  assert(!fs.Exists("/real/file.txt"));
}

}  // namespace

int main() {
  TestMoveSucceeds();
  TestUnmovedFilesStatus();
  TestPartialFailureStatus();
  TestFatalFailureStatus();
  TestCancellationStatus();
  TestInitStatuses();
  TestDryRunBanner();
  return 0;
}
