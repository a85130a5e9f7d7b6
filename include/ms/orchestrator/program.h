#pragma once

#include "ms/core/cancellation.h"
#include "ms/fs/filesystem.h"
#include "ms/mirror/mirror_builder.h"
#include "ms/orchestrator/config.h"

namespace ms::orchestrator {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitPartialFailure = 2;   // --skip-failed absorbed at least one error
constexpr int kExitMirrorNotEmpty = 3;   // init: mirror still holds files
constexpr int kExitUnmovedFiles = 4;     // move: conflicting target files left in place
constexpr int kExitConfigFailure = 5;

// Runs one validated mode against a filesystem and maps the outcome to an
// exit status. Every failure is reported on the event bus.
class Program {
public:
  Program(fs::Filesystem& fs, Options options, Mode mode);

  int Run(const core::CancellationToken& token);

  void SetSleeper(mirror::Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
  struct Summary {
    bool partial_failures{false};
    bool unmoved_files{false};
    int created_dirs{0};
    int moved_files{0};
  };

  int Finish(const Summary& summary) const;
  void ReportFailure(const std::string& what, const std::string& detail, const Summary& summary) const;

  fs::Filesystem& fs_;
  Options options_;
  Mode mode_;
  mirror::Sleeper sleeper_;
};

} // namespace ms::orchestrator
