#include "ms/orchestrator/program.h"

#include "ms/common.h"
#include "ms/error.h"
#include "ms/orchestrator/event_bus.h"
#include "ms/transfer/tree_mover.h"

#include <exception>
#include <utility>

namespace ms::orchestrator {
namespace {

std::vector<EventField> CountFields(const std::string& op, int created_dirs, int moved_files) {
  return {{"op", op}, NumericField("dirs_created", created_dirs),
          NumericField("files_moved", moved_files)};
}

} // namespace

Program::Program(fs::Filesystem& fs, Options options, Mode mode)
    : fs_(fs), options_(std::move(options)), mode_(mode) {}

void Program::ReportFailure(const std::string& what,
                            const std::string& detail,
                            const Summary& summary) const {
  auto fields = CountFields(options_.mode, summary.created_dirs, summary.moved_files);
  fields.emplace(fields.begin() + 1, "error", detail);
  fields.emplace(fields.begin() + 2, "error-type", "fatal");
  PublishEvent(EventSeverity::kError, "mode_failed", what, std::move(fields));
}

int Program::Finish(const Summary& summary) const {
  const auto fields = CountFields(options_.mode, summary.created_dirs, summary.moved_files);
  if (summary.partial_failures) {
    PublishEvent(EventSeverity::kWarning, "mode_completed",
                 "mode completed, but with partial failures; exiting...", fields);
    return kExitPartialFailure;
  }
  if (summary.unmoved_files) {
    PublishEvent(EventSeverity::kWarning, "mode_completed",
                 "mode completed, but with unmoved files; exiting...", fields);
    return kExitUnmovedFiles;
  }
  PublishEvent(EventSeverity::kInfo, "mode_completed", "mode completed; exiting...", fields);
  return kExitSuccess;
}

int Program::Run(const core::CancellationToken& token) {
  if (options_.dry_run) {
    PublishEvent(EventSeverity::kWarning, "dry_run", "running in dry mode - no changes will be made",
                 {{"op", options_.mode}});
  }

  Summary summary;
  const bool init = mode_ == Mode::kInit;
  const std::string failure_message =
      init ? "failed creating mirror structure" : "failed moving to target structure";

  PublishEvent(EventSeverity::kInfo, "mode_started",
               init ? "setting up the mirror structure..."
                    : "moving files from mirror to target structure...",
               {{"op", options_.mode}, {"mirror", PathToUtf8String(options_.mirror_root)},
                {"target", PathToUtf8String(options_.target_root)}});

  try {
    if (init) {
      mirror::MirrorOptions mirror_options;
      mirror_options.mirror_root = options_.mirror_root;
      mirror_options.target_root = options_.target_root;
      mirror_options.excludes = options_.excludes;
      mirror_options.init_depth = options_.init_depth;
      mirror_options.skip_failed = options_.skip_failed;
      mirror_options.slow_mode = options_.slow_mode;
      mirror_options.dry_run = options_.dry_run;

      mirror::MirrorBuilder builder(fs_, std::move(mirror_options), token);
      if (sleeper_) {
        builder.SetSleeper(sleeper_);
      }
      try {
        builder.Run();
      } catch (...) {
        summary.created_dirs = builder.Outcome().created_dirs;
        throw;
      }
      summary.partial_failures = builder.Outcome().has_partial_failures;
      summary.created_dirs = builder.Outcome().created_dirs;
    } else {
      transfer::MoveOptions move_options;
      move_options.mirror_root = options_.mirror_root;
      move_options.target_root = options_.target_root;
      move_options.excludes = options_.excludes;
      move_options.direct = options_.direct;
      move_options.verify = options_.verify;
      move_options.skip_failed = options_.skip_failed;
      move_options.dry_run = options_.dry_run;

      transfer::TreeMover mover(fs_, std::move(move_options), token);
      try {
        mover.Run();
      } catch (...) {
        summary.created_dirs = mover.Outcome().created_dirs;
        summary.moved_files = mover.Outcome().moved_files;
        throw;
      }
      summary.partial_failures = mover.Outcome().has_partial_failures;
      summary.unmoved_files = mover.Outcome().has_unmoved_files;
      summary.created_dirs = mover.Outcome().created_dirs;
      summary.moved_files = mover.Outcome().moved_files;
    }
  } catch (const CancelledError&) {
    return kExitFailure;
  } catch (const Error& err) {
    ReportFailure(failure_message, err.what(), summary);
    if (err.domain == ErrorDomain::State && err.code == errors::state::kMirrorNotEmpty) {
      return kExitMirrorNotEmpty;
    }
    return kExitFailure;
  } catch (const std::exception& unexpected) {
    PublishEvent(EventSeverity::kError, "internal_error", "internal error recovered",
                 {{"op", options_.mode}, {"error", unexpected.what()}, {"error-type", "fatal"}});
    return kExitFailure;
  }

  return Finish(summary);
}

} // namespace ms::orchestrator
