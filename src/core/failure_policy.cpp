#include "ms/core/failure_policy.h"

#include "ms/orchestrator/event_bus.h"

#include <utility>

namespace ms::core {

FailurePolicy::FailurePolicy(bool skip_failed, std::string op)
    : skip_failed_(skip_failed), op_(std::move(op)) {}

fs::WalkAction FailurePolicy::Absorb(const Error& err, bool is_directory) {
  if (err.domain == ErrorDomain::Cancelled) {
    throw CancelledError(err.what());
  }
  if (!skip_failed_) {
    throw err;
  }

  partial_failures_ = true;
  orchestrator::PublishEvent(orchestrator::EventSeverity::kError, "path_skipped", "path skipped",
                             {{"op", op_},
                              {"error", err.what()},
                              {"error-type", "runtime"},
                              {"reason", "error_occurred"}});

  return is_directory ? fs::WalkAction::kSkipSubtree : fs::WalkAction::kContinue;
}

} // namespace ms::core
