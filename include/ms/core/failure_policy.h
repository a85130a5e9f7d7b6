#pragma once

#include <string>

#include "ms/error.h"
#include "ms/fs/walk.h"

namespace ms::core {

// Decides what a per-entry error does to a running walk. Without skip_failed
// every error aborts the walk; with it the error is logged, remembered as a
// partial failure and the entry (or the whole subtree for a directory) is
// skipped. Cancellation always aborts.
class FailurePolicy {
public:
  FailurePolicy(bool skip_failed, std::string op);

  // Rethrows err unless it can be absorbed, in which case the returned action
  // tells the walker how to proceed.
  fs::WalkAction Absorb(const Error& err, bool is_directory);

  // Forgets absorbed failures so a walker can be run again.
  void Reset() noexcept { partial_failures_ = false; }

  [[nodiscard]] bool HasPartialFailures() const noexcept { return partial_failures_; }

private:
  bool skip_failed_;
  std::string op_;
  bool partial_failures_{false};
};

} // namespace ms::core
