#pragma once

#include <atomic>
#include <string>

#include "ms/error.h"
#include "ms/errors.h"

namespace ms::core {

// Cooperative, one-way cancellation flag shared between the signal handling
// thread and the worker. Once cancelled it stays cancelled.
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Throws CancelledError naming the checkpoint when cancelled.
  void ThrowIfCancelled(const std::string& where) const {
    if (IsCancelled()) {
      throw CancelledError(where + " (" + std::string(errors::msg::kOperationCancelled) + ")");
    }
  }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace ms::core
