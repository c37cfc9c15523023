#pragma once

#include <atomic>

namespace sceneseek {

// Cooperative cancellation flag shared between a transport and one loop run.
class CancellationToken {
 public:
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace sceneseek
