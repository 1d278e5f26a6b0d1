#pragma once

#include <atomic>

namespace f0rge {

// set from another thread or a signal handler; polled at loop boundaries and while a child runs
class cancellation_token {
public:
  void request() noexcept { requested_.store(true, std::memory_order_relaxed); }
  bool requested() const noexcept { return requested_.load(std::memory_order_relaxed); }
  void reset() noexcept { requested_.store(false, std::memory_order_relaxed); }

private:
  std::atomic<bool> requested_{false};
};

} // namespace f0rge
