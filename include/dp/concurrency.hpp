#pragma once

#include <atomic>

namespace dp {

// Simple cancellation handle; cancel() is async-signal-safe.
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Route SIGINT/SIGTERM to cancel->cancel(). Installed without SA_RESTART so a
// blocking poll() returns EINTR and the probe loop gets to observe the flag.
// Passing nullptr restores the default dispositions. Returns false if
// sigaction() failed.
bool install_interrupt_handler(Cancellation* cancel);

// Sleep for up to ms milliseconds, returning early once cancel is set.
// Returns false when the sleep was cut short by cancellation.
bool sleep_for_cancelable(int ms, const Cancellation* cancel);

} // namespace dp
