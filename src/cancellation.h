#pragma once

#include "util.h"

#include <atomic>
#include <chrono>

namespace hoist {

// Run-wide abort flag shared by every in-flight build and push. cancel() is
// async-signal-safe so the termination handler may call it.
class cancellation : unmovable {
 public:
  void cancel() noexcept { requested_.store(true, std::memory_order_release); }
  bool requested() const noexcept { return requested_.load(std::memory_order_acquire); }

  // Sleep for `duration` in short slices; returns false if cancelled first.
  bool sleep_for(std::chrono::milliseconds duration) const;

 private:
  std::atomic_bool requested_{ false };
  static_assert(std::atomic_bool::is_always_lock_free);
};

// Deadline and abort flag for one external call (process or HTTP request)
struct call_limits {
  std::chrono::steady_clock::time_point deadline;
  cancellation const *cancel{ nullptr };

  bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
  bool cancelled() const { return cancel && cancel->requested(); }
};

}  // namespace hoist
