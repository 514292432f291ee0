#include "cancellation.h"

#include <algorithm>
#include <thread>

namespace hoist {

namespace {
constexpr std::chrono::milliseconds kSleepSlice{ 25 };
}

bool cancellation::sleep_for(std::chrono::milliseconds duration) const {
  auto const deadline{ std::chrono::steady_clock::now() + duration };
  while (!requested()) {
    auto const now{ std::chrono::steady_clock::now() };
    if (now >= deadline) { return true; }
    auto const remaining{ std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                                now) };
    std::this_thread::sleep_for(std::min(remaining, kSleepSlice));
  }
  return false;
}

}  // namespace hoist
