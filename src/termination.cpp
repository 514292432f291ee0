#include "termination.h"

#include "cancellation.h"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <tuple>

namespace {

std::atomic<hoist::cancellation *> s_token{ nullptr };
volatile std::sig_atomic_t s_signal{ 0 };

void signal_handler(int sig) {
  if (s_signal != 0) { _exit(128 + sig); }
  s_signal = sig;

  if (auto *token{ s_token.load() }) {
    token->cancel();
    constexpr char kMsg[]{ "\nhoist: cancelling, press Ctrl-C again to abort\n" };
    std::ignore = write(STDERR_FILENO, kMsg, sizeof kMsg - 1);
  } else {
    _exit(128 + sig);
  }
}

}  // namespace

namespace hoist {

void termination_handler_install(cancellation *token) {
  s_token.store(token);

  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

int termination_signal_received() { return static_cast<int>(s_signal); }

}  // namespace hoist
