#include "termination.h"

#include <unistd.h>

#include <csignal>
#include <tuple>

namespace {

std::atomic_bool s_cancel_requested{ false };

static_assert(std::atomic_bool::is_always_lock_free);

void signal_handler(int sig) {
  if (s_cancel_requested.exchange(true)) {
    std::ignore = write(STDERR_FILENO, "\n", 1);
    _exit(128 + sig);
  }
  constexpr char kMessage[]{ "\nCancelling; press Ctrl-C again to abort immediately\n" };
  std::ignore = write(STDERR_FILENO, kMessage, sizeof kMessage - 1);
}

}  // namespace

namespace anvil {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

std::atomic_bool &termination_cancel_flag() { return s_cancel_requested; }

}  // namespace anvil
