#pragma once

#include <atomic>

namespace anvil {

// SIGINT/SIGTERM handler. The first signal sets the cancellation flag so a running build
// can be stopped cleanly; a second one exits immediately with 128 + signal.
void termination_handler_install();

// Polled by shell_run and the forge pipeline.
std::atomic_bool &termination_cancel_flag();

}  // namespace anvil
