#pragma once

namespace hoist {

class cancellation;

// Install SIGINT/SIGTERM handlers. The first signal cancels `token` so in-flight
// builds and pushes wind down and the summary is still written; a second signal
// calls _exit(128 + sig) immediately.
void termination_handler_install(cancellation *token);

// Signal number that triggered cancellation, or 0 if none arrived.
int termination_signal_received();

}  // namespace hoist
