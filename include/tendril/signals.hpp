#pragma once
#include <signal.h>

namespace tendril {

// Blocks SIGINT, SIGTERM and SIGHUP in the calling thread so that threads
// started afterwards inherit the mask; wait() picks them up with sigwait.
class ShutdownSignals {
public:
  ShutdownSignals();
  ~ShutdownSignals();

  ShutdownSignals(const ShutdownSignals &) = delete;
  ShutdownSignals &operator=(const ShutdownSignals &) = delete;

  int wait();

private:
  sigset_t set_{};
  sigset_t old_{};
};

} // namespace tendril
