#include <tendril/signals.hpp>

#include <pthread.h>
#include <system_error>

namespace tendril {

ShutdownSignals::ShutdownSignals() {
  sigemptyset(&set_);
  sigaddset(&set_, SIGINT);
  sigaddset(&set_, SIGTERM);
  sigaddset(&set_, SIGHUP);
  if (int rc = pthread_sigmask(SIG_BLOCK, &set_, &old_); rc != 0)
    throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
}

ShutdownSignals::~ShutdownSignals() {
  pthread_sigmask(SIG_SETMASK, &old_, nullptr);
}

int ShutdownSignals::wait() {
  int sig = 0;
  if (int rc = sigwait(&set_, &sig); rc != 0)
    throw std::system_error(rc, std::generic_category(), "sigwait");
  return sig;
}

} // namespace tendril
