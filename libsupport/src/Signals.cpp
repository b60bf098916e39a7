#include "s3mp/Signals.h"

#include <csignal>
#include <cstring>
#include <vector>

#include "s3mp/Logging.h"

namespace {

std::atomic<std::atomic<bool>*> interrupt_flag{nullptr};

void
SetInterrupted(int /*signo*/, siginfo_t* /*info*/, void* /*ctx*/) {
  std::atomic<bool>* flag = interrupt_flag.load();
  if (flag != nullptr) {
    flag->store(true);
  }
}

typedef void (*Handler)(int, siginfo_t*, void*);

bool
Install(const std::vector<int>& signals, Handler handler, int flags) {
  bool loaded = true;

  for (const int& sig : signals) {
    struct sigaction action;
    memset(&action, 0, sizeof action);
    action.sa_flags = flags;
    sigfillset(&action.sa_mask);
    sigdelset(&action.sa_mask, sig);
    action.sa_sigaction = handler;

    int r = sigaction(sig, &action, nullptr);
    if (r != 0) {
      loaded = false;
    }
  }

  return loaded;
}

bool
SetDisposition(const std::vector<int>& signals, void (*disposition)(int)) {
  bool loaded = true;

  for (const int& sig : signals) {
    struct sigaction action;
    memset(&action, 0, sizeof action);
    sigemptyset(&action.sa_mask);
    action.sa_handler = disposition;

    int r = sigaction(sig, &action, nullptr);
    if (r != 0) {
      loaded = false;
    }
  }

  return loaded;
}

}  // namespace

bool
s3mp::InstallInterruptHandlers(std::atomic<bool>* interrupted) {
  static_assert(
      std::atomic<bool>::is_always_lock_free,
      "interrupt flag must be safe to store from a signal handler");

  interrupt_flag.store(interrupted);

  bool loaded = true;
  // No SA_RESETHAND: a second interrupt while aborting a transaction must not
  // kill the process before the abort call returns.
  if (!Install({SIGINT, SIGTERM}, SetInterrupted, SA_SIGINFO | SA_RESTART)) {
    loaded = false;
  }
  if (!SetDisposition({SIGPIPE}, SIG_IGN)) {
    loaded = false;
  }
  if (!loaded) {
    S3MP_LOG_WARN("interrupt handlers not loaded");
  }
  return loaded;
}

void
s3mp::RestoreInterruptHandlers() {
  if (!SetDisposition({SIGINT, SIGTERM}, SIG_DFL)) {
    S3MP_LOG_WARN("could not restore default interrupt handlers");
  }
  interrupt_flag.store(nullptr);
}
