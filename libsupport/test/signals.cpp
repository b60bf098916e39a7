#include "s3mp/Signals.h"

#include <atomic>
#include <csignal>

#include "s3mp/Logging.h"

int
main() {
  std::atomic<bool> interrupted{false};
  S3MP_LOG_ASSERT(s3mp::InstallInterruptHandlers(&interrupted));

  for (int i = 0; i < 5; ++i) {
    std::raise(SIGPIPE);
  }
  S3MP_LOG_ASSERT(!interrupted.load());

  std::raise(SIGINT);
  S3MP_LOG_ASSERT(interrupted.load());

  // A second interrupt must not terminate the process
  std::raise(SIGTERM);
  S3MP_LOG_ASSERT(interrupted.load());

  s3mp::RestoreInterruptHandlers();

  return 0;
}
