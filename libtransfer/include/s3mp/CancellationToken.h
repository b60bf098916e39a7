#ifndef S3MP_LIBTRANSFER_S3MP_CANCELLATIONTOKEN_H_
#define S3MP_LIBTRANSFER_S3MP_CANCELLATIONTOKEN_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "s3mp/Time.h"
#include "s3mp/config.h"

namespace s3mp {

/// A CancellationToken tells long running work to stop. It is set explicitly
/// with Cancel, by a signal handler storing to flag(), or implicitly once an
/// optional deadline passes.
///
/// flag() is a lock free atomic so that it can be handed to
/// InstallInterruptHandlers. Waiters observe a flag set from a signal handler
/// within kPollInterval.
class S3MP_EXPORT CancellationToken {
public:
  static constexpr std::chrono::milliseconds kPollInterval{50};

  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();

  /// SetTimeout cancels the token once timeout has passed from now
  void SetTimeout(std::chrono::milliseconds timeout);

  bool IsCancelled() const;

  /// WaitFor sleeps for duration or until the token is cancelled
  /// \return true if the token is cancelled
  bool WaitFor(std::chrono::milliseconds duration) const;

  std::atomic<bool>* flag() { return &cancelled_; }

private:
  std::atomic<bool> cancelled_{false};
  std::atomic<int64_t> deadline_us_{0};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

}  // namespace s3mp

#endif
