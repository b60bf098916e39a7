#include "s3mp/CancellationToken.h"

#include <algorithm>

namespace {

int64_t
SteadyNowUs() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             s3mp::Now().time_since_epoch())
      .count();
}

}  // namespace

void
s3mp::CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

void
s3mp::CancellationToken::SetTimeout(std::chrono::milliseconds timeout) {
  int64_t deadline =
      SteadyNowUs() +
      std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
  // Zero means no deadline
  deadline_us_.store(std::max<int64_t>(deadline, 1));
}

bool
s3mp::CancellationToken::IsCancelled() const {
  if (cancelled_.load()) {
    return true;
  }
  int64_t deadline = deadline_us_.load();
  return deadline != 0 && SteadyNowUs() >= deadline;
}

bool
s3mp::CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
  auto until = Now() + duration;
  std::unique_lock<std::mutex> lock(mutex_);
  while (!IsCancelled()) {
    auto now = Now();
    if (now >= until) {
      return false;
    }
    // Wake periodically: a signal handler sets the flag without notifying
    auto slice = std::min<Clock::duration>(until - now, kPollInterval);
    cv_.wait_for(lock, slice);
  }
  return true;
}
