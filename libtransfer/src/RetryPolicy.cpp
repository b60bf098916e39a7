#include "s3mp/RetryPolicy.h"

#include <fmt/format.h>

bool
s3mp::RetryPolicy::IsRetryable(const std::error_code& ec) {
  return ec == ErrorCode::TransientTransferError;
}

bool
s3mp::RetryPolicy::Wait() const {
  if (cancel_) {
    return cancel_->WaitFor(backoff_);
  }
  std::this_thread::sleep_for(backoff_);
  return false;
}

void
s3mp::RetryPolicy::EmitRetry(
    uint32_t part_index, uint32_t attempt,
    const CopyableErrorInfo& last) const {
  if (!sink_) {
    return;
  }
  sink_->Emit(
      Verbosity::Verbose, "part.retry",
      fmt::format(
          "retrying part {} in {}ms after attempt {}/{}: {}", part_index,
          backoff_.count(), attempt, max_attempts_, last),
      Tags{
          {"part", part_index},
          {"attempt", attempt},
          {"backoff_ms", static_cast<int64_t>(backoff_.count())},
      });
}
