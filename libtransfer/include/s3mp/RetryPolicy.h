#ifndef S3MP_LIBTRANSFER_S3MP_RETRYPOLICY_H_
#define S3MP_LIBTRANSFER_S3MP_RETRYPOLICY_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <type_traits>

#include "s3mp/CancellationToken.h"
#include "s3mp/ErrorCode.h"
#include "s3mp/EventSink.h"
#include "s3mp/Result.h"
#include "s3mp/config.h"

namespace s3mp {

/// A RetryPolicy runs an operation on a part until it succeeds, fails with an
/// error that retrying will not fix, or runs out of attempts.
///
/// max_attempts counts every attempt including the first, so a policy with
/// max_attempts == 1 never retries. Between attempts the policy waits a fixed
/// backoff; the wait ends early if the cancellation token fires.
///
/// Operations must be idempotent: each attempt re-reads its input and
/// re-sends the whole part.
class S3MP_EXPORT RetryPolicy {
public:
  RetryPolicy(
      uint32_t max_attempts, std::chrono::milliseconds backoff,
      const CancellationToken* cancel = nullptr, EventSink* sink = nullptr)
      : max_attempts_(max_attempts < 1 ? 1 : max_attempts),
        backoff_(backoff),
        cancel_(cancel),
        sink_(sink) {}

  /// IsRetryable is true only for TransientTransferError. Every other code
  /// is final for the part.
  static bool IsRetryable(const std::error_code& ec);

  /// Execute calls op until it succeeds or the policy gives up.
  ///
  /// \param part_index part being transferred, used in messages
  /// \param op callable returning Result<T>
  /// \param[out] attempts_used if not null, number of times op was called
  /// \return the value of the first successful attempt;
  ///   ErrorCode::PartTransferFailed wrapping the last error once attempts
  ///   are exhausted; the error itself if it is not retryable;
  ///   ErrorCode::Cancelled if the token fired before or between attempts
  template <typename Op>
  std::invoke_result_t<Op&> Execute(
      uint32_t part_index, Op&& op, uint32_t* attempts_used = nullptr) const {
    uint32_t attempt = 0;
    for (;;) {
      if (cancel_ && cancel_->IsCancelled()) {
        SetAttempts(attempts_used, attempt);
        return S3MP_ERROR(
            ErrorCode::Cancelled, "part {} cancelled after {} attempts",
            part_index, attempt);
      }

      ++attempt;
      auto res = op();
      if (res) {
        SetAttempts(attempts_used, attempt);
        return res;
      }

      if (!IsRetryable(res.error().error_code())) {
        SetAttempts(attempts_used, attempt);
        return res;
      }

      // Move the error out of the thread-local error context before a new
      // error is created on this thread.
      CopyableErrorInfo last(res.error());

      if (attempt >= max_attempts_) {
        SetAttempts(attempts_used, attempt);
        return S3MP_ERROR(
            ErrorCode::PartTransferFailed,
            "part {} failed after {} attempts: {}", part_index, attempt, last);
      }

      EmitRetry(part_index, attempt, last);

      if (Wait()) {
        SetAttempts(attempts_used, attempt);
        return S3MP_ERROR(
            ErrorCode::Cancelled, "part {} cancelled after {} attempts: {}",
            part_index, attempt, last);
      }
    }
  }

  uint32_t max_attempts() const { return max_attempts_; }
  std::chrono::milliseconds backoff() const { return backoff_; }

private:
  static void SetAttempts(uint32_t* attempts_used, uint32_t attempt) {
    if (attempts_used) {
      *attempts_used = attempt;
    }
  }

  /// Wait sleeps for the backoff and returns true if cancelled meanwhile
  bool Wait() const;

  void EmitRetry(
      uint32_t part_index, uint32_t attempt,
      const CopyableErrorInfo& last) const;

  uint32_t max_attempts_;
  std::chrono::milliseconds backoff_;
  const CancellationToken* cancel_;
  EventSink* sink_;
};

}  // namespace s3mp

#endif
