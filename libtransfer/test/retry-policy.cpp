#include <atomic>
#include <thread>

#include "s3mp/CancellationToken.h"
#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"
#include "s3mp/RetryPolicy.h"
#include "s3mp/Time.h"
#include "test-transfer.h"

namespace {

/// FlakyOp fails with code for the first num_failures calls
struct FlakyOp {
  uint32_t num_failures;
  s3mp::ErrorCode code{s3mp::ErrorCode::TransientTransferError};
  uint32_t calls{0};

  s3mp::Result<int> operator()() {
    ++calls;
    if (calls <= num_failures) {
      return S3MP_ERROR(code, "call {} failed", calls);
    }
    return 42;
  }
};

void
TestFirstAttempt() {
  s3mp::RetryPolicy retry(3, std::chrono::milliseconds(1));
  FlakyOp op{0};
  uint32_t attempts = 0;
  auto res = retry.Execute(1, op, &attempts);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value() == 42);
  S3MP_LOG_ASSERT(attempts == 1);
  S3MP_LOG_ASSERT(op.calls == 1);
}

void
TestRetryThenSucceed() {
  RecordingEventSink sink;
  s3mp::RetryPolicy retry(3, std::chrono::milliseconds(1), nullptr, &sink);
  FlakyOp op{2};
  uint32_t attempts = 0;
  auto res = retry.Execute(4, op, &attempts);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(attempts == 3);
  S3MP_LOG_ASSERT(op.calls == 3);
  S3MP_LOG_ASSERT(sink.Count("part.retry") == 2);
}

void
TestExhausted() {
  s3mp::RetryPolicy retry(3, std::chrono::milliseconds(1));
  FlakyOp op{100};
  uint32_t attempts = 0;
  auto res = retry.Execute(2, op, &attempts);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::PartTransferFailed);
  S3MP_LOG_ASSERT(attempts == 3);
  S3MP_LOG_ASSERT(op.calls == 3);

  std::string msg = fmt::format("{}", res.error());
  S3MP_LOG_VASSERT(
      msg.find("part 2 failed after 3 attempts") != std::string::npos, "{}",
      msg);
  S3MP_LOG_VASSERT(msg.find("call 3 failed") != std::string::npos, "{}", msg);
}

void
TestSingleAttempt() {
  s3mp::RetryPolicy retry(1, std::chrono::milliseconds(1));
  FlakyOp op{1};
  auto res = retry.Execute(1, op);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::PartTransferFailed);
  S3MP_LOG_ASSERT(op.calls == 1);

  // Zero is treated as one attempt
  s3mp::RetryPolicy zero(0, std::chrono::milliseconds(1));
  S3MP_LOG_ASSERT(zero.max_attempts() == 1);
}

void
TestNotRetryable() {
  s3mp::RetryPolicy retry(5, std::chrono::milliseconds(1));
  for (auto code :
       {s3mp::ErrorCode::NotFound, s3mp::ErrorCode::InvalidArgument,
        s3mp::ErrorCode::PreconditionError, s3mp::ErrorCode::AWSWrongRegion,
        s3mp::ErrorCode::StorageError, s3mp::ErrorCode::LocalStorageError}) {
    FlakyOp op{100, code};
    uint32_t attempts = 0;
    auto res = retry.Execute(1, op, &attempts);
    S3MP_LOG_ASSERT(!res);
    S3MP_LOG_ASSERT(res.error() == code);
    S3MP_LOG_ASSERT(attempts == 1);
    S3MP_LOG_ASSERT(op.calls == 1);
  }

  S3MP_LOG_ASSERT(
      s3mp::RetryPolicy::IsRetryable(s3mp::ErrorCode::TransientTransferError));
  S3MP_LOG_ASSERT(
      !s3mp::RetryPolicy::IsRetryable(s3mp::ErrorCode::StorageError));
  S3MP_LOG_ASSERT(
      !s3mp::RetryPolicy::IsRetryable(s3mp::ErrorCode::LocalStorageError));
  S3MP_LOG_ASSERT(!s3mp::RetryPolicy::IsRetryable(s3mp::ErrorCode::Cancelled));
}

void
TestCancelledBeforeStart() {
  s3mp::CancellationToken token;
  token.Cancel();
  s3mp::RetryPolicy retry(3, std::chrono::milliseconds(1), &token);
  FlakyOp op{0};
  uint32_t attempts = 7;
  auto res = retry.Execute(1, op, &attempts);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::Cancelled);
  S3MP_LOG_ASSERT(op.calls == 0);
  S3MP_LOG_ASSERT(attempts == 0);
}

void
TestCancelledDuringBackoff() {
  s3mp::CancellationToken token;
  s3mp::RetryPolicy retry(3, std::chrono::seconds(30), &token);
  FlakyOp op{100};

  std::thread canceller([&token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.Cancel();
  });

  auto begin = s3mp::Now();
  uint32_t attempts = 0;
  auto res = retry.Execute(1, op, &attempts);
  uint64_t us = s3mp::UsSince(begin);
  canceller.join();

  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::Cancelled);
  S3MP_LOG_ASSERT(op.calls == 1);
  S3MP_LOG_ASSERT(attempts == 1);
  S3MP_LOG_VASSERT(us < 10 * 1000 * 1000, "backoff took {}us", us);
}

void
TestTimeout() {
  s3mp::CancellationToken token;
  token.SetTimeout(std::chrono::milliseconds(100));
  s3mp::RetryPolicy retry(1000, std::chrono::milliseconds(20), &token);
  FlakyOp op{1000000};
  auto res = retry.Execute(1, op);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::Cancelled);
  S3MP_LOG_ASSERT(token.IsCancelled());
  S3MP_LOG_ASSERT(op.calls < 1000);
}

}  // namespace

int
main() {
  TestFirstAttempt();
  TestRetryThenSucceed();
  TestExhausted();
  TestSingleAttempt();
  TestNotRetryable();
  TestCancelledBeforeStart();
  TestCancelledDuringBackoff();
  TestTimeout();

  return 0;
}
