#include <memory>

#include "s3mp/Cleanup.h"
#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"
#include "s3mp/MemoryStorage.h"
#include "s3mp/Strings.h"

namespace {

s3mp::ObjectLocator
Object(const std::string& container, const std::string& key) {
  return s3mp::ObjectLocator(
      s3mp::ObjectLocator::kMemoryScheme, container, key);
}

s3mp::Result<void>
TestListAndCancel() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);

  std::string logs_a =
      S3MP_CHECKED(client.InitiateMultipart(Object("b", "logs/a"), {}));
  std::string logs_b =
      S3MP_CHECKED(client.InitiateMultipart(Object("b", "logs/b"), {}));
  S3MP_CHECKED(client.InitiateMultipart(Object("b", "data/c"), {}));
  S3MP_CHECKED(client.InitiateMultipart(Object("other", "logs/d"), {}));

  auto bucket = Object("b", "");
  auto all = S3MP_CHECKED(s3mp::ListIncompleteTransfers(&client, bucket));
  S3MP_LOG_ASSERT(all.size() == 3);

  auto logs = S3MP_CHECKED(
      s3mp::ListIncompleteTransfers(&client, Object("b", "logs/")));
  S3MP_LOG_ASSERT(logs.size() == 2);
  for (const auto& txn : logs) {
    S3MP_LOG_ASSERT(s3mp::HasPrefix(txn.key, "logs/"));
    S3MP_LOG_ASSERT(!txn.started_at.empty());

    std::string command = s3mp::FormatCancelCommand(bucket, txn);
    S3MP_LOG_VASSERT(
        s3mp::HasPrefix(
            command, fmt::format(
                         "s3mp cleanup mem://b/{} --cancel {}  # ", txn.key,
                         txn.transaction_id)),
        "{}", command);
  }

  auto cancelled =
      S3MP_CHECKED(s3mp::CancelIncompleteTransfer(&client, bucket, logs_b));
  S3MP_LOG_ASSERT(cancelled.key == "logs/b");
  S3MP_LOG_ASSERT(store->num_open_transactions() == 3);
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Abort) == 1);

  // Cancelling twice finds nothing
  auto again = s3mp::CancelIncompleteTransfer(&client, bucket, logs_b);
  S3MP_LOG_ASSERT(!again);
  S3MP_LOG_ASSERT(again.error() == s3mp::ErrorCode::NotFound);

  // Transactions outside the listed prefix are not found
  auto outside = s3mp::CancelIncompleteTransfer(
      &client, Object("b", "data/"), logs_a);
  S3MP_LOG_ASSERT(!outside);
  S3MP_LOG_ASSERT(outside.error() == s3mp::ErrorCode::NotFound);
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Abort) == 1);

  return s3mp::ResultSuccess();
}

void
TestListFailure() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  store->FailNext(s3mp::StorageOp::List, 1, s3mp::ErrorCode::StorageError);

  auto res = s3mp::ListIncompleteTransfers(&client, Object("b", ""));
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::StorageError);
}

}  // namespace

int
main() {
  if (auto res = TestListAndCancel(); !res) {
    S3MP_LOG_FATAL("test failed: {}", res.error());
  }
  TestListFailure();

  return 0;
}
