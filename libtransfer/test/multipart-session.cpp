#include <memory>

#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"
#include "s3mp/MemoryStorage.h"
#include "s3mp/MultipartSession.h"
#include "test-transfer.h"

namespace {

using Session = s3mp::MultipartSession;

const s3mp::ObjectLocator kDest("mem", "bucket", "dir/object");

s3mp::PartResult
UploadPart(
    s3mp::MemoryStorageClient* client, const Session& session,
    uint32_t part_index, const std::vector<uint8_t>& bytes) {
  auto tag_res = client->UploadPart(
      session.destination(), session.transaction_id(), part_index,
      bytes.data(), bytes.size());
  if (!tag_res) {
    return s3mp::PartResult::Failure(
        part_index, s3mp::CopyableErrorInfo(tag_res.error()), 1);
  }
  s3mp::PartResult result;
  result.part_index = part_index;
  result.status = s3mp::PartStatus::Succeeded;
  result.tag = tag_res.value();
  return result;
}

void
TestComplete() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  RecordingEventSink sink;

  Session session(&client, kDest, s3mp::WriteOptions{}, &sink);
  S3MP_LOG_ASSERT(session.state() == Session::State::Uninitiated);
  S3MP_LOG_ASSERT(!session.ReadyToComplete());

  auto res = session.Initiate();
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(session.state() == Session::State::Active);
  S3MP_LOG_ASSERT(!session.transaction_id().empty());
  S3MP_LOG_ASSERT(store->num_open_transactions() == 1);

  // A second initiate is refused
  S3MP_LOG_ASSERT(!session.Initiate());

  auto part1 = MakeBytes(64, 1);
  auto part2 = MakeBytes(32, 2);
  S3MP_LOG_ASSERT(session.Submit(1));
  S3MP_LOG_ASSERT(session.Submit(2));
  S3MP_LOG_ASSERT(!session.Submit(2));
  S3MP_LOG_ASSERT(session.num_submitted() == 2);

  // Acknowledge out of order; completion orders parts by index
  S3MP_LOG_ASSERT(session.Acknowledge(UploadPart(&client, session, 2, part2)));
  S3MP_LOG_ASSERT(!session.ReadyToComplete());
  S3MP_LOG_ASSERT(session.Acknowledge(UploadPart(&client, session, 1, part1)));
  S3MP_LOG_ASSERT(session.ReadyToComplete());

  res = session.Complete();
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(session.state() == Session::State::Closed);
  S3MP_LOG_ASSERT(session.outcome() == Session::Outcome::Completed);
  S3MP_LOG_ASSERT(store->num_open_transactions() == 0);
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Complete) == 1);

  auto bytes = store->GetBytes("bucket", "dir/object");
  S3MP_LOG_ASSERT(bytes);
  std::vector<uint8_t> expected(part1);
  expected.insert(expected.end(), part2.begin(), part2.end());
  S3MP_LOG_ASSERT(bytes.value() == expected);

  // Exactly one finalize: neither a second complete nor an abort reaches the
  // service
  S3MP_LOG_ASSERT(!session.Complete());
  S3MP_LOG_ASSERT(session.Abort());
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Complete) == 1);
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Abort) == 0);
  S3MP_LOG_ASSERT(session.outcome() == Session::Outcome::Completed);

  S3MP_LOG_ASSERT(sink.Count("session.initiated") == 1);
  S3MP_LOG_ASSERT(sink.Count("session.completed") == 1);
}

void
TestRefuseIncomplete() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  Session session(&client, kDest, s3mp::WriteOptions{});
  S3MP_LOG_ASSERT(session.Initiate());

  S3MP_LOG_ASSERT(session.Submit(1));
  S3MP_LOG_ASSERT(session.Submit(2));
  S3MP_LOG_ASSERT(
      session.Acknowledge(UploadPart(&client, session, 1, MakeBytes(8))));

  store->FailPart(2, s3mp::ErrorCode::StorageError);
  auto failed = UploadPart(&client, session, 2, MakeBytes(8));
  S3MP_LOG_ASSERT(!failed.succeeded());
  S3MP_LOG_ASSERT(session.Acknowledge(failed));
  S3MP_LOG_ASSERT(!session.ReadyToComplete());

  // Completing with a failed part never calls the service
  auto res = session.Complete();
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::InvalidState);
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Complete) == 0);
  S3MP_LOG_ASSERT(session.state() == Session::State::Active);

  // Unknown parts cannot be acknowledged
  s3mp::PartResult stray;
  stray.part_index = 9;
  stray.status = s3mp::PartStatus::Succeeded;
  S3MP_LOG_ASSERT(!session.Acknowledge(stray));

  res = session.Abort();
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(session.outcome() == Session::Outcome::Aborted);
  S3MP_LOG_ASSERT(store->num_open_transactions() == 0);
  S3MP_LOG_ASSERT(!store->Contains("bucket", "dir/object"));
}

void
TestRetriedPartReplacesFailure() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  Session session(&client, kDest, s3mp::WriteOptions{});
  S3MP_LOG_ASSERT(session.Initiate());
  S3MP_LOG_ASSERT(session.Submit(1));

  store->FailPartTimes(1, 1);
  S3MP_LOG_ASSERT(
      session.Acknowledge(UploadPart(&client, session, 1, MakeBytes(8))));
  S3MP_LOG_ASSERT(!session.ReadyToComplete());
  S3MP_LOG_ASSERT(
      session.Acknowledge(UploadPart(&client, session, 1, MakeBytes(8))));
  S3MP_LOG_ASSERT(session.ReadyToComplete());
  S3MP_LOG_ASSERT(session.Complete());
}

void
TestEmptyRefused() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  Session session(&client, kDest, s3mp::WriteOptions{});
  S3MP_LOG_ASSERT(session.Initiate());
  S3MP_LOG_ASSERT(!session.ReadyToComplete());
  S3MP_LOG_ASSERT(!session.Complete());
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Complete) == 0);
}

void
TestDestructorAborts() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  {
    Session session(&client, kDest, s3mp::WriteOptions{});
    S3MP_LOG_ASSERT(session.Initiate());
    S3MP_LOG_ASSERT(session.Submit(1));
    S3MP_LOG_ASSERT(store->num_open_transactions() == 1);
  }
  S3MP_LOG_ASSERT(store->num_open_transactions() == 0);
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Abort) == 1);

  // Sessions that never opened a transaction have nothing to abort
  {
    Session session(&client, kDest, s3mp::WriteOptions{});
  }
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Abort) == 1);
}

void
TestInitiateFailure() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  store->FailNext(s3mp::StorageOp::Initiate, 1, s3mp::ErrorCode::StorageError);

  Session session(&client, kDest, s3mp::WriteOptions{});
  auto res = session.Initiate();
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::StorageError);
  S3MP_LOG_ASSERT(session.state() == Session::State::Closed);
  S3MP_LOG_ASSERT(session.outcome() == Session::Outcome::InitiateFailed);
  S3MP_LOG_ASSERT(!session.Submit(1));
}

void
TestFinalizeFailure() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  Session session(&client, kDest, s3mp::WriteOptions{});
  S3MP_LOG_ASSERT(session.Initiate());
  S3MP_LOG_ASSERT(session.Submit(1));
  S3MP_LOG_ASSERT(
      session.Acknowledge(UploadPart(&client, session, 1, MakeBytes(8))));

  store->FailNext(s3mp::StorageOp::Complete, 1);
  auto res = session.Complete();
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::TransactionFinalizeError);
  S3MP_LOG_ASSERT(session.state() == Session::State::Closed);
  S3MP_LOG_ASSERT(session.outcome() == Session::Outcome::FinalizeFailed);

  // The transaction is left for cleanup, not aborted
  S3MP_LOG_ASSERT(session.Abort());
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Abort) == 0);
  S3MP_LOG_ASSERT(store->num_open_transactions() == 1);
}

void
TestAbortFailure() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  Session session(&client, kDest, s3mp::WriteOptions{});
  S3MP_LOG_ASSERT(session.Initiate());

  store->FailNext(s3mp::StorageOp::Abort, 1);
  auto res = session.Abort();
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::TransactionFinalizeError);
  S3MP_LOG_ASSERT(session.outcome() == Session::Outcome::AbortFailed);
  S3MP_LOG_ASSERT(session.state() == Session::State::Closed);
}

void
TestAbortUninitiated() {
  auto store = std::make_shared<s3mp::MemoryObjectStore>();
  s3mp::MemoryStorageClient client(store);
  Session session(&client, kDest, s3mp::WriteOptions{});
  auto res = session.Abort();
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::InvalidState);
  S3MP_LOG_ASSERT(store->num_calls(s3mp::StorageOp::Abort) == 0);
}

}  // namespace

int
main() {
  TestComplete();
  TestRefuseIncomplete();
  TestRetriedPartReplacesFailure();
  TestEmptyRefused();
  TestDestructorAborts();
  TestInitiateFailure();
  TestFinalizeFailure();
  TestAbortFailure();
  TestAbortUninitiated();

  return 0;
}
