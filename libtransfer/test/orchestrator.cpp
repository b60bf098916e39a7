#include <memory>
#include <thread>

#include "s3mp/CancellationToken.h"
#include "s3mp/ErrorCode.h"
#include "s3mp/FileSystem.h"
#include "s3mp/Logging.h"
#include "s3mp/MemoryStorage.h"
#include "s3mp/TransferOrchestrator.h"
#include "test-transfer.h"

namespace {

using s3mp::StorageOp;
using s3mp::TransferMode;

std::string scratch_dir;

s3mp::TransferConfig
TestConfig() {
  s3mp::TransferConfig config;
  config.concurrency = 3;
  config.min_part_size = 1024;
  config.part_size = 4096;
  config.backoff = std::chrono::milliseconds(1);
  return config;
}

/// Fixture holds a fresh memory store for every test
struct Fixture {
  std::shared_ptr<s3mp::MemoryObjectStore> store{
      std::make_shared<s3mp::MemoryObjectStore>()};
  s3mp::MemoryStorageProvider provider{store};
  RecordingEventSink sink;

  s3mp::Result<s3mp::TransferSummary> Run(
      const s3mp::ObjectLocator& source, const s3mp::ObjectLocator& dest,
      TransferMode mode, const s3mp::TransferConfig& config = TestConfig(),
      s3mp::CancellationToken* cancel = nullptr) {
    s3mp::TransferOrchestrator orchestrator(&provider, config, &sink, cancel);
    return orchestrator.Transfer(source, dest, mode);
  }
};

s3mp::ObjectLocator
Object(const std::string& key) {
  return s3mp::ObjectLocator(s3mp::ObjectLocator::kMemoryScheme, "bucket", key);
}

s3mp::ObjectLocator
LocalPath(const std::string& name) {
  return s3mp::ObjectLocator::LocalFile(s3mp::JoinPath(scratch_dir, name));
}

s3mp::ObjectLocator
MakeLocalFile(const std::string& name, const std::vector<uint8_t>& bytes) {
  auto loc = LocalPath(name);
  auto res = WriteLocalFile(loc.key(), bytes);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  return loc;
}

void
TestUpload() {
  Fixture f;
  auto bytes = MakeBytes(4096 * 5 + 100);
  auto src = MakeLocalFile("upload.bin", bytes);

  auto res = f.Run(src, Object("up/object"), TransferMode::Upload);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  const auto& summary = res.value();
  S3MP_LOG_ASSERT(!summary.direct);
  // The 100 byte tail is folded into part 5
  S3MP_LOG_ASSERT(summary.num_parts == 5);
  S3MP_LOG_ASSERT(summary.total_bytes == bytes.size());
  S3MP_LOG_ASSERT(!summary.transaction_id.empty());

  auto stored = f.store->GetBytes("bucket", "up/object");
  S3MP_LOG_ASSERT(stored);
  S3MP_LOG_ASSERT(stored.value() == bytes);
  S3MP_LOG_ASSERT(f.store->num_open_transactions() == 0);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::UploadPart) == 5);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Complete) == 1);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Put) == 0);

  S3MP_LOG_ASSERT(f.sink.Count("transfer.start") == 1);
  S3MP_LOG_ASSERT(f.sink.Count("transfer.plan") == 1);
  S3MP_LOG_ASSERT(f.sink.Count("transfer.done") == 1);
  S3MP_LOG_ASSERT(f.sink.Count("part.done") == 5);
}

void
TestUploadFoldedScenario() {
  Fixture f;
  auto bytes = MakeBytes(12582912, 3);
  auto src = MakeLocalFile("twelve.bin", bytes);

  auto config = TestConfig();
  config.min_part_size = 5000000;
  config.part_size = 5000000;

  auto res = f.Run(src, Object("twelve"), TransferMode::Upload, config);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value().num_parts == 2);
  auto stored = f.store->GetBytes("bucket", "twelve");
  S3MP_LOG_ASSERT(stored);
  S3MP_LOG_ASSERT(stored.value() == bytes);
}

void
TestDownload() {
  Fixture f;
  auto bytes = MakeBytes(4096 * 7 + 2000, 11);
  f.store->PutBytes("bucket", "down/object", bytes);
  auto dest = LocalPath("nested/dir/download.bin");

  auto res = f.Run(Object("down/object"), dest, TransferMode::Download);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value().num_parts == 8);
  S3MP_LOG_ASSERT(res.value().transaction_id.empty());

  auto read = ReadLocalFile(dest.key());
  S3MP_LOG_VASSERT(read, "{}", read.error());
  S3MP_LOG_ASSERT(read.value() == bytes);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::GetRange) == 8);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Initiate) == 0);
}

void
TestCopy() {
  Fixture f;
  auto bytes = MakeBytes(4096 * 3 + 10, 5);
  f.store->PutBytes("bucket", "copy/src", bytes);

  // Small objects are copied with a single call
  auto res =
      f.Run(Object("copy/src"), Object("copy/whole"), TransferMode::Copy);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value().direct);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Copy) == 1);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::CopyPart) == 0);

  auto config = TestConfig();
  config.direct_threshold = 1;
  res = f.Run(
      Object("copy/src"), Object("copy/parts"), TransferMode::Copy, config);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(!res.value().direct);
  S3MP_LOG_ASSERT(res.value().num_parts == 3);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::CopyPart) == 3);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Copy) == 1);

  for (const char* key : {"copy/whole", "copy/parts"}) {
    auto stored = f.store->GetBytes("bucket", key);
    S3MP_LOG_ASSERT(stored);
    S3MP_LOG_ASSERT(stored.value() == bytes);
  }
  S3MP_LOG_ASSERT(f.store->num_open_transactions() == 0);
}

void
TestDirect() {
  Fixture f;
  auto small = MakeBytes(100);
  auto src = MakeLocalFile("small.bin", small);

  auto res = f.Run(src, Object("small"), TransferMode::Upload);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value().direct);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Put) == 1);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Initiate) == 0);
  S3MP_LOG_ASSERT(f.sink.Count("transfer.direct") == 1);

  auto dest = LocalPath("small-down.bin");
  res = f.Run(Object("small"), dest, TransferMode::Download);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value().direct);
  auto read = ReadLocalFile(dest.key());
  S3MP_LOG_ASSERT(read);
  S3MP_LOG_ASSERT(read.value() == small);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Get) == 1);

  // Empty objects go through the direct path in every direction
  auto empty_src = MakeLocalFile("empty.bin", {});
  res = f.Run(empty_src, Object("empty"), TransferMode::Upload);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value().direct);
  S3MP_LOG_ASSERT(res.value().total_bytes == 0);
  S3MP_LOG_ASSERT(f.store->Contains("bucket", "empty"));

  auto empty_dest = LocalPath("empty-down.bin");
  res = f.Run(Object("empty"), empty_dest, TransferMode::Download);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  auto size = s3mp::LocalFile::Size(empty_dest.key());
  S3MP_LOG_ASSERT(size);
  S3MP_LOG_ASSERT(size.value() == 0);

  auto config = TestConfig();
  config.direct_threshold = 1;
  res = f.Run(
      Object("empty"), Object("empty-copy"), TransferMode::Copy, config);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value().direct);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Initiate) == 0);
}

/// Rejected transfers must not touch the destination
void
CheckNoSideEffects(const Fixture& f) {
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Initiate) == 0);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::UploadPart) == 0);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::CopyPart) == 0);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Put) == 0);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Copy) == 0);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::GetRange) == 0);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Get) == 0);
}

void
CheckPrecondition(const s3mp::Result<s3mp::TransferSummary>& res) {
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_VASSERT(
      res.error() == s3mp::ErrorCode::PreconditionError, "{}", res.error());
}

void
TestPreconditions() {
  Fixture f;
  auto bytes = MakeBytes(4096 * 2);
  auto src = MakeLocalFile("pre.bin", bytes);
  f.store->PutBytes("bucket", "exists", MakeBytes(10));

  CheckPrecondition(
      f.Run(LocalPath("missing.bin"), Object("x"), TransferMode::Upload));
  CheckPrecondition(f.Run(src, Object("exists"), TransferMode::Upload));
  CheckPrecondition(
      f.Run(Object("missing"), LocalPath("m.bin"), TransferMode::Download));
  CheckPrecondition(f.Run(Object("exists"), src, TransferMode::Download));
  CheckPrecondition(
      f.Run(Object("exists"), Object("exists"), TransferMode::Copy));
  CheckPrecondition(
      f.Run(Object("missing"), Object("other"), TransferMode::Copy));

  // Locators of the wrong kind or store
  CheckPrecondition(f.Run(Object("exists"), Object("y"), TransferMode::Upload));
  CheckPrecondition(f.Run(src, LocalPath("z.bin"), TransferMode::Download));
  CheckPrecondition(f.Run(
      src, s3mp::ObjectLocator(s3mp::ObjectLocator::kS3Scheme, "bucket", "k"),
      TransferMode::Upload));

  CheckNoSideEffects(f);
  S3MP_LOG_ASSERT(f.sink.Count("transfer.failed") == 9);

  // The existing local file is untouched
  auto read = ReadLocalFile(src.key());
  S3MP_LOG_ASSERT(read);
  S3MP_LOG_ASSERT(read.value() == bytes);

  auto invalid = TestConfig();
  invalid.concurrency = 0;
  auto res = f.Run(src, Object("new"), TransferMode::Upload, invalid);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::InvalidArgument);
  CheckNoSideEffects(f);

  // Part sizes that cannot be planned are reported before any request
  invalid = TestConfig();
  invalid.part_size = invalid.min_part_size - 1;
  res = f.Run(src, Object("new"), TransferMode::Upload, invalid);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::PlanningError);
  CheckNoSideEffects(f);
}

void
TestForce() {
  Fixture f;
  auto bytes = MakeBytes(4096 * 2 + 5);
  auto src = MakeLocalFile("force.bin", bytes);
  f.store->PutBytes("bucket", "force", MakeBytes(10));

  auto config = TestConfig();
  config.force = true;
  auto res = f.Run(src, Object("force"), TransferMode::Upload, config);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  auto stored = f.store->GetBytes("bucket", "force");
  S3MP_LOG_ASSERT(stored);
  S3MP_LOG_ASSERT(stored.value() == bytes);

  auto dest = MakeLocalFile("force-down.bin", MakeBytes(3));
  res = f.Run(Object("force"), dest, TransferMode::Download, config);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  auto read = ReadLocalFile(dest.key());
  S3MP_LOG_ASSERT(read);
  S3MP_LOG_ASSERT(read.value() == bytes);
}

void
TestTransientRetries() {
  Fixture f;
  auto bytes = MakeBytes(4096 * 4);
  auto src = MakeLocalFile("retry.bin", bytes);
  f.store->FailPartTimes(2, 2);

  auto res = f.Run(src, Object("retry"), TransferMode::Upload);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(f.store->num_part_attempts(2) == 3);
  S3MP_LOG_ASSERT(f.store->num_part_attempts(1) == 1);
  S3MP_LOG_ASSERT(f.sink.Count("part.retry") == 2);
  auto stored = f.store->GetBytes("bucket", "retry");
  S3MP_LOG_ASSERT(stored);
  S3MP_LOG_ASSERT(stored.value() == bytes);
}

void
TestDownloadRetries() {
  Fixture f;
  auto bytes = MakeBytes(4096 * 6 + 512, 5);
  f.store->PutBytes("bucket", "flaky", bytes);
  f.store->FailPartTimes(3, 2);
  f.store->FailPartTimes(6, 1);
  auto dest = LocalPath("flaky.bin");

  auto res = f.Run(Object("flaky"), dest, TransferMode::Download);
  S3MP_LOG_VASSERT(res, "{}", res.error());
  S3MP_LOG_ASSERT(res.value().num_parts == 6);
  S3MP_LOG_ASSERT(f.store->num_part_attempts(3) == 3);
  S3MP_LOG_ASSERT(f.store->num_part_attempts(6) == 2);
  S3MP_LOG_ASSERT(f.store->num_part_attempts(1) == 1);
  S3MP_LOG_ASSERT(f.sink.Count("part.retry") == 3);

  auto read = ReadLocalFile(dest.key());
  S3MP_LOG_ASSERT(read);
  S3MP_LOG_ASSERT(read.value().size() == bytes.size());
  S3MP_LOG_ASSERT(read.value() == bytes);
}

void
TestPartFailureAborts() {
  Fixture f;
  auto src = MakeLocalFile("fail.bin", MakeBytes(4096 * 4));
  f.store->FailPart(3);

  auto res = f.Run(src, Object("fail"), TransferMode::Upload);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::PartTransferFailed);
  std::string msg = fmt::format("{}", res.error());
  S3MP_LOG_VASSERT(msg.find("first part 3") != std::string::npos, "{}", msg);

  S3MP_LOG_ASSERT(f.store->num_part_attempts(3) == 3);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Abort) == 1);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Complete) == 0);
  S3MP_LOG_ASSERT(f.store->num_open_transactions() == 0);
  S3MP_LOG_ASSERT(!f.store->Contains("bucket", "fail"));
  S3MP_LOG_ASSERT(f.sink.Count("session.aborted") == 1);
}

void
TestServiceErrorNotRetried() {
  Fixture f;
  auto src = MakeLocalFile("denied.bin", MakeBytes(4096 * 4));
  f.store->FailPart(2, s3mp::ErrorCode::StorageError);

  auto res = f.Run(src, Object("denied"), TransferMode::Upload);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::PartTransferFailed);
  S3MP_LOG_ASSERT(f.store->num_part_attempts(2) == 1);
  S3MP_LOG_ASSERT(f.sink.Count("part.retry") == 0);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Abort) == 1);
  S3MP_LOG_ASSERT(f.store->num_open_transactions() == 0);
}

void
TestAbortFailureReported() {
  Fixture f;
  auto config = TestConfig();
  config.direct_threshold = 1;
  f.store->PutBytes("bucket", "src", MakeBytes(4096 * 3));
  f.store->FailPart(1, s3mp::ErrorCode::InvalidArgument);
  f.store->FailNext(StorageOp::Abort, 1);

  auto res = f.Run(Object("src"), Object("dst"), TransferMode::Copy, config);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::PartTransferFailed);
  std::string msg = fmt::format("{}", res.error());
  S3MP_LOG_VASSERT(msg.find("left open") != std::string::npos, "{}", msg);

  // Non-retryable errors are not retried
  S3MP_LOG_ASSERT(f.store->num_part_attempts(1) == 1);
  S3MP_LOG_ASSERT(f.store->num_open_transactions() == 1);
}

void
TestFinalizeFailure() {
  Fixture f;
  auto src = MakeLocalFile("finalize.bin", MakeBytes(4096 * 2));
  f.store->FailNext(StorageOp::Complete, 1);

  auto res = f.Run(src, Object("finalize"), TransferMode::Upload);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::TransactionFinalizeError);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::Abort) == 0);
  S3MP_LOG_ASSERT(f.store->num_open_transactions() == 1);
  S3MP_LOG_ASSERT(!f.store->Contains("bucket", "finalize"));
}

void
TestDownloadFailureRemovesFile() {
  Fixture f;
  f.store->PutBytes("bucket", "broken", MakeBytes(4096 * 4));
  f.store->FailPart(2, s3mp::ErrorCode::StorageError);
  auto dest = LocalPath("broken.bin");

  auto res = f.Run(Object("broken"), dest, TransferMode::Download);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::PartTransferFailed);
  S3MP_LOG_ASSERT(!s3mp::LocalFile::Exists(dest.key()));

  // Same for the single request path
  f.store->PutBytes("bucket", "tiny", MakeBytes(10));
  f.store->FailNext(StorageOp::Get, 5, s3mp::ErrorCode::StorageError);
  auto tiny = LocalPath("tiny.bin");
  res = f.Run(Object("tiny"), tiny, TransferMode::Download);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(!s3mp::LocalFile::Exists(tiny.key()));
}

void
TestCancelled() {
  Fixture f;
  auto src = MakeLocalFile("cancel.bin", MakeBytes(4096 * 4));
  s3mp::CancellationToken token;
  token.Cancel();

  auto res = f.Run(
      src, Object("cancel"), TransferMode::Upload, TestConfig(), &token);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::Cancelled);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::UploadPart) == 0);
  S3MP_LOG_ASSERT(f.store->num_open_transactions() == 0);
  S3MP_LOG_ASSERT(!f.store->Contains("bucket", "cancel"));
}

void
TestCancelledMidway() {
  Fixture f;
  auto src = MakeLocalFile("midway.bin", MakeBytes(4096 * 10));
  f.store->SetLatency(std::chrono::milliseconds(50));
  auto config = TestConfig();
  config.concurrency = 1;
  s3mp::CancellationToken token;

  std::thread canceller([&token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    token.Cancel();
  });
  auto res = f.Run(src, Object("midway"), TransferMode::Upload, config, &token);
  canceller.join();

  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::Cancelled);
  S3MP_LOG_ASSERT(f.store->num_calls(StorageOp::UploadPart) < 10);
  S3MP_LOG_ASSERT(f.store->num_open_transactions() == 0);
}

void
TestTimeout() {
  Fixture f;
  auto dest = LocalPath("timeout.bin");
  f.store->PutBytes("bucket", "slow", MakeBytes(4096 * 10));
  f.store->SetLatency(std::chrono::milliseconds(300));
  auto config = TestConfig();
  config.concurrency = 1;
  config.timeout = std::chrono::seconds(1);
  s3mp::CancellationToken token;

  auto res =
      f.Run(Object("slow"), dest, TransferMode::Download, config, &token);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::Cancelled);
  S3MP_LOG_ASSERT(!s3mp::LocalFile::Exists(dest.key()));
}

void
TestConcurrencyLimit() {
  for (uint32_t concurrency : {1U, 2U, 4U}) {
    Fixture f;
    f.store->PutBytes("bucket", "wide", MakeBytes(4096 * 8));
    f.store->SetLatency(std::chrono::milliseconds(20));
    auto config = TestConfig();
    config.concurrency = concurrency;
    config.direct_threshold = 1;

    auto res =
        f.Run(Object("wide"), Object("narrow"), TransferMode::Copy, config);
    S3MP_LOG_VASSERT(res, "{}", res.error());
    S3MP_LOG_VASSERT(
        f.store->peak_concurrent_parts() <= concurrency,
        "peak {} with concurrency {}", f.store->peak_concurrent_parts(),
        concurrency);
    // One connection for the plan and one per worker
    S3MP_LOG_ASSERT(f.provider.num_connections() == concurrency + 1);
  }
}

void
TestConnectFailure() {
  Fixture f;
  auto src = MakeLocalFile("connect.bin", MakeBytes(4096 * 2));
  f.provider.FailConnects(1);

  auto res = f.Run(src, Object("connect"), TransferMode::Upload);
  S3MP_LOG_ASSERT(!res);
  S3MP_LOG_ASSERT(res.error() == s3mp::ErrorCode::StorageError);
  CheckNoSideEffects(f);
}

}  // namespace

int
main() {
  scratch_dir = MakeScratchDir("orchestrator");

  TestUpload();
  TestUploadFoldedScenario();
  TestDownload();
  TestCopy();
  TestDirect();
  TestPreconditions();
  TestForce();
  TestTransientRetries();
  TestDownloadRetries();
  TestPartFailureAborts();
  TestServiceErrorNotRetried();
  TestAbortFailureReported();
  TestFinalizeFailure();
  TestDownloadFailureRemovesFile();
  TestCancelled();
  TestCancelledMidway();
  TestTimeout();
  TestConcurrencyLimit();
  TestConnectFailure();

  if (auto res = s3mp::RemoveAll(scratch_dir); !res) {
    S3MP_LOG_FATAL("removing {}: {}", scratch_dir, res.error());
  }
  return 0;
}
