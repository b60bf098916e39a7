#ifndef S3MP_LIBTRANSFER_S3MP_MEMORYSTORAGE_H_
#define S3MP_LIBTRANSFER_S3MP_MEMORYSTORAGE_H_

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "s3mp/ErrorCode.h"
#include "s3mp/StorageClient.h"
#include "s3mp/config.h"

namespace s3mp {

/// Operations of the StorageClient interface, used to count calls and to
/// target injected faults
enum class StorageOp : int {
  Head = 0,
  Initiate,
  UploadPart,
  CopyPart,
  Complete,
  Abort,
  GetRange,
  Put,
  Get,
  Copy,
  List,
  kNumOps,
};

S3MP_EXPORT const char* StorageOpName(StorageOp op);

/// A MemoryObjectStore is an in-process object store with multipart
/// transactions. It backs the mem:// scheme and the transfer tests.
///
/// Faults can be injected deterministically: the next N calls of an
/// operation fail, or every call for a given part index fails. Each store
/// also counts calls per operation and the peak number of concurrent part
/// operations, which tests use to observe what a transfer did.
class S3MP_EXPORT MemoryObjectStore {
public:
  using Bytes = std::vector<uint8_t>;

  struct Transaction {
    std::string container;
    std::string key;
    std::string started_at;
    std::map<uint32_t, Bytes> parts;
    std::map<uint32_t, std::string> tags;
  };

  /// FailNext makes the next count calls of op fail with code
  void FailNext(
      StorageOp op, uint32_t count,
      ErrorCode code = ErrorCode::TransientTransferError);

  /// FailPart makes every part operation on part_index fail with code
  void FailPart(
      uint32_t part_index, ErrorCode code = ErrorCode::TransientTransferError);

  /// FailPartTimes makes the next count part operations on part_index fail
  void FailPartTimes(
      uint32_t part_index, uint32_t count,
      ErrorCode code = ErrorCode::TransientTransferError);

  void ClearFaults();

  /// SetLatency delays every part operation, so that tests can observe
  /// overlap between workers
  void SetLatency(std::chrono::milliseconds latency);

  void PutBytes(
      const std::string& container, const std::string& key, Bytes data);
  bool Contains(const std::string& container, const std::string& key) const;
  Result<Bytes> GetBytes(
      const std::string& container, const std::string& key) const;

  uint64_t num_calls(StorageOp op) const;
  uint64_t num_part_attempts(uint32_t part_index) const;
  uint32_t peak_concurrent_parts() const { return peak_concurrent_; }
  size_t num_open_transactions() const;
  uint64_t num_objects() const;

  // Implementations of the StorageClient operations
  Result<ObjectInfo> Head(const ObjectLocator& object);
  Result<std::string> Initiate(const ObjectLocator& dest);
  Result<std::string> UploadPart(
      const ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, Bytes data);
  Result<std::string> CopyPart(
      const ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, const ObjectLocator& source, const ByteRange& range);
  Result<void> Complete(
      const ObjectLocator& dest, const std::string& transaction_id,
      const std::vector<PartAck>& parts);
  Result<void> Abort(
      const ObjectLocator& dest, const std::string& transaction_id);
  Result<void> GetRange(
      const ObjectLocator& source, const ByteRange& range, uint8_t* data);
  Result<void> Put(const ObjectLocator& dest, Bytes data);
  Result<Bytes> Get(const ObjectLocator& source);
  Result<void> Copy(const ObjectLocator& source, const ObjectLocator& dest);
  Result<std::vector<MultipartTransaction>> List(const ObjectLocator& locator);

private:
  /// BeginCall counts a call and returns the injected fault, if any. Must
  /// be called with mutex_ held.
  std::error_code BeginCall(StorageOp op, uint32_t part_index = 0);

  /// StorePartLocked writes a part into an open transaction. Must be called
  /// with mutex_ held.
  Result<std::string> StorePartLocked(
      const ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, Bytes data);

  /// Delay sleeps for the configured latency while counting the caller as
  /// an in-flight part operation
  void Delay();

  static std::string ObjectName(
      const std::string& container, const std::string& key) {
    return container + "/" + key;
  }

  struct Fault {
    uint32_t remaining{};
    ErrorCode code{ErrorCode::TransientTransferError};
  };

  mutable std::mutex mutex_;
  std::map<std::string, Bytes> objects_;
  std::map<std::string, Transaction> transactions_;
  uint64_t next_transaction_{1};
  uint64_t next_tag_{1};

  std::array<uint64_t, static_cast<int>(StorageOp::kNumOps)> calls_{};
  std::array<Fault, static_cast<int>(StorageOp::kNumOps)> op_faults_{};
  std::map<uint32_t, Fault> part_faults_;
  std::map<uint32_t, uint64_t> part_attempts_;

  std::atomic<int64_t> latency_ms_{0};
  std::atomic<uint32_t> concurrent_{0};
  std::atomic<uint32_t> peak_concurrent_{0};
};

/// A MemoryStorageClient is a StorageClient backed by a shared
/// MemoryObjectStore
class S3MP_EXPORT MemoryStorageClient : public StorageClient {
public:
  explicit MemoryStorageClient(std::shared_ptr<MemoryObjectStore> store)
      : store_(std::move(store)) {}

  Result<ObjectInfo> HeadObject(const ObjectLocator& object) override;
  Result<std::string> InitiateMultipart(
      const ObjectLocator& dest, const WriteOptions& opts) override;
  Result<std::string> UploadPart(
      const ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, const uint8_t* data, uint64_t size) override;
  Result<std::string> CopyPart(
      const ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, const ObjectLocator& source,
      const ByteRange& range) override;
  Result<void> CompleteMultipart(
      const ObjectLocator& dest, const std::string& transaction_id,
      const std::vector<PartAck>& parts) override;
  Result<void> AbortMultipart(
      const ObjectLocator& dest, const std::string& transaction_id) override;
  Result<void> GetRange(
      const ObjectLocator& source, const ByteRange& range,
      uint8_t* data) override;
  Result<void> PutObject(
      const ObjectLocator& dest, const uint8_t* data, uint64_t size,
      const WriteOptions& opts) override;
  Result<std::vector<uint8_t>> GetObject(const ObjectLocator& source) override;
  Result<void> CopyObject(
      const ObjectLocator& source, const ObjectLocator& dest,
      const WriteOptions& opts) override;
  Result<std::vector<MultipartTransaction>> ListMultipartTransactions(
      const ObjectLocator& locator) override;

private:
  std::shared_ptr<MemoryObjectStore> store_;
};

class S3MP_EXPORT MemoryStorageProvider : public StorageProvider {
public:
  explicit MemoryStorageProvider(std::shared_ptr<MemoryObjectStore> store)
      : store_(std::move(store)) {}

  Result<std::unique_ptr<StorageClient>> Connect() override;

  std::string_view scheme() const override {
    return ObjectLocator::kMemoryScheme;
  }

  /// FailConnects makes the next count calls to Connect fail
  void FailConnects(uint32_t count) { failing_connects_ = count; }

  uint32_t num_connections() const { return num_connections_; }

  const std::shared_ptr<MemoryObjectStore>& store() const { return store_; }

private:
  std::shared_ptr<MemoryObjectStore> store_;
  std::atomic<uint32_t> num_connections_{0};
  std::atomic<uint32_t> failing_connects_{0};
};

}  // namespace s3mp

#endif
