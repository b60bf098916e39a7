#ifndef S3MP_LIBTRANSFER_S3MP_STORAGECLIENT_H_
#define S3MP_LIBTRANSFER_S3MP_STORAGECLIENT_H_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "s3mp/ObjectLocator.h"
#include "s3mp/Part.h"
#include "s3mp/PartPlanner.h"
#include "s3mp/Result.h"
#include "s3mp/config.h"

namespace s3mp {

struct ObjectInfo {
  uint64_t size{};
  std::string tag;
};

/// Options applied to objects written by a transfer
struct WriteOptions {
  bool reduced_redundancy{false};
  std::string content_type{"application/octet-stream"};
};

/// An incomplete multipart transaction as reported by the service
struct MultipartTransaction {
  std::string transaction_id;
  std::string key;
  std::string initiator;
  std::string started_at;
};

/// A StorageClient is a connection to an object store.
///
/// A client is used by one thread at a time; each worker of a transfer gets
/// its own client from a StorageProvider. All operations are idempotent with
/// respect to their arguments so that failed attempts can be retried.
///
/// Errors are classified so that callers can decide whether to retry:
/// ErrorCode::TransientTransferError for timeouts, throttling and connection
/// failures; ErrorCode::NotFound for missing objects and unknown transaction
/// ids; ErrorCode::StorageError for other service errors.
class S3MP_EXPORT StorageClient {
public:
  virtual ~StorageClient() = default;
  StorageClient() = default;
  StorageClient(const StorageClient&) = delete;
  StorageClient(StorageClient&&) = delete;
  StorageClient& operator=(const StorageClient&) = delete;
  StorageClient& operator=(StorageClient&&) = delete;

  /// HeadObject returns the size of an object.
  /// \return ErrorCode::NotFound if the object does not exist
  virtual Result<ObjectInfo> HeadObject(const ObjectLocator& object) = 0;

  /// InitiateMultipart opens a multipart transaction and returns its id
  virtual Result<std::string> InitiateMultipart(
      const ObjectLocator& dest, const WriteOptions& opts) = 0;

  /// UploadPart stores size bytes from data as part part_index of a
  /// transaction and returns the service's tag for the part
  virtual Result<std::string> UploadPart(
      const ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, const uint8_t* data, uint64_t size) = 0;

  /// CopyPart stores a byte range of another object as part part_index of a
  /// transaction without moving the data through this process
  virtual Result<std::string> CopyPart(
      const ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, const ObjectLocator& source,
      const ByteRange& range) = 0;

  /// CompleteMultipart assembles the parts in part index order into the
  /// destination object
  virtual Result<void> CompleteMultipart(
      const ObjectLocator& dest, const std::string& transaction_id,
      const std::vector<PartAck>& parts) = 0;

  /// AbortMultipart discards a transaction and its parts
  virtual Result<void> AbortMultipart(
      const ObjectLocator& dest, const std::string& transaction_id) = 0;

  /// GetRange reads the bytes of range into data, which must hold
  /// range.size() bytes
  virtual Result<void> GetRange(
      const ObjectLocator& source, const ByteRange& range, uint8_t* data) = 0;

  virtual Result<void> PutObject(
      const ObjectLocator& dest, const uint8_t* data, uint64_t size,
      const WriteOptions& opts) = 0;

  virtual Result<std::vector<uint8_t>> GetObject(
      const ObjectLocator& source) = 0;

  /// CopyObject copies a whole object with one server-side call
  virtual Result<void> CopyObject(
      const ObjectLocator& source, const ObjectLocator& dest,
      const WriteOptions& opts) = 0;

  /// ListMultipartTransactions returns the incomplete transactions in the
  /// container of locator whose keys start with locator.key()
  virtual Result<std::vector<MultipartTransaction>> ListMultipartTransactions(
      const ObjectLocator& locator) = 0;
};

/// A StorageProvider hands out independent clients for one object store
class S3MP_EXPORT StorageProvider {
public:
  virtual ~StorageProvider() = default;

  /// Connect returns a new client. Clients are not shared between threads.
  virtual Result<std::unique_ptr<StorageClient>> Connect() = 0;

  /// scheme is the URI scheme of the locators this provider accepts
  virtual std::string_view scheme() const = 0;
};

}  // namespace s3mp

#endif
