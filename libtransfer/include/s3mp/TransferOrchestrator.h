#ifndef S3MP_LIBTRANSFER_S3MP_TRANSFERORCHESTRATOR_H_
#define S3MP_LIBTRANSFER_S3MP_TRANSFERORCHESTRATOR_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "s3mp/CancellationToken.h"
#include "s3mp/EventSink.h"
#include "s3mp/MultipartSession.h"
#include "s3mp/ObjectLocator.h"
#include "s3mp/Part.h"
#include "s3mp/PartPlanner.h"
#include "s3mp/Result.h"
#include "s3mp/RetryPolicy.h"
#include "s3mp/StorageClient.h"
#include "s3mp/TransferConfig.h"
#include "s3mp/TransferWorkerPool.h"
#include "s3mp/config.h"

namespace s3mp {

struct TransferSummary {
  TransferMode mode{TransferMode::Upload};
  ObjectLocator source;
  ObjectLocator destination;
  uint64_t total_bytes{};
  uint64_t num_parts{};
  bool direct{false};
  std::chrono::microseconds elapsed{};
  /// Empty for direct transfers and downloads
  std::string transaction_id;

  /// Bytes per second
  double throughput() const;
};

/// A TransferOrchestrator moves one object per call to Transfer:
///
/// 1. Check preconditions: the source exists, and the destination does not
///    unless TransferConfig::force is set. Nothing is created on failure.
/// 2. Objects below the direct threshold move with one whole-object call.
/// 3. Otherwise plan the parts, open a multipart session (uploads and
///    copies), run the parts on a TransferWorkerPool and finalize: complete
///    if every part succeeded, abort otherwise.
///
/// Downloads have no remote transaction. The destination file is created at
/// its final size before any part is fetched, and each worker writes to its
/// own descriptor at the part's offset. A failed or cancelled download
/// removes the file.
///
/// Progress and the final verdict are reported through the EventSink.
class S3MP_EXPORT TransferOrchestrator {
public:
  /// provider and sink must outlive the orchestrator. sink and cancel may
  /// be null.
  TransferOrchestrator(
      StorageProvider* provider, TransferConfig config, EventSink* sink,
      CancellationToken* cancel = nullptr);

  Result<TransferSummary> Transfer(
      const ObjectLocator& source, const ObjectLocator& destination,
      TransferMode mode);

  const TransferConfig& config() const { return config_; }

private:
  Result<TransferSummary> TransferObject(
      const ObjectLocator& source, const ObjectLocator& destination,
      TransferMode mode);

  Result<void> CheckLocators(
      const ObjectLocator& source, const ObjectLocator& destination,
      TransferMode mode) const;

  /// CheckPreconditions returns the size of the source
  Result<uint64_t> CheckPreconditions(
      StorageClient* client, const ObjectLocator& source,
      const ObjectLocator& destination, TransferMode mode) const;

  Result<void> DirectTransfer(
      StorageClient* client, const ObjectLocator& source,
      const ObjectLocator& destination, TransferMode mode, uint64_t size);

  Result<void> MultipartTransfer(
      StorageClient* client, const ObjectLocator& source,
      const ObjectLocator& destination, TransferMode mode,
      const TransferPlan& plan, std::string* transaction_id);

  Result<void> DownloadParts(
      const ObjectLocator& source, const ObjectLocator& destination,
      const TransferPlan& plan);

  TransferWorkerPool::HandlerFactory MakeUploadHandler(
      const std::string& transaction_id, const ObjectLocator& destination,
      const std::string& path);
  TransferWorkerPool::HandlerFactory MakeCopyHandler(
      const std::string& transaction_id, const ObjectLocator& destination);
  TransferWorkerPool::HandlerFactory MakeDownloadHandler(
      const ObjectLocator& source, const std::string& path);

  std::vector<PartSpec> MakeParts(
      const TransferPlan& plan, const ObjectLocator& source,
      const std::string& local_path) const;

  /// CheckResults turns the results of a pool run into a verdict
  Result<void> CheckResults(
      const std::vector<PartResult>& results, uint64_t num_parts,
      uint64_t num_dropped) const;

  RetryPolicy MakeRetryPolicy() const;

  WriteOptions write_options() const;

  StorageProvider* provider_;
  TransferConfig config_;
  EventSink* sink_;
  CancellationToken* cancel_;
  NullEventSink null_sink_;
};

}  // namespace s3mp

#endif
