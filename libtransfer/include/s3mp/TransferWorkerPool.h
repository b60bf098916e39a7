#ifndef S3MP_LIBTRANSFER_S3MP_TRANSFERWORKERPOOL_H_
#define S3MP_LIBTRANSFER_S3MP_TRANSFERWORKERPOOL_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "s3mp/CancellationToken.h"
#include "s3mp/EventSink.h"
#include "s3mp/Part.h"
#include "s3mp/Result.h"
#include "s3mp/config.h"

namespace s3mp {

/// A TransferWorkerPool runs part transfers on a fixed number of threads.
///
/// Parts are taken from a shared queue in submission order; results are
/// returned in completion order. At most concurrency() parts are in flight at
/// once.
///
/// Each worker builds its own PartHandler with the HandlerFactory before
/// taking parts, so that per worker state (a storage client, an open file, a
/// buffer) is never shared between threads. If the factory fails, the worker
/// still drains the queue and reports every part it takes as failed with the
/// factory's error.
///
/// Once the cancellation token fires no further parts are dispatched. Parts
/// already running finish (their handler observes the token through its
/// RetryPolicy), and undispatched parts are counted by num_dropped().
class S3MP_EXPORT TransferWorkerPool {
public:
  using PartHandler = std::function<PartResult(const PartSpec&)>;
  using HandlerFactory = std::function<CopyableResult<PartHandler>()>;

  TransferWorkerPool(
      uint32_t concurrency, EventSink* sink = nullptr,
      const CancellationToken* cancel = nullptr)
      : concurrency_(concurrency < 1 ? 1 : concurrency),
        sink_(sink),
        cancel_(cancel) {}

  TransferWorkerPool(const TransferWorkerPool&) = delete;
  TransferWorkerPool& operator=(const TransferWorkerPool&) = delete;

  /// Run transfers every part and blocks until the queue is drained
  std::vector<PartResult> Run(
      const std::vector<PartSpec>& parts, const HandlerFactory& make_handler);

  /// Run with one handler shared by all workers; handler must be thread-safe
  std::vector<PartResult> Run(
      const std::vector<PartSpec>& parts, const PartHandler& handler);

  uint32_t concurrency() const { return concurrency_; }

  /// num_dropped is the number of parts of the last Run that were never
  /// dispatched because of cancellation
  uint64_t num_dropped() const { return num_dropped_; }

private:
  void Work(
      const std::vector<PartSpec>& parts, const HandlerFactory& make_handler,
      std::vector<PartResult>* results);

  void Report(const PartResult& result);

  uint32_t concurrency_;
  EventSink* sink_;
  const CancellationToken* cancel_;

  std::mutex mutex_;
  size_t next_part_{0};
  uint64_t num_dropped_{0};
};

}  // namespace s3mp

#endif
