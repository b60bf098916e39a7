#include "s3mp/TransferWorkerPool.h"

#include <algorithm>
#include <thread>

#include <fmt/format.h>

#include "s3mp/Logging.h"
#include "s3mp/Time.h"

std::vector<s3mp::PartResult>
s3mp::TransferWorkerPool::Run(
    const std::vector<PartSpec>& parts, const PartHandler& handler) {
  return Run(parts, [&handler]() -> CopyableResult<PartHandler> {
    return handler;
  });
}

std::vector<s3mp::PartResult>
s3mp::TransferWorkerPool::Run(
    const std::vector<PartSpec>& parts, const HandlerFactory& make_handler) {
  std::vector<PartResult> results;
  results.reserve(parts.size());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    next_part_ = 0;
    num_dropped_ = 0;
  }

  size_t num_workers = std::min<size_t>(concurrency_, parts.size());
  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  for (size_t i = 0; i < num_workers; ++i) {
    workers.emplace_back(
        [this, &parts, &make_handler, &results]() {
          Work(parts, make_handler, &results);
        });
  }
  for (std::thread& worker : workers) {
    worker.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  num_dropped_ = parts.size() - next_part_;
  S3MP_LOG_DEBUG_VASSERT(
      results.size() == next_part_, "dispatched {} parts but have {} results",
      next_part_, results.size());
  return results;
}

void
s3mp::TransferWorkerPool::Work(
    const std::vector<PartSpec>& parts, const HandlerFactory& make_handler,
    std::vector<PartResult>* results) {
  CopyableResult<PartHandler> handler_res = make_handler();

  for (;;) {
    const PartSpec* spec = nullptr;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (next_part_ >= parts.size()) {
        return;
      }
      if (cancel_ && cancel_->IsCancelled()) {
        return;
      }
      spec = &parts[next_part_++];
    }

    PartResult result;
    if (handler_res) {
      result = handler_res.value()(*spec);
    } else {
      result = PartResult::Failure(spec->part_index(), handler_res.error());
    }

    Report(result);

    std::lock_guard<std::mutex> lock(mutex_);
    results->emplace_back(std::move(result));
  }
}

void
s3mp::TransferWorkerPool::Report(const PartResult& result) {
  if (!sink_) {
    return;
  }
  Tags tags{
      {"part", result.part_index},
      {"status", PartStatusName(result.status)},
      {"attempts", result.attempts_used},
      {"bytes", result.bytes_transferred},
      {"us", static_cast<uint64_t>(result.elapsed.count())},
  };
  if (result.succeeded()) {
    sink_->Emit(
        Verbosity::Verbose, "part.done",
        fmt::format(
            "finished part {} ({}) in {}", result.part_index,
            BytesToStr("{:.2f}{}", result.bytes_transferred),
            UsToStr("{:.2f}{}", result.elapsed.count())),
        tags);
    return;
  }
  std::string reason =
      result.error ? fmt::format("{}", *result.error) : std::string("unknown");
  sink_->Emit(
      Verbosity::Error, "part.failed",
      fmt::format(
          "part {} {} after {} attempts: {}", result.part_index,
          PartStatusName(result.status), result.attempts_used, reason),
      tags);
}
