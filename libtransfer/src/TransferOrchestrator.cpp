#include "s3mp/TransferOrchestrator.h"

#include <memory>

#include <fmt/format.h>

#include "s3mp/ErrorCode.h"
#include "s3mp/LocalFile.h"
#include "s3mp/Logging.h"
#include "s3mp/Time.h"

namespace {

/// RunPart runs op for one part through the retry policy and records the
/// outcome. op returns the service's tag for the part.
template <typename Op>
s3mp::PartResult
RunPart(const s3mp::PartSpec& spec, const s3mp::RetryPolicy& retry, Op&& op) {
  auto begin = s3mp::Now();
  uint32_t attempts = 0;
  auto res = retry.Execute(spec.part_index(), op, &attempts);
  auto elapsed = std::chrono::microseconds(s3mp::UsSince(begin));

  if (!res) {
    s3mp::PartResult failed = s3mp::PartResult::Failure(
        spec.part_index(), s3mp::CopyableErrorInfo(res.error()), attempts);
    failed.elapsed = elapsed;
    return failed;
  }

  s3mp::PartResult result;
  result.part_index = spec.part_index();
  result.status = s3mp::PartStatus::Succeeded;
  result.attempts_used = attempts;
  result.elapsed = elapsed;
  result.bytes_transferred = spec.size();
  result.tag = std::move(res.value());
  return result;
}

s3mp::Result<void>
SyncLocalFile(const std::string& path) {
  s3mp::LocalFile file = S3MP_CHECKED(s3mp::LocalFile::OpenForWrite(path));
  return file.Sync();
}

}  // namespace

double
s3mp::TransferSummary::throughput() const {
  return Throughput(total_bytes, elapsed.count());
}

s3mp::TransferOrchestrator::TransferOrchestrator(
    StorageProvider* provider, TransferConfig config, EventSink* sink,
    CancellationToken* cancel)
    : provider_(provider),
      config_(std::move(config)),
      sink_(sink),
      cancel_(cancel) {
  if (!sink_) {
    sink_ = &null_sink_;
  }
}

s3mp::RetryPolicy
s3mp::TransferOrchestrator::MakeRetryPolicy() const {
  return RetryPolicy(config_.max_attempts, config_.backoff, cancel_, sink_);
}

s3mp::WriteOptions
s3mp::TransferOrchestrator::write_options() const {
  WriteOptions opts;
  opts.reduced_redundancy = config_.reduced_redundancy;
  return opts;
}

s3mp::Result<s3mp::TransferSummary>
s3mp::TransferOrchestrator::Transfer(
    const ObjectLocator& source, const ObjectLocator& destination,
    TransferMode mode) {
  Tags tags{
      {"mode", TransferModeName(mode)},
      {"source", source.string()},
      {"dest", destination.string()},
  };
  sink_->Emit(
      Verbosity::Info, "transfer.start",
      fmt::format("{} {} to {}", TransferModeName(mode), source, destination),
      tags);

  auto res = TransferObject(source, destination, mode);
  if (!res) {
    sink_->Emit(
        Verbosity::Error, "transfer.failed",
        fmt::format(
            "{} of {} failed: {}", TransferModeName(mode), source, res.error()),
        tags);
    return res.error();
  }

  const TransferSummary& summary = res.value();
  tags.emplace_back("bytes", summary.total_bytes);
  tags.emplace_back("parts", summary.num_parts);
  tags.emplace_back("direct", summary.direct);
  tags.emplace_back("us", static_cast<uint64_t>(summary.elapsed.count()));
  sink_->Emit(
      Verbosity::Info, "transfer.done",
      fmt::format(
          "finished {} of {} in {} ({}/s)", TransferModeName(mode),
          BytesToStr("{:.2f}{}", summary.total_bytes),
          UsToStr("{:.2f}{}", summary.elapsed.count()),
          BytesToStr(
              "{:.2f}{}", static_cast<uint64_t>(summary.throughput()))),
      tags);
  return res;
}

s3mp::Result<s3mp::TransferSummary>
s3mp::TransferOrchestrator::TransferObject(
    const ObjectLocator& source, const ObjectLocator& destination,
    TransferMode mode) {
  auto begin = Now();

  S3MP_CHECKED(config_.Validate());
  S3MP_CHECKED(CheckLocators(source, destination, mode));

  if (cancel_ && config_.timeout.count() > 0) {
    cancel_->SetTimeout(config_.timeout);
  }

  std::unique_ptr<StorageClient> client = S3MP_CHECKED_CONTEXT(
      provider_->Connect(), "connecting to {} storage", provider_->scheme());

  uint64_t size = S3MP_CHECKED(
      CheckPreconditions(client.get(), source, destination, mode));

  TransferSummary summary;
  summary.mode = mode;
  summary.source = source;
  summary.destination = destination;
  summary.total_bytes = size;

  // Empty objects cannot be split into parts
  if (size == 0 || size < config_.DirectThreshold(mode)) {
    summary.direct = true;
    summary.num_parts = 1;
    S3MP_CHECKED(DirectTransfer(client.get(), source, destination, mode, size));
    summary.elapsed = std::chrono::microseconds(UsSince(begin));
    return summary;
  }

  TransferPlan plan = S3MP_CHECKED(PlanParts(
      size, config_.part_size, config_.min_part_size,
      config_.DirectThreshold(mode)));
  summary.num_parts = plan.parts.size();

  sink_->Emit(
      Verbosity::Verbose, "transfer.plan",
      fmt::format(
          "{} parts of {} bytes{}", plan.parts.size(), plan.part_size,
          plan.fold_last_part ? ", last part folded" : ""),
      Tags{
          {"parts", static_cast<uint64_t>(plan.parts.size())},
          {"part_size", plan.part_size},
          {"folded", plan.fold_last_part},
          {"concurrency", config_.concurrency},
      });

  if (mode == TransferMode::Download) {
    S3MP_CHECKED(DownloadParts(source, destination, plan));
  } else {
    S3MP_CHECKED(MultipartTransfer(
        client.get(), source, destination, mode, plan,
        &summary.transaction_id));
  }

  summary.elapsed = std::chrono::microseconds(UsSince(begin));
  return summary;
}

s3mp::Result<void>
s3mp::TransferOrchestrator::CheckLocators(
    const ObjectLocator& source, const ObjectLocator& destination,
    TransferMode mode) const {
  bool local_source = mode == TransferMode::Upload;
  bool local_dest = mode == TransferMode::Download;

  if (source.is_local() != local_source) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError, "{} source must be {}: {}",
        TransferModeName(mode), local_source ? "a local file" : "an object",
        source);
  }
  if (destination.is_local() != local_dest) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError, "{} destination must be {}: {}",
        TransferModeName(mode), local_dest ? "a local file" : "an object",
        destination);
  }

  for (const ObjectLocator* loc : {&source, &destination}) {
    if (!loc->is_local() && loc->store() != provider_->scheme()) {
      return S3MP_ERROR(
          ErrorCode::PreconditionError, "{} is not a {}:// location", *loc,
          provider_->scheme());
    }
  }

  if (source == destination) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError, "source and destination are both {}",
        source);
  }
  return ResultSuccess();
}

s3mp::Result<uint64_t>
s3mp::TransferOrchestrator::CheckPreconditions(
    StorageClient* client, const ObjectLocator& source,
    const ObjectLocator& destination, TransferMode mode) const {
  uint64_t size{};

  if (source.is_local()) {
    auto size_res = LocalFile::Size(source.key());
    if (!size_res) {
      if (size_res.error() == ErrorCode::NotFound) {
        return size_res.error().WithContext(
            ErrorCode::PreconditionError, "source {} does not exist", source);
      }
      return size_res.error();
    }
    size = size_res.value();
  } else {
    auto head_res = client->HeadObject(source);
    if (!head_res) {
      if (head_res.error() == ErrorCode::NotFound) {
        return head_res.error().WithContext(
            ErrorCode::PreconditionError, "source {} does not exist", source);
      }
      return head_res.error().WithContext("checking source {}", source);
    }
    size = head_res.value().size;
  }

  if (config_.force) {
    return size;
  }

  if (destination.is_local()) {
    if (LocalFile::Exists(destination.key())) {
      return S3MP_ERROR(
          ErrorCode::PreconditionError,
          "destination {} already exists (use force to overwrite)",
          destination);
    }
    return size;
  }

  auto head_res = client->HeadObject(destination);
  if (head_res) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError,
        "destination {} already exists (use force to overwrite)", destination);
  }
  if (head_res.error() != ErrorCode::NotFound) {
    return head_res.error().WithContext(
        "checking destination {}", destination);
  }
  return size;
}

s3mp::Result<void>
s3mp::TransferOrchestrator::DirectTransfer(
    StorageClient* client, const ObjectLocator& source,
    const ObjectLocator& destination, TransferMode mode, uint64_t size) {
  sink_->Emit(
      Verbosity::Verbose, "transfer.direct",
      fmt::format("{} bytes in a single request", size),
      Tags{{"bytes", size}});

  RetryPolicy retry = MakeRetryPolicy();
  WriteOptions opts = write_options();

  switch (mode) {
  case TransferMode::Upload: {
    LocalFile file = S3MP_CHECKED(LocalFile::OpenForRead(source.key()));
    std::vector<uint8_t> buf(size);
    return retry.Execute(1, [&]() -> Result<void> {
      S3MP_CHECKED(file.ReadAt(0, buf.data(), size));
      return client->PutObject(destination, buf.data(), size, opts);
    });
  }
  case TransferMode::Download: {
    const std::string& path = destination.key();
    auto res = retry.Execute(1, [&]() -> Result<void> {
      std::vector<uint8_t> data = S3MP_CHECKED(client->GetObject(source));
      S3MP_CHECKED(LocalFile::Create(path, data.size()));
      LocalFile file = S3MP_CHECKED(LocalFile::OpenForWrite(path));
      S3MP_CHECKED(file.WriteAt(0, data.data(), data.size()));
      return file.Sync();
    });
    if (!res) {
      CopyableErrorInfo failure(res.error());
      if (auto rm_res = LocalFile::Remove(path); !rm_res) {
        S3MP_LOG_WARN("leaving partial file {}: {}", path, rm_res.error());
      }
      return ErrorInfo(failure);
    }
    return ResultSuccess();
  }
  case TransferMode::Copy:
    return retry.Execute(
        1, [&]() { return client->CopyObject(source, destination, opts); });
  }
  return S3MP_ERROR(ErrorCode::InvalidArgument, "unknown transfer mode");
}

std::vector<s3mp::PartSpec>
s3mp::TransferOrchestrator::MakeParts(
    const TransferPlan& plan, const ObjectLocator& source,
    const std::string& local_path) const {
  std::vector<PartSpec> parts;
  parts.reserve(plan.parts.size());
  for (const ByteRange& range : plan.parts) {
    PartSpec spec;
    spec.range = range;
    if (!source.is_local()) {
      spec.source = source;
    }
    spec.local_path = local_path;
    parts.emplace_back(std::move(spec));
  }
  return parts;
}

s3mp::Result<void>
s3mp::TransferOrchestrator::CheckResults(
    const std::vector<PartResult>& results, uint64_t num_parts,
    uint64_t num_dropped) const {
  uint64_t num_succeeded = 0;
  uint64_t num_cancelled = 0;
  const PartResult* first_failure = nullptr;
  for (const PartResult& result : results) {
    switch (result.status) {
    case PartStatus::Succeeded:
      ++num_succeeded;
      break;
    case PartStatus::Cancelled:
      ++num_cancelled;
      break;
    case PartStatus::Failed:
      if (!first_failure || result.part_index < first_failure->part_index) {
        first_failure = &result;
      }
      break;
    }
  }

  if (num_succeeded == num_parts) {
    return ResultSuccess();
  }

  if (first_failure) {
    std::string reason = first_failure->error
                             ? fmt::format("{}", *first_failure->error)
                             : std::string("unknown error");
    return S3MP_ERROR(
        ErrorCode::PartTransferFailed,
        "{} of {} parts failed, first part {}: {}",
        results.size() - num_succeeded - num_cancelled, num_parts,
        first_failure->part_index, reason);
  }

  if (num_dropped > 0 || num_cancelled > 0) {
    return S3MP_ERROR(
        ErrorCode::Cancelled,
        "transfer cancelled with {} of {} parts done ({} not started)",
        num_succeeded, num_parts, num_dropped);
  }

  return S3MP_ERROR(
      ErrorCode::InvalidState, "{} of {} parts reported", results.size(),
      num_parts);
}

s3mp::TransferWorkerPool::HandlerFactory
s3mp::TransferOrchestrator::MakeUploadHandler(
    const std::string& transaction_id, const ObjectLocator& destination,
    const std::string& path) {
  return [this, transaction_id, destination,
          path]() -> CopyableResult<TransferWorkerPool::PartHandler> {
    auto client_res = provider_->Connect();
    if (!client_res) {
      return CopyableErrorInfo(client_res.error());
    }
    std::shared_ptr<StorageClient> client = std::move(client_res.value());

    auto file_res = LocalFile::OpenForRead(path);
    if (!file_res) {
      return CopyableErrorInfo(file_res.error());
    }
    auto file = std::make_shared<LocalFile>(std::move(file_res.value()));
    auto buffer = std::make_shared<std::vector<uint8_t>>();
    RetryPolicy retry = MakeRetryPolicy();

    return TransferWorkerPool::PartHandler(
        [client, file, buffer, retry, transaction_id,
         destination](const PartSpec& spec) {
          return RunPart(spec, retry, [&]() -> Result<std::string> {
            // Re-read the part on every attempt
            buffer->resize(spec.size());
            S3MP_CHECKED(
                file->ReadAt(spec.range.start, buffer->data(), spec.size()));
            return client->UploadPart(
                destination, transaction_id, spec.part_index(),
                buffer->data(), spec.size());
          });
        });
  };
}

s3mp::TransferWorkerPool::HandlerFactory
s3mp::TransferOrchestrator::MakeCopyHandler(
    const std::string& transaction_id, const ObjectLocator& destination) {
  return [this, transaction_id,
          destination]() -> CopyableResult<TransferWorkerPool::PartHandler> {
    auto client_res = provider_->Connect();
    if (!client_res) {
      return CopyableErrorInfo(client_res.error());
    }
    std::shared_ptr<StorageClient> client = std::move(client_res.value());
    RetryPolicy retry = MakeRetryPolicy();

    return TransferWorkerPool::PartHandler(
        [client, retry, transaction_id, destination](const PartSpec& spec) {
          return RunPart(spec, retry, [&]() {
            return client->CopyPart(
                destination, transaction_id, spec.part_index(), spec.source,
                spec.range);
          });
        });
  };
}

s3mp::TransferWorkerPool::HandlerFactory
s3mp::TransferOrchestrator::MakeDownloadHandler(
    const ObjectLocator& source, const std::string& path) {
  return [this, source,
          path]() -> CopyableResult<TransferWorkerPool::PartHandler> {
    auto client_res = provider_->Connect();
    if (!client_res) {
      return CopyableErrorInfo(client_res.error());
    }
    std::shared_ptr<StorageClient> client = std::move(client_res.value());

    auto file_res = LocalFile::OpenForWrite(path);
    if (!file_res) {
      return CopyableErrorInfo(file_res.error());
    }
    auto file = std::make_shared<LocalFile>(std::move(file_res.value()));
    auto buffer = std::make_shared<std::vector<uint8_t>>();
    RetryPolicy retry = MakeRetryPolicy();

    return TransferWorkerPool::PartHandler(
        [client, file, buffer, retry, source](const PartSpec& spec) {
          return RunPart(spec, retry, [&]() -> Result<std::string> {
            // A retried part overwrites the same range of the file
            buffer->resize(spec.size());
            S3MP_CHECKED(client->GetRange(source, spec.range, buffer->data()));
            S3MP_CHECKED(
                file->WriteAt(spec.range.start, buffer->data(), spec.size()));
            return std::string();
          });
        });
  };
}

s3mp::Result<void>
s3mp::TransferOrchestrator::MultipartTransfer(
    StorageClient* client, const ObjectLocator& source,
    const ObjectLocator& destination, TransferMode mode,
    const TransferPlan& plan, std::string* transaction_id) {
  MultipartSession session(client, destination, write_options(), sink_);
  S3MP_CHECKED(session.Initiate());
  *transaction_id = session.transaction_id();

  std::string local_path = mode == TransferMode::Upload ? source.key() : "";
  std::vector<PartSpec> parts = MakeParts(plan, source, local_path);
  for (const PartSpec& spec : parts) {
    S3MP_CHECKED(session.Submit(spec.part_index()));
  }

  TransferWorkerPool::HandlerFactory factory =
      mode == TransferMode::Upload
          ? MakeUploadHandler(session.transaction_id(), destination, local_path)
          : MakeCopyHandler(session.transaction_id(), destination);

  TransferWorkerPool pool(config_.concurrency, sink_, cancel_);
  std::vector<PartResult> results = pool.Run(parts, factory);

  for (const PartResult& result : results) {
    S3MP_CHECKED(session.Acknowledge(result));
  }

  auto verdict = CheckResults(results, parts.size(), pool.num_dropped());
  if (!verdict) {
    CopyableErrorInfo failure(verdict.error());
    auto abort_res = session.Abort();
    if (!abort_res) {
      CopyableErrorInfo abort_failure(abort_res.error());
      return ErrorInfo(failure).WithContext(
          "transaction {} is left open ({})", session.transaction_id(),
          abort_failure);
    }
    return ErrorInfo(failure);
  }

  return session.Complete();
}

s3mp::Result<void>
s3mp::TransferOrchestrator::DownloadParts(
    const ObjectLocator& source, const ObjectLocator& destination,
    const TransferPlan& plan) {
  const std::string& path = destination.key();
  S3MP_CHECKED(LocalFile::Create(path, plan.total_size));

  std::vector<PartSpec> parts = MakeParts(plan, source, path);
  TransferWorkerPool pool(config_.concurrency, sink_, cancel_);
  std::vector<PartResult> results =
      pool.Run(parts, MakeDownloadHandler(source, path));

  auto verdict = CheckResults(results, parts.size(), pool.num_dropped());
  if (verdict) {
    verdict = SyncLocalFile(path);
  }
  if (!verdict) {
    CopyableErrorInfo failure(verdict.error());
    if (auto rm_res = LocalFile::Remove(path); !rm_res) {
      S3MP_LOG_WARN("leaving partial file {}: {}", path, rm_res.error());
    }
    return ErrorInfo(failure);
  }
  return ResultSuccess();
}
