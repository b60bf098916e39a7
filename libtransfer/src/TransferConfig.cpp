#include "s3mp/TransferConfig.h"

#include "s3mp/Env.h"
#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"

const char*
s3mp::TransferModeName(TransferMode mode) {
  switch (mode) {
  case TransferMode::Upload:
    return "upload";
  case TransferMode::Download:
    return "download";
  case TransferMode::Copy:
    return "copy";
  }
  return "unknown";
}

s3mp::TransferConfig
s3mp::TransferConfig::FromEnv() {
  TransferConfig config;

  uint64_t value{};
  if (GetEnv("S3MP_CONCURRENCY", &value)) {
    config.concurrency = static_cast<uint32_t>(value);
  }
  if (GetEnv("S3MP_PART_SIZE_MB", &value)) {
    config.part_size = MiB(value);
  }
  if (GetEnv("S3MP_MAX_ATTEMPTS", &value)) {
    config.max_attempts = static_cast<uint32_t>(value);
  }
  if (GetEnv("S3MP_BACKOFF_MS", &value)) {
    config.backoff = std::chrono::milliseconds(value);
  }
  if (GetEnv("S3MP_TIMEOUT_S", &value)) {
    config.timeout = std::chrono::seconds(value);
  }

  return config;
}

s3mp::Result<void>
s3mp::TransferConfig::Validate() const {
  if (concurrency == 0) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "concurrency must be at least 1");
  }
  if (max_attempts == 0) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "max attempts must be at least 1");
  }
  if (min_part_size == 0) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "minimum part size must be positive");
  }
  if (part_size < min_part_size) {
    return S3MP_ERROR(
        ErrorCode::PlanningError,
        "part size {} is below the minimum part size {}", part_size,
        min_part_size);
  }
  if (part_size > kMaxPartSize) {
    return S3MP_ERROR(
        ErrorCode::PlanningError,
        "part size {} is above the maximum part size {}", part_size,
        kMaxPartSize);
  }
  if (backoff.count() < 0) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "backoff must not be negative");
  }
  return ResultSuccess();
}

uint64_t
s3mp::TransferConfig::DirectThreshold(TransferMode mode) const {
  if (direct_threshold != 0) {
    return direct_threshold;
  }
  if (mode == TransferMode::Copy) {
    return kMaxSingleCopySize;
  }
  return part_size;
}
