#ifndef S3MP_LIBTRANSFER_S3MP_TRANSFERCONFIG_H_
#define S3MP_LIBTRANSFER_S3MP_TRANSFERCONFIG_H_

#include <chrono>
#include <cstdint>
#include <string>

#include "s3mp/PartPlanner.h"
#include "s3mp/Result.h"
#include "s3mp/config.h"

namespace s3mp {

enum class TransferMode {
  Upload,
  Download,
  Copy,
};

S3MP_EXPORT const char* TransferModeName(TransferMode mode);

/// TransferConfig holds the tunables of a transfer. Values are resolved in
/// order: built-in defaults, environment variables (see FromEnv), then
/// command line flags.
struct S3MP_EXPORT TransferConfig {
  static constexpr uint32_t kDefaultConcurrency = 2;
  static constexpr uint64_t kDefaultPartSize = MiB(50);
  static constexpr uint32_t kDefaultMaxAttempts = 3;
  static constexpr std::chrono::milliseconds kDefaultBackoff{1000};

  uint32_t concurrency{kDefaultConcurrency};
  uint64_t part_size{kDefaultPartSize};
  uint64_t min_part_size{kMinPartSize};
  /// Objects smaller than this move with one whole-object call. Zero selects
  /// the per-mode default (see DirectThreshold).
  uint64_t direct_threshold{0};
  /// Total attempts per part, including the first
  uint32_t max_attempts{kDefaultMaxAttempts};
  std::chrono::milliseconds backoff{kDefaultBackoff};
  /// Zero disables the timeout
  std::chrono::seconds timeout{0};
  /// Overwrite an existing destination
  bool force{false};
  bool reduced_redundancy{false};

  /// FromEnv returns the defaults overridden by S3MP_CONCURRENCY,
  /// S3MP_PART_SIZE_MB, S3MP_MAX_ATTEMPTS, S3MP_BACKOFF_MS and S3MP_TIMEOUT_S
  static TransferConfig FromEnv();

  /// Validate checks that the config describes a runnable transfer
  /// \return ErrorCode::InvalidArgument naming the first bad field
  Result<void> Validate() const;

  /// DirectThreshold is the size below which a transfer in mode skips
  /// multipart handling: the part size for uploads and downloads, the
  /// service's single-copy limit for copies
  uint64_t DirectThreshold(TransferMode mode) const;
};

}  // namespace s3mp

#endif
