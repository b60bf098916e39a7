#ifndef S3MP_LIBTRANSFER_S3MP_PART_H_
#define S3MP_LIBTRANSFER_S3MP_PART_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "s3mp/ObjectLocator.h"
#include "s3mp/PartPlanner.h"
#include "s3mp/Result.h"

namespace s3mp {

/// A PartSpec is one unit of work handed to the worker pool. For uploads and
/// downloads the local file offset equals range.start.
struct PartSpec {
  ByteRange range;
  /// Source object of a copy
  ObjectLocator source;
  /// Local file of an upload or download
  std::string local_path;

  uint32_t part_index() const { return range.part_index; }
  uint64_t size() const { return range.size(); }
};

enum class PartStatus {
  Succeeded,
  Failed,
  Cancelled,
};

inline const char*
PartStatusName(PartStatus status) {
  switch (status) {
  case PartStatus::Succeeded:
    return "succeeded";
  case PartStatus::Failed:
    return "failed";
  case PartStatus::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

/// A PartAck is the service's acknowledgement of an uploaded or copied part.
/// The tag must be echoed back when the transaction is finalized.
struct PartAck {
  uint32_t part_index{};
  std::string tag;
};

/// A PartResult is the outcome of a part after all of its attempts. Results
/// cross threads, so errors are held as CopyableErrorInfo.
struct PartResult {
  uint32_t part_index{};
  PartStatus status{PartStatus::Failed};
  uint32_t attempts_used{};
  std::chrono::microseconds elapsed{};
  uint64_t bytes_transferred{};
  /// Tag acknowledged by the service. Empty for downloads.
  std::string tag;
  std::optional<CopyableErrorInfo> error;

  bool succeeded() const { return status == PartStatus::Succeeded; }

  PartAck ack() const { return PartAck{part_index, tag}; }

  static PartResult Failure(
      uint32_t part_index, CopyableErrorInfo error,
      uint32_t attempts_used = 0) {
    PartResult res;
    res.part_index = part_index;
    res.status = error.error_code() == ErrorCode::Cancelled
                     ? PartStatus::Cancelled
                     : PartStatus::Failed;
    res.attempts_used = attempts_used;
    res.error = std::move(error);
    return res;
  }
};

}  // namespace s3mp

#endif
