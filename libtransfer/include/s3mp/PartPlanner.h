#ifndef S3MP_LIBTRANSFER_S3MP_PARTPLANNER_H_
#define S3MP_LIBTRANSFER_S3MP_PARTPLANNER_H_

#include <cstdint>
#include <ostream>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "s3mp/Result.h"
#include "s3mp/config.h"

namespace s3mp {

constexpr uint64_t
MiB(uint64_t n) {
  return n << 20;
}

constexpr uint64_t
GiB(uint64_t n) {
  return n << 30;
}

// Limits come from here.
//   https://docs.aws.amazon.com/AmazonS3/latest/dev/qfacts.html
constexpr uint64_t kMinPartSize = MiB(5);
constexpr uint64_t kMaxPartSize = GiB(5);
constexpr uint64_t kMaxPartCount = 10000;
// Objects up to this size can be copied with a single server-side call
constexpr uint64_t kMaxSingleCopySize = GiB(5);

/// A ByteRange is an inclusive [start, end] span of an object. Part indexes
/// start at 1.
struct ByteRange {
  uint32_t part_index{};
  uint64_t start{};
  uint64_t end{};

  uint64_t size() const { return end - start + 1; }

  bool operator==(const ByteRange& other) const {
    return part_index == other.part_index && start == other.start &&
           end == other.end;
  }
};

inline std::ostream&
operator<<(std::ostream& out, const ByteRange& range) {
  return out << "part " << range.part_index << " [" << range.start << ", "
             << range.end << "]";
}

struct TransferPlan {
  uint64_t total_size{};
  uint64_t part_size{};
  std::vector<ByteRange> parts;
  /// true if an undersized trailing range was merged into its predecessor
  bool fold_last_part{false};
  /// true if the object is small enough to move with one whole-object call
  bool direct{false};
};

/// PlanParts splits an object of total_size bytes into contiguous ranges of
/// target_part_size bytes.
///
/// If the trailing range would be shorter than min_part_size it is folded
/// into the previous range, so every range but a lone first range is at least
/// min_part_size long. If more than kMaxPartCount ranges would result, the
/// part size grows until the plan fits.
///
/// Objects smaller than direct_threshold get a single range and
/// TransferPlan::direct set.
///
/// \return ErrorCode::PlanningError if total_size is zero or
///   target_part_size < min_part_size
S3MP_EXPORT Result<TransferPlan> PlanParts(
    uint64_t total_size, uint64_t target_part_size,
    uint64_t min_part_size = kMinPartSize, uint64_t direct_threshold = 0);

}  // namespace s3mp

#if FMT_VERSION >= 90000
template <>
struct fmt::formatter<s3mp::ByteRange> : ostream_formatter {};
#endif

#endif
