#include "s3mp/PartPlanner.h"

#include <algorithm>

#include "s3mp/ErrorCode.h"

namespace {

uint64_t
DivideRoundingUp(uint64_t num, uint64_t denom) {
  return num / denom + (num % denom != 0 ? 1 : 0);
}

}  // namespace

s3mp::Result<s3mp::TransferPlan>
s3mp::PlanParts(
    uint64_t total_size, uint64_t target_part_size, uint64_t min_part_size,
    uint64_t direct_threshold) {
  if (total_size == 0) {
    return S3MP_ERROR(ErrorCode::PlanningError, "cannot plan an empty object");
  }
  if (min_part_size == 0) {
    return S3MP_ERROR(
        ErrorCode::PlanningError, "minimum part size must be positive");
  }
  if (target_part_size < min_part_size) {
    return S3MP_ERROR(
        ErrorCode::PlanningError,
        "part size {} is below the minimum part size {}", target_part_size,
        min_part_size);
  }

  TransferPlan plan;
  plan.total_size = total_size;

  if (total_size < direct_threshold) {
    plan.part_size = total_size;
    plan.direct = true;
    plan.parts.emplace_back(ByteRange{1, 0, total_size - 1});
    return plan;
  }

  uint64_t part_size = std::max(min_part_size, target_part_size);
  if (DivideRoundingUp(total_size, part_size) > kMaxPartCount) {
    part_size = DivideRoundingUp(total_size, kMaxPartCount);
  }
  plan.part_size = part_size;

  uint64_t num_parts = DivideRoundingUp(total_size, part_size);
  plan.parts.reserve(num_parts);
  for (uint64_t i = 0; i < num_parts; ++i) {
    uint64_t start = i * part_size;
    uint64_t end = std::min(start + part_size - 1, total_size - 1);
    plan.parts.emplace_back(
        ByteRange{static_cast<uint32_t>(i + 1), start, end});
  }

  if (plan.parts.size() > 1 && plan.parts.back().size() < min_part_size) {
    uint64_t end = plan.parts.back().end;
    plan.parts.pop_back();
    plan.parts.back().end = end;
    plan.fold_last_part = true;
  }

  return plan;
}
