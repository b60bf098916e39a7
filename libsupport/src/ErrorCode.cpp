#include "s3mp/ErrorCode.h"

s3mp::internal::ErrorCodeCategory::~ErrorCodeCategory() = default;

const s3mp::internal::ErrorCodeCategory&
s3mp::internal::GetErrorCodeCategory() {
  static ErrorCodeCategory c;
  return c;
}
