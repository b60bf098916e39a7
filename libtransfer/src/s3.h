#ifndef S3MP_LIBTRANSFER_S3_H_
#define S3MP_LIBTRANSFER_S3_H_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <aws/core/client/AWSError.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSString.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <fmt/format.h>

#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"
#include "s3mp/Result.h"

namespace s3mp {

constexpr const char* kAwsTag = "S3mpS3Client";

/// GetS3Client returns a configured S3 client.
///
/// The client pulls its configuration from the environment using the same
/// environment variables and configuration paths as the AWS CLI, although with
/// a subset of the configurability.
///
/// The AWS region is determined by:
///
/// 1. The region associated with the default profile in $HOME/.aws/config The
///    location configuration file can be overriden by env[AWS_CONFIG_FILE].
/// 2. Otherwise, env[AWS_DEFAULT_REGION]
/// 3. Otherwise, us-east-1
///
/// The credentials are determined by (in order of precedence):
///
/// 1. The environment variables AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
/// 2. The credentials associcated with the default profile in
/// $HOME/.aws/credentials
/// 3. An external credential provider command as noted in the config file.
/// 4. STS assume role credenials
/// 5. IAM roles for tasks (containers)
/// 6. The machine's account (via EC2 metadata service) if on EC2
std::shared_ptr<Aws::S3::S3Client> GetS3Client();

/* Utility functions for converting between Aws::String and std::string */
inline std::string_view
FromAwsString(const Aws::String& s) {
  return {s.data(), s.size()};
}
inline Aws::String
ToAwsString(std::string_view s) {
  return Aws::String(s.data(), s.size());
}

/// S3RangeHeader renders an inclusive byte range as an HTTP Range value
inline Aws::String
S3RangeHeader(uint64_t start, uint64_t end) {
  return ToAwsString(fmt::format("bytes={}-{}", start, end));
}

/// CheckS3Error classifies a failed request so that callers can decide
/// whether to retry it
template <class OutcomeType>
Result<void>
CheckS3Error(const OutcomeType& outcome, std::string_view what) {
  if (outcome.IsSuccess()) {
    return ResultSuccess();
  }
  const auto& error = outcome.GetError();
  auto code = static_cast<int>(error.GetResponseCode());
  if (error.GetResponseCode() ==
      Aws::Http::HttpResponseCode::MOVED_PERMANENTLY) {
    return S3MP_ERROR(
        ErrorCode::AWSWrongRegion, "{}: bucket is in another region", what);
  }
  if (error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND ||
      error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY ||
      error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_UPLOAD ||
      error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_BUCKET) {
    return S3MP_ERROR(ErrorCode::NotFound, "{}: not found ({})", what, code);
  }
  if (error.ShouldRetry()) {
    return S3MP_ERROR(
        ErrorCode::TransientTransferError, "{}: {} {}: {}", what, code,
        FromAwsString(error.GetExceptionName()),
        FromAwsString(error.GetMessage()));
  }
  return S3MP_ERROR(
      ErrorCode::StorageError, "{}: {} {}: {}", what, code,
      FromAwsString(error.GetExceptionName()),
      FromAwsString(error.GetMessage()));
}

}  // namespace s3mp

#endif
