#ifndef S3MP_LIBSUPPORT_S3MP_ERRORCODE_H_
#define S3MP_LIBSUPPORT_S3MP_ERRORCODE_H_

#include <string>
#include <system_error>

#include "s3mp/config.h"

/// Error codes follow the STL convention for portable error codes:
///
/// - An std::error_code is an integer (the error enum) plus a pointer to an
///   std::error_category.
/// - An std::error_condition models a general class of errors that callers
///   can portably compare against, e.g.,
///
///     if (error_code == std::errc::no_such_file_or_directory) { .... }
///
/// The codes below split into two groups. The first group is the transfer
/// taxonomy that callers are expected to branch on (e.g., a
/// TransientTransferError is retried, a PartTransferFailed is not). The second
/// group classifies failures of the collaborators (storage service, local
/// file system).
///
/// To add a code: extend the enum, give it a message and map it to an
/// std::error_condition in ErrorCodeCategory.
///
/// \file ErrorCode.h

namespace s3mp {

enum class ErrorCode {
  // It is probably a bug to return Success explicitly rather than using
  // something like ResultSuccess(). Comment it out to be safe.
  //
  // Success = 0,
  PlanningError = 1,
  TransientTransferError = 2,
  PartTransferFailed = 3,
  TransactionFinalizeError = 4,
  PreconditionError = 5,
  InvalidArgument = 6,
  NotImplemented = 7,
  NotFound = 8,
  AlreadyExists = 9,
  Cancelled = 10,
  InvalidState = 11,
  StorageError = 12,
  AWSWrongRegion = 13,
  LocalStorageError = 14,
  AssertionFailed = 15,
};

}  // namespace s3mp

namespace s3mp::internal {

class S3MP_EXPORT ErrorCodeCategory : public std::error_category {
public:
  ~ErrorCodeCategory() override;

  const char* name() const noexcept final { return "S3mpError"; }

  std::string message(int c) const final {
    switch (static_cast<ErrorCode>(c)) {
    case ErrorCode::PlanningError:
      return "invalid transfer plan";
    case ErrorCode::TransientTransferError:
      return "transient transfer error";
    case ErrorCode::PartTransferFailed:
      return "part transfer failed";
    case ErrorCode::TransactionFinalizeError:
      return "multipart transaction could not be finalized";
    case ErrorCode::PreconditionError:
      return "transfer precondition not met";
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::NotImplemented:
      return "not implemented";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::InvalidState:
      return "operation not allowed in current state";
    case ErrorCode::StorageError:
      return "storage service error";
    case ErrorCode::AWSWrongRegion:
      return "AWS op may succeed in other region";
    case ErrorCode::LocalStorageError:
      return "local storage error";
    case ErrorCode::AssertionFailed:
      return "assertion failed";
    default:
      return "unknown error";
    }
  }

  std::error_condition default_error_condition(int c) const noexcept final {
    switch (static_cast<ErrorCode>(c)) {
    case ErrorCode::PlanningError:
    case ErrorCode::InvalidArgument:
    case ErrorCode::PreconditionError:
    case ErrorCode::AssertionFailed:
      return make_error_condition(std::errc::invalid_argument);
    case ErrorCode::NotImplemented:
      return make_error_condition(std::errc::function_not_supported);
    case ErrorCode::NotFound:
      return make_error_condition(std::errc::no_such_file_or_directory);
    case ErrorCode::AlreadyExists:
      return make_error_condition(std::errc::file_exists);
    case ErrorCode::Cancelled:
      return make_error_condition(std::errc::operation_canceled);
    case ErrorCode::InvalidState:
      return make_error_condition(std::errc::operation_not_permitted);
    case ErrorCode::TransientTransferError:
    case ErrorCode::PartTransferFailed:
    case ErrorCode::TransactionFinalizeError:
    case ErrorCode::StorageError:
    case ErrorCode::AWSWrongRegion:
    case ErrorCode::LocalStorageError:
      return make_error_condition(std::errc::io_error);
    default:
      return std::error_condition(c, *this);
    }
  }
};

/// Return singleton category
S3MP_EXPORT const ErrorCodeCategory& GetErrorCodeCategory();

}  // namespace s3mp::internal

namespace std {

/// Tell STL about our error code enum.
template <>
struct is_error_code_enum<s3mp::ErrorCode> : true_type {};

}  // namespace std

namespace s3mp {

/// make_error_code converts ErrorCode into a standard error code. It is an STL
/// and outcome extension point and will be found with ADL if necessary.
inline std::error_code
make_error_code(ErrorCode e) noexcept {
  return {static_cast<int>(e), internal::GetErrorCodeCategory()};
}

}  // namespace s3mp

#endif
