#ifndef S3MP_LIBSUPPORT_S3MP_RESULT_H_
#define S3MP_LIBSUPPORT_S3MP_RESULT_H_

#include <cerrno>
#include <cstring>
#include <iterator>
#include <ostream>
#include <system_error>
#include <vector>

#include <boost/outcome/outcome.hpp>
#include <boost/outcome/trait.hpp>
#include <boost/outcome/utils.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"
#include "s3mp/config.h"

/// Code that needs to indicate an error to callers should use `s3mp::Result`.
/// When a function returns `s3mp::Result<T>`, it either returns a `T` or an
/// error. When a function returns `s3mp::Result<void>`, it either succeeds or
/// returns an error.
///
/// A common pattern for using a function that returns a `s3mp::Result<T>` is:
///
///     auto r = ReturnsAResultWithValue();
///     if (!r) {
///       // Some error happened. Either...
///
///       // ... we handle it
///       if (r.error() == ErrorCode::NotFound) {
///         return DoAlternative();
///       }
///
///       // ... or we propagate it
///       return r.error();
///     }
///
///     T value = std::move(r.value());
///
/// The macro `S3MP_CHECKED` simplifies the propagation case:
///
///     T value = S3MP_CHECKED(ReturnsAResultWithValue());
///
///     S3MP_CHECKED(ReturnsAResult());
///
/// Exceptions are not used to report errors. They are reserved for situations
/// where it is equally acceptable to terminate the current process.
///
/// Messages should be written from the perspective of the caller and begin
/// with a lowercase letter so that context chains read naturally:
///
///     Result<void> UploadObject() {
///       ...
///       S3MP_CHECKED_CONTEXT(UploadPart(n), "uploading part {}", n);
///     }
///
/// will create error strings like `uploading part 3: storage service error`.
///
/// \file

namespace s3mp {

namespace internal {

struct abort_policy : BOOST_OUTCOME_V2_NAMESPACE::policy::base {
  template <class Impl>
  static constexpr void wide_value_check(Impl&& self) {
    if (!base::_has_value(std::forward<Impl>(self))) {
      AbortApplication();
    }
  }

  template <class Impl>
  static constexpr void wide_error_check(Impl&& self) {
    if (!base::_has_error(std::forward<Impl>(self))) {
      AbortApplication();
    }
  }

  template <class Impl>
  static constexpr void wide_exception_check(Impl&& self) {
    if (!base::_has_exception(std::forward<Impl>(self))) {
      AbortApplication();
    }
  }
};

}  // namespace internal

class CopyableErrorInfo;

/// An ErrorInfo contains additional context about an error in addition to an
/// error code. It works together with Result and ErrorCode.
///
///     Result<PartAck> UploadOne() {
///       if (...) {
///         // Return an error without any additional context
///         return ErrorCode::StorageError;
///       } else if (...) {
///         // Return an error with context
///         return S3MP_ERROR(ErrorCode::StorageError, "part {} rejected", n);
///       }
///
///       return PartAck{...};
///     }
///
/// An ErrorInfo is intended to propagate errors up a call stack for a single
/// thread. Use CopyableErrorInfo to store an error or hand it to another
/// thread (e.g., a part result collected by the worker pool).
///
/// Two ErrorInfos are equivalent if their error codes are equal; the context
/// does not participate in comparison.
class S3MP_EXPORT [[nodiscard]] ErrorInfo {
public:
  class Context;

  static constexpr int kContextSize = 512;

  ErrorInfo() : ErrorInfo(std::error_code()) {}

  ErrorInfo(const std::error_code& ec) : error_code_(ec) {}

  template <
      typename ErrorEnum, typename U = std::enable_if_t<
                              std::is_error_code_enum_v<std::decay_t<ErrorEnum>> ||
                              std::is_error_condition_enum_v<
                                  std::decay_t<ErrorEnum>>>>
  ErrorInfo(ErrorEnum && err)
      : ErrorInfo(make_error_code(std::forward<ErrorEnum>(err))) {}

  /// Construct an ErrorInfo with a context message that overrides
  /// ec.message()
  ErrorInfo(const std::error_code& ec, const std::string& context)
      : ErrorInfo(ec) {
    Prepend(context.c_str(), context.c_str() + context.size());
  }

  ErrorInfo(const CopyableErrorInfo& cei);

  const std::error_code& error_code() const { return error_code_; }

  /// MakeWithSourceInfo makes an ErrorInfo from a root error with additional
  /// arguments passed to fmt::format
  template <typename F, typename... Args>
  static ErrorInfo MakeWithSourceInfo(
      const char* file_name, int line_no, const std::error_code& ec,
      F fmt_string, Args&&... args) {
    fmt::memory_buffer out;
    fmt::format_to(
        std::back_inserter(out), fmt_string, std::forward<Args>(args)...);
    const char* base_name = std::strrchr(file_name, '/');
    if (!base_name) {
      base_name = file_name;
    } else {
      base_name++;
    }

    fmt::format_to(std::back_inserter(out), " ({}:{})", base_name, line_no);

    ErrorInfo ei(ec);
    ei.Prepend(out.data(), out.data() + out.size());

    return ei;
  }

  template <typename F, typename... Args>
  ErrorInfo WithContext(F && fmt_string, Args && ... args) {
    SpillMessage();

    PrependFmt(std::forward<F>(fmt_string), std::forward<Args>(args)...);

    return *this;
  }

  template <typename ErrorEnum, typename F, typename... Args>
  std::enable_if_t<
      std::is_error_code_enum_v<ErrorEnum> ||
          std::is_error_condition_enum_v<ErrorEnum>,
      ErrorInfo>
  WithContext(ErrorEnum err, F && fmt_string, Args && ... args) {
    SpillMessage();

    error_code_ = make_error_code(err);

    PrependFmt(std::forward<F>(fmt_string), std::forward<Args>(args)...);

    return *this;
  }

  std::ostream& Write(std::ostream & out) const;

private:
  template <typename F, typename... Args>
  void PrependFmt(F fmt_string, Args && ... args) {
    std::vector<char> out;
    fmt::format_to(
        std::back_inserter(out), fmt_string, std::forward<Args>(args)...);
    Prepend(out.data(), out.data() + out.size());
  }

  void Prepend(const char* begin, const char* end);

  /// SpillMessage writes the current error_code message to the error
  /// context if the error context is empty
  void SpillMessage();

  void CheckContext();

  std::error_code error_code_;
  std::pair<Context*, int> context_{};
};

inline std::ostream&
operator<<(std::ostream& out, const ErrorInfo& ei) {
  return ei.Write(out);
}

/// S3MP_ERROR creates new ErrorInfo and records information about the
/// callsite (e.g., line number).
#define S3MP_ERROR(ec, fmt_string, ...)                                        \
  ::s3mp::ErrorInfo::MakeWithSourceInfo(                                       \
      __FILE__, __LINE__, (ec), FMT_STRING(fmt_string), ##__VA_ARGS__)

/// A CopyableErrorInfo is like an ErrorInfo but used outside a thread's error
/// stack.
///
/// An ErrorInfo is not generally copyable because it references thread
/// local data. A CopyableErrorInfo is useful in cases where one wants
/// to store errors, e.g., collecting results across threads.
class S3MP_EXPORT CopyableErrorInfo {
public:
  CopyableErrorInfo(const std::error_code& ec) : error_code_(ec) {}

  CopyableErrorInfo() : CopyableErrorInfo(std::error_code()) {}

  CopyableErrorInfo(const ErrorInfo& ei);

  template <
      typename ErrorEnum, typename U = std::enable_if_t<
                              std::is_error_code_enum_v<std::decay_t<ErrorEnum>> ||
                              std::is_error_condition_enum_v<
                                  std::decay_t<ErrorEnum>>>>
  CopyableErrorInfo(ErrorEnum&& err)
      : CopyableErrorInfo(make_error_code(std::forward<ErrorEnum>(err))) {}

  template <typename F, typename... Args>
  CopyableErrorInfo WithContext(F&& fmt_string, Args&&... args) {
    PrependFmt(std::forward<F>(fmt_string), std::forward<Args>(args)...);

    return *this;
  }

  template <typename ErrorEnum, typename F, typename... Args>
  std::enable_if_t<
      std::is_error_code_enum_v<ErrorEnum> ||
          std::is_error_condition_enum_v<ErrorEnum>,
      CopyableErrorInfo>
  WithContext(ErrorEnum err, F&& fmt_string, Args&&... args) {
    error_code_ = make_error_code(err);

    PrependFmt(std::forward<F>(fmt_string), std::forward<Args>(args)...);

    return *this;
  }

  const std::error_code& error_code() const { return error_code_; }

  const std::string& message() const { return message_; }

  std::ostream& Write(std::ostream& out) const;

private:
  template <typename F, typename... Args>
  void PrependFmt(F fmt_string, Args&&... args) {
    std::vector<char> out;
    fmt::format_to(
        std::back_inserter(out), fmt_string, std::forward<Args>(args)...);
    Prepend(out.data(), out.data() + out.size());
  }

  void Prepend(const char* begin, const char* end) {
    if (message_.empty()) {
      message_ = error_code_.message();
    }
    message_.insert(0, std::string(": "));
    message_.insert(message_.begin(), begin, end);
  }

  std::error_code error_code_;
  std::string message_;
};

inline std::ostream&
operator<<(std::ostream& out, const CopyableErrorInfo& ei) {
  return ei.Write(out);
}

}  // namespace s3mp

#if FMT_VERSION >= 90000
/// fmt 9 no longer formats types through their ostream operator implicitly.
template <>
struct fmt::formatter<s3mp::ErrorInfo> : ostream_formatter {};
template <>
struct fmt::formatter<s3mp::CopyableErrorInfo> : ostream_formatter {};
#endif

// Tell boost::outcome which types will be used as an error type E in
// std_result<T, E, ...> below. The trait is specialized before the Result
// alias is defined.
BOOST_OUTCOME_V2_NAMESPACE_BEGIN

namespace trait {

template <>
struct is_error_type<s3mp::ErrorInfo> {
  static constexpr bool value = true;
};

template <>
struct is_error_type<s3mp::CopyableErrorInfo> {
  static constexpr bool value = true;
};

}  // namespace trait

BOOST_OUTCOME_V2_NAMESPACE_END

namespace s3mp {

/// make_error_code converts ErrorInfo into a standard error code. It is an STL
/// and boost::outcome extension point and will be found with ADL if necessary.
inline std::error_code
make_error_code(ErrorInfo e) noexcept {
  return e.error_code();
}

/// make_error_code converts CopyableErrorInfo into a standard error code. It is
/// an STL and boost::outcome extension point and will be found with ADL if
/// necessary.
inline std::error_code
make_error_code(CopyableErrorInfo e) noexcept {
  return e.error_code();
}

/// A Result is a T or an ErrorInfo.
template <class T>
using Result = BOOST_OUTCOME_V2_NAMESPACE::std_result<
    T, ErrorInfo, internal::abort_policy>;

/// A CopyableResult is a T or an CopyableErrorInfo.
template <class T>
using CopyableResult = BOOST_OUTCOME_V2_NAMESPACE::std_result<
    T, CopyableErrorInfo, internal::abort_policy>;

inline bool
operator==(const ErrorInfo& a, const ErrorInfo& b) {
  return make_error_code(a) == make_error_code(b);
}

inline bool
operator!=(const ErrorInfo& a, const ErrorInfo& b) {
  return !(a == b);
}

inline bool
operator==(const CopyableErrorInfo& a, const CopyableErrorInfo& b) {
  return make_error_code(a) == make_error_code(b);
}

inline bool
operator!=(const CopyableErrorInfo& a, const CopyableErrorInfo& b) {
  return !(a == b);
}

S3MP_EXPORT Result<void> ResultSuccess();
S3MP_EXPORT CopyableResult<void> CopyableResultSuccess();

inline std::error_code
ResultErrno() {
  S3MP_LOG_DEBUG_ASSERT(errno);
  return std::error_code(errno, std::system_category());
}

// Support functions for S3MP_CHECKED
namespace internal {

template <class T>
bool
CheckedExpressionFailed(const CopyableResult<T>& result) {
  return !result;
}

template <class T>
bool
CheckedExpressionFailed(const Result<T>& result) {
  return !result;
}

template <class T>
ErrorInfo
CheckedExpressionToError(const Result<T>& result) {
  return result.error();
}

template <class T>
CopyableErrorInfo
CheckedExpressionToError(const CopyableResult<T>& result) {
  return result.error();
}

template <class T>
std::enable_if_t<!std::is_same<T, void>::value, T&&>
CheckedExpressionToValue(Result<T>&& result) {
  return std::move(result.value());
}

inline int
CheckedExpressionToValue(Result<void>&&) {
  return 0;
}

template <class T>
std::enable_if_t<!std::is_same<T, void>::value, T&&>
CheckedExpressionToValue(CopyableResult<T>&& result) {
  return std::move(result.value());
}

inline int
CheckedExpressionToValue(CopyableResult<void>&&) {
  return 0;
}

}  // namespace internal

#define S3MP_CHECKED_NAME(x, y) x##y

#define S3MP_CHECKED_IMPL(result_name, expression, ...)                        \
  ({                                                                           \
    auto result_name = (expression);                                           \
    if (::s3mp::internal::CheckedExpressionFailed(result_name)) {              \
      return ::s3mp::internal::CheckedExpressionToError(result_name)           \
          .WithContext(__VA_ARGS__);                                           \
    }                                                                          \
    std::move(                                                                 \
        ::s3mp::internal::CheckedExpressionToValue(std::move(result_name)));   \
  })

/// S3MP_CHECKED_CONTEXT takes an expression that returns a Result, and
/// additional error formatting expressions. If the Result has an error, the
/// function calling S3MP_CHECKED_CONTEXT will return the error with
/// additional error formatting. Otherwise, S3MP_CHECKED_CONTEXT will return
/// the value of the Result object to the caller.
#define S3MP_CHECKED_CONTEXT(expression, ...)                                  \
  S3MP_CHECKED_IMPL(                                                           \
      S3MP_CHECKED_NAME(_error_or_value, __COUNTER__), expression,             \
      __VA_ARGS__)

/// S3MP_CHECKED takes an expression that returns a Result, and if the Result
/// has an error, the function calling S3MP_CHECKED will return the error.
/// Otherwise, S3MP_CHECKED will return the value of the Result object to the
/// caller.
#define S3MP_CHECKED(expression)                                               \
  S3MP_CHECKED_CONTEXT(expression, "({}:{})", __FILE__, __LINE__)

}  // namespace s3mp

#endif
