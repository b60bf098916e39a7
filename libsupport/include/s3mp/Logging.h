#ifndef S3MP_LIBSUPPORT_S3MP_LOGGING_H_
#define S3MP_LIBSUPPORT_S3MP_LOGGING_H_

#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "s3mp/config.h"

/// Write debug, warning and error messages to standard error.
///
/// Warnings are for situations where code can proceed but in a suboptimal way.
///
/// Errors are for situations where code cannot proceed. If it is possible for
/// the caller to make progress, instead of using the log functions here, it is
/// preferable to return an explicit error via Result.h and let callers
/// determine what to do.
///
/// Progress of a transfer (parts started, retried, finished) is not logged
/// here. It is reported through the EventSink handed to the orchestrator, so
/// that callers decide where it goes and how verbose it is.
///
/// Messages at the debug level are only emitted in debug builds. The
/// environment variable S3MP_LOG_LEVEL suppresses messages below the given
/// level (0 debug, 1 verbose, 3 warning, 4 error).
///
/// Logging functions take a format string implemented with the fmt library:
///
///     S3MP_LOG_VERBOSE("hello {}", s);
///
/// Warnings and errors are read by people not familiar with the code, so
/// express conditions in the terms of the tool first (objects, parts,
/// transactions) and add implementation details afterwards:
///
///     "cannot complete upload of s3://bucket/key: part 3 has no tag"
///
/// \file Logging.h

#ifndef FMT_STRING
#define FMT_STRING(...) __VA_ARGS__
#endif

#if FMT_VERSION >= 60000
/// Introduce std::error_code to the fmt library. Otherwise, they will be
/// printed using ostream<< formatting (i.e., as an int).
template <>
struct fmt::formatter<std::error_code> : formatter<string_view> {
  template <typename FormatterContext>
  auto format(std::error_code c, FormatterContext& ctx) const {
    return formatter<string_view>::format(c.message(), ctx);
  }
};
#endif

namespace s3mp {

enum class LogLevel {
  Debug = 0,
  Verbose = 1,
  // Info = 2,  currently unused
  Warning = 3,
  Error = 4,
};

namespace internal {

S3MP_EXPORT void LogString(LogLevel level, const std::string& s);

}

/// Log at a specific LogLevel.
///
/// \tparam F         string-like type
/// \param level      level to log at
/// \param fmt_string a C++20-style fmt string (e.g., "hello {}")
/// \param args       arguments to fmt interpolation
template <typename F, typename... Args>
void
Log(LogLevel level, F fmt_string, Args&&... args) {
  std::string s = fmt::format(fmt_string, std::forward<Args>(args)...);
  internal::LogString(level, s);
}

/// Log at a specific LogLevel with source code information.
///
/// \tparam F         string-like type
/// \param level      level to log at
/// \param file_name  file name
/// \param line_no    line number
/// \param fmt_string a C++20-style fmt string (e.g., "hello {}")
/// \param args       arguments to fmt interpolation
template <typename F, typename... Args>
void
LogLine(
    LogLevel level, const char* file_name, int line_no, F fmt_string,
    Args&&... args) {
  std::string s = fmt::format(fmt_string, std::forward<Args>(args)...);
  std::string with_line = fmt::format("{}:{}: {}", file_name, line_no, s);
  internal::LogString(level, with_line);
}

S3MP_EXPORT void AbortApplication [[noreturn]] ();

}  // end namespace s3mp

/// S3MP_LOG_FATAL logs a message at the error log level and aborts the
/// application.
///
/// Use sparingly. It is usually preferable to return a s3mp::Result.
#define S3MP_LOG_FATAL(fmt_string, ...)                                        \
  do {                                                                         \
    ::s3mp::LogLine(                                                           \
        ::s3mp::LogLevel::Error, __FILE__, __LINE__, FMT_STRING(fmt_string),   \
        ##__VA_ARGS__);                                                        \
    ::s3mp::AbortApplication();                                                \
  } while (0)
/// S3MP_LOG_ERROR logs a message at the error log level.
#define S3MP_LOG_ERROR(fmt_string, ...)                                        \
  do {                                                                         \
    ::s3mp::LogLine(                                                           \
        ::s3mp::LogLevel::Error, __FILE__, __LINE__, FMT_STRING(fmt_string),   \
        ##__VA_ARGS__);                                                        \
  } while (0)
/// S3MP_LOG_WARN logs a message at the warning log level.
#define S3MP_LOG_WARN(fmt_string, ...)                                         \
  do {                                                                         \
    ::s3mp::LogLine(                                                           \
        ::s3mp::LogLevel::Warning, __FILE__, __LINE__, FMT_STRING(fmt_string), \
        ##__VA_ARGS__);                                                        \
  } while (0)
/// S3MP_LOG_VERBOSE logs a message at the verbose log level.
#define S3MP_LOG_VERBOSE(fmt_string, ...)                                      \
  do {                                                                         \
    ::s3mp::LogLine(                                                           \
        ::s3mp::LogLevel::Verbose, __FILE__, __LINE__, FMT_STRING(fmt_string), \
        ##__VA_ARGS__);                                                        \
  } while (0)

#ifndef NDEBUG
/// S3MP_LOG_DEBUG logs a message at the debug log level. Debug messages are
/// only produced in debug builds.
#define S3MP_LOG_DEBUG(fmt_string, ...)                                        \
  do {                                                                         \
    ::s3mp::LogLine(                                                           \
        ::s3mp::LogLevel::Debug, __FILE__, __LINE__, FMT_STRING(fmt_string),   \
        ##__VA_ARGS__);                                                        \
  } while (0)
#else
#define S3MP_LOG_DEBUG(...)
#endif

/// S3MP_LOG_ASSERT asserts that a condition is true, and if it is not,
/// aborts the application.
#define S3MP_LOG_ASSERT(cond)                                                  \
  do {                                                                         \
    if (!(cond)) {                                                             \
      ::s3mp::LogLine(                                                         \
          ::s3mp::LogLevel::Error, __FILE__, __LINE__,                         \
          "assertion not true: {}", #cond);                                    \
      ::s3mp::AbortApplication();                                              \
    }                                                                          \
  } while (0)

/// S3MP_LOG_VASSERT asserts that a condition is true, and if it is not, logs
/// an error and aborts the application.
#define S3MP_LOG_VASSERT(cond, fmt_string, ...)                                \
  do {                                                                         \
    if (!(cond)) {                                                             \
      ::s3mp::LogLine(                                                         \
          ::s3mp::LogLevel::Error, __FILE__, __LINE__, FMT_STRING(fmt_string), \
          ##__VA_ARGS__);                                                      \
      ::s3mp::AbortApplication();                                              \
    }                                                                          \
  } while (0)

/// S3MP_WARN_ONCE logs a message at the warning log level. The output of
/// subsequent invocations of S3MP_WARN_ONCE will be suppressed.
#define S3MP_WARN_ONCE(fmt_string, ...)                                        \
  do {                                                                         \
    static std::once_flag __s3mp_warn_once_flag;                               \
    std::call_once(__s3mp_warn_once_flag, [&]() {                              \
      ::s3mp::LogLine(                                                         \
          ::s3mp::LogLevel::Warning, __FILE__, __LINE__,                       \
          FMT_STRING(fmt_string), ##__VA_ARGS__);                              \
    });                                                                        \
  } while (0)

#ifndef NDEBUG
/// S3MP_LOG_DEBUG_ASSERT asserts that a condition is true, and if it is not,
/// aborts the application only in debug builds. This is a replacement for
/// std::assert.
#define S3MP_LOG_DEBUG_ASSERT(cond) S3MP_LOG_ASSERT(cond)

/// S3MP_LOG_DEBUG_VASSERT asserts that a condition is true, and if it is not,
/// logs an error and aborts the application only in debug builds.
#define S3MP_LOG_DEBUG_VASSERT(cond, fmt_string, ...)                          \
  S3MP_LOG_VASSERT(cond, fmt_string, ##__VA_ARGS__)
#else
#define S3MP_LOG_DEBUG_ASSERT(cond)

#define S3MP_LOG_DEBUG_VASSERT(...)
#endif

#endif
