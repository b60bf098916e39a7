#ifndef S3MP_LIBTRANSFER_S3MP_EVENTSINK_H_
#define S3MP_LIBTRANSFER_S3MP_EVENTSINK_H_

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "s3mp/config.h"

/// An EventSink receives progress events from a transfer: the plan, each part
/// as it finishes, retries, and the final outcome of the transaction.
///
/// Events carry a name (e.g., "part.done"), a human readable message and a
/// list of tags. Sinks decide how to render them and which verbosity to keep.
/// Sinks are called concurrently from worker threads and must be thread-safe.
///
/// Event names used by the transfer library:
///
///   transfer.start, transfer.plan, transfer.direct, transfer.done,
///   transfer.failed, session.initiated, session.completed, session.aborted,
///   part.done, part.failed, part.retry
///
/// \file

namespace s3mp {

using variant_type = std::variant<
    bool, int64_t, uint64_t, double, std::string>;
class Value : public variant_type {
public:
  Value(bool x) noexcept : variant_type(x) {}
  Value(int x) noexcept : variant_type(static_cast<int64_t>(x)) {}
  Value(int64_t x) noexcept : variant_type(x) {}
  Value(uint32_t x) noexcept : variant_type(static_cast<uint64_t>(x)) {}
  Value(uint64_t x) noexcept : variant_type(x) {}
  Value(double x) noexcept : variant_type(x) {}
  Value(std::string x) noexcept : variant_type(std::move(x)) {}
  Value(const char* s) noexcept : variant_type(std::string(s)) {}
};
using Tags = std::vector<std::pair<std::string, Value>>;

/// Levels are ordered: a sink at level Verbose keeps Error, Info and Verbose
/// events.
enum class Verbosity : int {
  Error = 0,
  Info = 1,
  Verbose = 2,
  Debug = 3,
};

class S3MP_EXPORT EventSink {
public:
  virtual ~EventSink() = default;
  EventSink() = default;
  EventSink(const EventSink&) = delete;
  EventSink(EventSink&&) = delete;
  EventSink& operator=(const EventSink&) = delete;
  EventSink& operator=(EventSink&&) = delete;

  virtual void Emit(
      Verbosity level, const std::string& name, const std::string& message,
      const Tags& tags) = 0;

  void Emit(
      Verbosity level, const std::string& name, const std::string& message) {
    Emit(level, name, message, Tags{});
  }

  /// GetValue renders a tag value as text
  static std::string GetValue(const Value& value);
};

/// A NullEventSink drops every event
class S3MP_EXPORT NullEventSink : public EventSink {
public:
  using EventSink::Emit;
  void Emit(
      Verbosity, const std::string&, const std::string&,
      const Tags&) override {}
};

}  // namespace s3mp

#endif
