#ifndef S3MP_LIBTRANSFER_S3MP_TEXTEVENTSINK_H_
#define S3MP_LIBTRANSFER_S3MP_TEXTEVENTSINK_H_

#include <memory>
#include <ostream>
#include <string>

#include "s3mp/EventSink.h"
#include "s3mp/Time.h"
#include "s3mp/config.h"

namespace s3mp {

/// A TextEventSink writes one line per event to an output stream (standard
/// error by default):
///
///     s3mp: ms=152 event=part.done part=3 attempts=1 | finished part 3
///
/// Events above the configured verbosity are dropped. Error events are
/// flushed immediately.
class S3MP_EXPORT TextEventSink : public EventSink {
public:
  static std::unique_ptr<TextEventSink> Make(Verbosity max_level);
  static std::unique_ptr<TextEventSink> Make(
      Verbosity max_level, std::ostream* out);

  using EventSink::Emit;
  void Emit(
      Verbosity level, const std::string& name, const std::string& message,
      const Tags& tags) override;

  Verbosity max_level() const { return max_level_; }

private:
  TextEventSink(Verbosity max_level, std::ostream* out)
      : max_level_(max_level), out_(out), begin_(Now()) {}

  Verbosity max_level_;
  std::ostream* out_;
  TimePoint begin_;
};

}  // namespace s3mp

#endif
