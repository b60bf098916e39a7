#include "s3mp/TextEventSink.h"

#include <iostream>
#include <mutex>

#include <fmt/format.h>

namespace {

std::mutex output_mutex;

std::string
GetTagsText(const s3mp::Tags& tags) {
  if (tags.empty()) {
    return std::string{};
  }
  fmt::memory_buffer buf;

  for (uint32_t i = 0; i < tags.size(); i++) {
    const std::pair<std::string, s3mp::Value>& tag = tags[i];

    if (i != 0) {
      fmt::format_to(std::back_inserter(buf), " ");
    }
    fmt::format_to(
        std::back_inserter(buf), "{}={}", tag.first,
        s3mp::EventSink::GetValue(tag.second));
  }
  return fmt::to_string(buf);
}

}  // namespace

std::unique_ptr<s3mp::TextEventSink>
s3mp::TextEventSink::Make(Verbosity max_level) {
  return Make(max_level, &std::cerr);
}

std::unique_ptr<s3mp::TextEventSink>
s3mp::TextEventSink::Make(Verbosity max_level, std::ostream* out) {
  return std::unique_ptr<TextEventSink>(new TextEventSink(max_level, out));
}

void
s3mp::TextEventSink::Emit(
    Verbosity level, const std::string& name, const std::string& message,
    const Tags& tags) {
  if (static_cast<int>(level) > static_cast<int>(max_level_)) {
    return;
  }

  fmt::memory_buffer buf;
  fmt::format_to(
      std::back_inserter(buf), "s3mp: ms={} event={}", UsSince(begin_) / 1000,
      name);
  std::string tag_data = GetTagsText(tags);
  if (!tag_data.empty()) {
    fmt::format_to(std::back_inserter(buf), " {}", tag_data);
  }
  fmt::format_to(std::back_inserter(buf), " | {}\n", message);

  std::lock_guard<std::mutex> lock(output_mutex);
  out_->write(buf.data(), buf.size());
  if (level == Verbosity::Error) {
    out_->flush();
  }
}
