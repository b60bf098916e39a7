#include "s3mp/EventSink.h"

#include <fmt/format.h>

std::string
s3mp::EventSink::GetValue(const s3mp::Value& value) {
  if (std::holds_alternative<std::string>(value)) {
    return "\"" + std::get<std::string>(value) + "\"";
  } else if (std::holds_alternative<int64_t>(value)) {
    return std::to_string(std::get<int64_t>(value));
  } else if (std::holds_alternative<double>(value)) {
    return fmt::format("{:.2f}", std::get<double>(value));
  } else if (std::holds_alternative<bool>(value)) {
    return std::get<bool>(value) ? "true" : "false";
  } else if (std::holds_alternative<uint64_t>(value)) {
    return std::to_string(std::get<uint64_t>(value));
  }
  return std::string{};
}
