#include "s3mp/Env.h"

#include <cerrno>
#include <cstdlib>
#include <string_view>

#include <boost/algorithm/string/case_conv.hpp>

namespace {

template <typename T, typename Convert>
bool
ParseNumber(const std::string& var_name, T* ret, Convert convert) {
  const char* val = std::getenv(var_name.c_str());
  if (val == nullptr || *val == '\0') {
    return false;
  }

  char* end = nullptr;
  errno = 0;
  auto parsed = convert(val, &end);
  if (errno != 0 || end == val || *end != '\0') {
    return false;
  }
  *ret = static_cast<T>(parsed);
  return true;
}

}  // namespace

bool
s3mp::GetEnv(const std::string& var_name) {
  return std::getenv(var_name.c_str()) != nullptr;
}

bool
s3mp::GetEnv(const std::string& var_name, bool* ret) {
  std::string val;
  if (!GetEnv(var_name, &val)) {
    return false;
  }
  boost::algorithm::to_lower(val);

  if (val == "1" || val == "true" || val == "on" || val == "yes") {
    *ret = true;
    return true;
  }
  if (val == "0" || val == "false" || val == "off" || val == "no") {
    *ret = false;
    return true;
  }
  return false;
}

bool
s3mp::GetEnv(const std::string& var_name, int* ret) {
  return ParseNumber(var_name, ret, [](const char* s, char** end) {
    return std::strtol(s, end, 10);
  });
}

bool
s3mp::GetEnv(const std::string& var_name, uint64_t* ret) {
  std::string val;
  // strtoull silently negates "-1"
  if (!GetEnv(var_name, &val) || val.find('-') != std::string::npos) {
    return false;
  }
  return ParseNumber(var_name, ret, [](const char* s, char** end) {
    return std::strtoull(s, end, 10);
  });
}

bool
s3mp::GetEnv(const std::string& var_name, double* ret) {
  return ParseNumber(var_name, ret, [](const char* s, char** end) {
    return std::strtod(s, end);
  });
}

bool
s3mp::GetEnv(const std::string& var_name, std::string* ret) {
  const char* val = std::getenv(var_name.c_str());
  if (val == nullptr) {
    return false;
  }
  *ret = val;
  return true;
}

bool
s3mp::SetEnv(
    const std::string& var_name, const std::string& val, bool overwrite) {
  return setenv(var_name.c_str(), val.c_str(), overwrite ? 1 : 0) == 0;
}

bool
s3mp::UnsetEnv(const std::string& var_name) {
  return unsetenv(var_name.c_str()) == 0;
}
