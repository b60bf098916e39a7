#include "s3mp/Strings.h"

bool
s3mp::HasPrefix(const std::string& s, const std::string& prefix) {
  if (prefix.length() > s.length()) {
    return false;
  }
  return s.compare(0, prefix.length(), prefix) == 0;
}

std::string
s3mp::TrimPrefix(const std::string& s, const std::string& prefix) {
  if (HasPrefix(s, prefix)) {
    return s.substr(prefix.length());
  }
  return s;
}
