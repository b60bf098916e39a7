#include "s3mp/ObjectLocator.h"

#include <regex>

#include "s3mp/ErrorCode.h"
#include "s3mp/Strings.h"

namespace {

// https://docs.aws.amazon.com/AmazonS3/latest/dev/BucketRestrictions.html
//  Bucket names can consist only of lowercase letters, numbers,
//    dots (.), and hyphens (-).
const std::regex kObjectUriRegex("([a-z0-9]+)://([-a-z0-9.]+)/(.+)");
const std::regex kContainerUriRegex("([a-z0-9]+)://([-a-z0-9.]+)/?(.*)");

constexpr const char* kFilePrefix = "file://";

bool
IsRemoteScheme(const std::string& scheme) {
  return scheme == s3mp::ObjectLocator::kS3Scheme ||
         scheme == s3mp::ObjectLocator::kMemoryScheme;
}

}  // namespace

s3mp::Result<s3mp::ObjectLocator>
s3mp::ObjectLocator::Make(const std::string& uri) {
  if (uri.empty()) {
    return S3MP_ERROR(ErrorCode::PreconditionError, "empty location");
  }
  if (HasPrefix(uri, kFilePrefix)) {
    std::string path = TrimPrefix(uri, kFilePrefix);
    if (path.empty()) {
      return S3MP_ERROR(ErrorCode::PreconditionError, "empty path: {}", uri);
    }
    return LocalFile(path);
  }
  if (uri.find("://") == std::string::npos) {
    return LocalFile(uri);
  }

  std::smatch sub_match;
  if (!std::regex_match(uri, sub_match, kObjectUriRegex)) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError,
        "{} is not a valid object URI (expected scheme://bucket/key)", uri);
  }
  std::string scheme = sub_match[1];
  if (!IsRemoteScheme(scheme)) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError, "unsupported scheme {}: {}", scheme,
        uri);
  }
  return ObjectLocator(scheme, sub_match[2], sub_match[3]);
}

s3mp::Result<s3mp::ObjectLocator>
s3mp::ObjectLocator::MakeContainer(const std::string& uri) {
  std::smatch sub_match;
  if (!std::regex_match(uri, sub_match, kContainerUriRegex)) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError,
        "{} is not a valid bucket URI (expected scheme://bucket[/prefix])",
        uri);
  }
  std::string scheme = sub_match[1];
  if (!IsRemoteScheme(scheme)) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError, "unsupported scheme {}: {}", scheme,
        uri);
  }
  return ObjectLocator(scheme, sub_match[2], sub_match[3]);
}

std::string
s3mp::ObjectLocator::string() const {
  if (is_local() || store_.empty()) {
    return key_;
  }
  if (key_.empty()) {
    return store_ + "://" + container_;
  }
  return store_ + "://" + container_ + "/" + key_;
}
