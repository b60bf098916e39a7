#ifndef S3MP_LIBTRANSFER_S3MP_OBJECTLOCATOR_H_
#define S3MP_LIBTRANSFER_S3MP_OBJECTLOCATOR_H_

#include <ostream>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "s3mp/Result.h"
#include "s3mp/config.h"

namespace s3mp {

/// An ObjectLocator names the source or destination of a transfer: an object
/// in a container of an object store (`s3://bucket/key`, `mem://bucket/key`)
/// or a file on the local file system.
///
/// Locators are immutable. Local files have the `file` store, an empty
/// container and the path as their key.
class S3MP_EXPORT ObjectLocator {
public:
  static constexpr const char* kS3Scheme = "s3";
  static constexpr const char* kMemoryScheme = "mem";
  static constexpr const char* kFileScheme = "file";

  ObjectLocator() = default;

  ObjectLocator(std::string store, std::string container, std::string key)
      : store_(std::move(store)),
        container_(std::move(container)),
        key_(std::move(key)) {}

  /// Make parses `s3://bucket/key` and `mem://bucket/key`. A string without
  /// a scheme, or with `file://`, is a local path.
  static Result<ObjectLocator> Make(const std::string& uri);

  /// MakeContainer parses a URI that names a bucket and optionally a key
  /// prefix, e.g., `s3://bucket` or `s3://bucket/prefix`.
  static Result<ObjectLocator> MakeContainer(const std::string& uri);

  static ObjectLocator LocalFile(const std::string& path) {
    return ObjectLocator(kFileScheme, "", path);
  }

  const std::string& store() const { return store_; }
  const std::string& container() const { return container_; }
  const std::string& key() const { return key_; }

  bool is_local() const { return store_ == kFileScheme; }
  bool empty() const { return store_.empty(); }

  /// WithKey returns a locator for another object in the same container
  ObjectLocator WithKey(std::string key) const {
    return ObjectLocator(store_, container_, std::move(key));
  }

  /// string returns the locator in the form accepted by Make
  std::string string() const;

  bool operator==(const ObjectLocator& other) const {
    return store_ == other.store_ && container_ == other.container_ &&
           key_ == other.key_;
  }
  bool operator!=(const ObjectLocator& other) const {
    return !(*this == other);
  }

private:
  std::string store_;
  std::string container_;
  std::string key_;
};

inline std::ostream&
operator<<(std::ostream& out, const ObjectLocator& locator) {
  return out << locator.string();
}

}  // namespace s3mp

#if FMT_VERSION >= 90000
template <>
struct fmt::formatter<s3mp::ObjectLocator> : ostream_formatter {};
#endif

#endif
