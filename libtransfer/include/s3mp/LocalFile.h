#ifndef S3MP_LIBTRANSFER_S3MP_LOCALFILE_H_
#define S3MP_LIBTRANSFER_S3MP_LOCALFILE_H_

#include <cstdint>
#include <string>

#include "s3mp/Result.h"
#include "s3mp/config.h"

namespace s3mp {

/// A LocalFile is an open descriptor on a local file used with positional
/// I/O. Each worker opens its own LocalFile so that no file offset is shared
/// between threads.
class S3MP_EXPORT LocalFile {
public:
  LocalFile(LocalFile&& other) noexcept;
  LocalFile& operator=(LocalFile&& other) noexcept;
  LocalFile(const LocalFile&) = delete;
  LocalFile& operator=(const LocalFile&) = delete;
  ~LocalFile();

  static Result<LocalFile> OpenForRead(const std::string& path);

  /// OpenForWrite opens an existing file without truncating it
  static Result<LocalFile> OpenForWrite(const std::string& path);

  /// Create makes (or truncates) a file of exactly size bytes, creating
  /// missing parent directories
  static Result<void> Create(const std::string& path, uint64_t size);

  /// Size returns the size of a regular file.
  /// \return ErrorCode::NotFound if the path does not exist
  static Result<uint64_t> Size(const std::string& path);

  static bool Exists(const std::string& path);

  static Result<void> Remove(const std::string& path);

  /// ReadAt fills size bytes of data from offset; short files are an error
  Result<void> ReadAt(uint64_t offset, uint8_t* data, uint64_t size) const;

  /// WriteAt writes size bytes of data at offset, overwriting what is there
  Result<void> WriteAt(uint64_t offset, const uint8_t* data, uint64_t size);

  Result<void> Sync();

  const std::string& path() const { return path_; }

private:
  LocalFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

  static Result<LocalFile> Open(const std::string& path, int flags);

  void Close();

  int fd_{-1};
  std::string path_;
};

}  // namespace s3mp

#endif
