#include "s3mp/LocalFile.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>

#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"

namespace fs = boost::filesystem;

namespace {

s3mp::Result<void>
EnsureDirectories(const std::string& path) {
  fs::path m_path{path};
  fs::path dir = m_path.parent_path();
  if (!dir.empty()) {
    if (boost::system::error_code err; !fs::create_directories(dir, err)) {
      if (err) {
        return S3MP_ERROR(
            std::error_code(err.value(), std::generic_category()),
            "creating parent directories of {}: {}", path, err.message());
      }
    }
  }
  return s3mp::ResultSuccess();
}

}  // namespace

s3mp::LocalFile::LocalFile(LocalFile&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
  other.fd_ = -1;
}

s3mp::LocalFile&
s3mp::LocalFile::operator=(LocalFile&& other) noexcept {
  if (this != &other) {
    Close();
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    other.fd_ = -1;
  }
  return *this;
}

s3mp::LocalFile::~LocalFile() { Close(); }

void
s3mp::LocalFile::Close() {
  if (fd_ < 0) {
    return;
  }
  if (close(fd_) != 0) {
    S3MP_LOG_WARN("closing {}: {}", path_, std::strerror(errno));
  }
  fd_ = -1;
}

s3mp::Result<s3mp::LocalFile>
s3mp::LocalFile::Open(const std::string& path, int flags) {
  int fd = open(path.c_str(), flags | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ENOENT) {
      return S3MP_ERROR(ErrorCode::NotFound, "opening {}: no such file", path);
    }
    return S3MP_ERROR(
        ErrorCode::LocalStorageError, "opening {}: {}", path,
        std::strerror(errno));
  }
  return LocalFile(fd, path);
}

s3mp::Result<s3mp::LocalFile>
s3mp::LocalFile::OpenForRead(const std::string& path) {
  return Open(path, O_RDONLY);
}

s3mp::Result<s3mp::LocalFile>
s3mp::LocalFile::OpenForWrite(const std::string& path) {
  return Open(path, O_WRONLY);
}

s3mp::Result<void>
s3mp::LocalFile::Create(const std::string& path, uint64_t size) {
  S3MP_CHECKED(EnsureDirectories(path));

  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return S3MP_ERROR(
        ErrorCode::LocalStorageError, "creating {}: {}", path,
        std::strerror(errno));
  }
  LocalFile file(fd, path);

  if (ftruncate(file.fd_, static_cast<off_t>(size)) != 0) {
    return S3MP_ERROR(
        ErrorCode::LocalStorageError, "sizing {} to {} bytes: {}", path, size,
        std::strerror(errno));
  }
  return ResultSuccess();
}

s3mp::Result<uint64_t>
s3mp::LocalFile::Size(const std::string& path) {
  struct stat s_buf;
  if (int ret = stat(path.c_str(), &s_buf); ret) {
    if (errno == ENOENT) {
      return S3MP_ERROR(ErrorCode::NotFound, "no such file {}", path);
    }
    return S3MP_ERROR(
        ErrorCode::LocalStorageError, "stat {}: {}", path,
        std::strerror(errno));
  }
  if (!S_ISREG(s_buf.st_mode)) {
    return S3MP_ERROR(
        ErrorCode::PreconditionError, "{} is not a regular file", path);
  }
  return static_cast<uint64_t>(s_buf.st_size);
}

bool
s3mp::LocalFile::Exists(const std::string& path) {
  boost::system::error_code err;
  return fs::exists(path, err);
}

s3mp::Result<void>
s3mp::LocalFile::Remove(const std::string& path) {
  boost::system::error_code err;
  fs::remove(path, err);
  if (err) {
    return S3MP_ERROR(
        ErrorCode::LocalStorageError, "removing {}: {}", path, err.message());
  }
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::LocalFile::ReadAt(uint64_t offset, uint8_t* data, uint64_t size) const {
  uint64_t done = 0;
  while (done < size) {
    ssize_t n = pread(fd_, data + done, size - done, offset + done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return S3MP_ERROR(
          ErrorCode::LocalStorageError, "reading {} at offset {}: {}", path_,
          offset + done, std::strerror(errno));
    }
    if (n == 0) {
      return S3MP_ERROR(
          ErrorCode::LocalStorageError,
          "reading {}: unexpected end of file at offset {}", path_,
          offset + done);
    }
    done += n;
  }
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::LocalFile::WriteAt(uint64_t offset, const uint8_t* data, uint64_t size) {
  uint64_t done = 0;
  while (done < size) {
    ssize_t n = pwrite(fd_, data + done, size - done, offset + done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return S3MP_ERROR(
          ErrorCode::LocalStorageError, "writing {} at offset {}: {}", path_,
          offset + done, std::strerror(errno));
    }
    done += n;
  }
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::LocalFile::Sync() {
  if (fsync(fd_) != 0) {
    return S3MP_ERROR(
        ErrorCode::LocalStorageError, "syncing {}: {}", path_,
        std::strerror(errno));
  }
  return ResultSuccess();
}
