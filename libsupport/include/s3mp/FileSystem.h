#ifndef S3MP_LIBSUPPORT_S3MP_FILESYSTEM_H_
#define S3MP_LIBSUPPORT_S3MP_FILESYSTEM_H_

#include <string>
#include <string_view>
#include <utility>

#include "s3mp/Result.h"
#include "s3mp/config.h"

namespace s3mp {

/// Create a file with a unique name. The file is created with the name
/// prefix + random characters + suffix.
///
/// \returns the file name
S3MP_EXPORT Result<std::string> CreateUniqueFile(
    std::string_view prefix, std::string_view suffix = "");

/// Like CreateUniqueFile but also return the open file descriptor
S3MP_EXPORT Result<std::pair<std::string, int>> OpenUniqueFile(
    std::string_view prefix, std::string_view suffix = "");

/// Create a directory with a unique name. The directory is created with the
/// name prefix + random characters.
///
/// \returns the directory name
S3MP_EXPORT Result<std::string> CreateUniqueDirectory(std::string_view prefix);

/// RemoveAll deletes a file or a directory tree
S3MP_EXPORT Result<void> RemoveAll(const std::string& path);

/// JoinPath joins dir and file with exactly one '/'
S3MP_EXPORT std::string JoinPath(std::string_view dir, std::string_view file);

}  // namespace s3mp

#endif
