#ifndef S3MP_LIBSUPPORT_S3MP_STRINGS_H_
#define S3MP_LIBSUPPORT_S3MP_STRINGS_H_

#include <string>

#include "s3mp/config.h"

/// @file Strings.h
///
/// Basic string manipulation functions for situations where you can tolerate
/// some string copies in exchange for a clear API.

namespace s3mp {

/// TrimPrefix returns a string without the given prefix. If the string does
/// not have the prefix, return the string unchanged.
S3MP_EXPORT std::string TrimPrefix(
    const std::string& s, const std::string& prefix);

S3MP_EXPORT bool HasPrefix(const std::string& s, const std::string& prefix);

}  // namespace s3mp

#endif
