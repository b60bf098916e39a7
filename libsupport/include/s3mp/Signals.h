#ifndef S3MP_LIBSUPPORT_S3MP_SIGNALS_H_
#define S3MP_LIBSUPPORT_S3MP_SIGNALS_H_

#include <atomic>

#include "s3mp/config.h"

namespace s3mp {

/// InstallInterruptHandlers routes SIGINT and SIGTERM to the given flag
/// instead of terminating the process, and ignores SIGPIPE so that a peer
/// closing a connection surfaces as an I/O error. The flag must outlive the
/// process or a later call to RestoreInterruptHandlers.
///
/// The handler only stores to the flag; readers poll it.
///
/// \return true if all handlers were installed
S3MP_EXPORT bool InstallInterruptHandlers(std::atomic<bool>* interrupted);

/// RestoreInterruptHandlers reinstates the default dispositions for SIGINT
/// and SIGTERM.
S3MP_EXPORT void RestoreInterruptHandlers();

}  // namespace s3mp

#endif
