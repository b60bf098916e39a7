#ifndef S3MP_LIBTRANSFER_S3MP_CLEANUP_H_
#define S3MP_LIBTRANSFER_S3MP_CLEANUP_H_

#include <string>
#include <vector>

#include "s3mp/ObjectLocator.h"
#include "s3mp/Result.h"
#include "s3mp/StorageClient.h"
#include "s3mp/config.h"

/// Incomplete multipart transactions are invisible in object listings but
/// their parts are still stored (and billed). A transfer that is killed
/// before it can complete or abort leaves one behind. These functions find
/// them and cancel them one at a time; nothing is cancelled implicitly.
///
/// \file

namespace s3mp {

/// ListIncompleteTransfers returns the open transactions in the container of
/// locator whose keys start with locator.key()
S3MP_EXPORT Result<std::vector<MultipartTransaction>> ListIncompleteTransfers(
    StorageClient* client, const ObjectLocator& locator);

/// FormatCancelCommand renders a transaction as a command line that cancels
/// it, followed by a comment naming who started it and when:
///
///     s3mp cleanup s3://bucket/key --cancel ID  # initiator started_at
S3MP_EXPORT std::string FormatCancelCommand(
    const ObjectLocator& locator, const MultipartTransaction& txn);

/// CancelIncompleteTransfer aborts the transaction with the given id in the
/// container of locator.
/// \return ErrorCode::NotFound if no such transaction is open
S3MP_EXPORT Result<MultipartTransaction> CancelIncompleteTransfer(
    StorageClient* client, const ObjectLocator& locator,
    const std::string& transaction_id);

}  // namespace s3mp

#endif
