#include "s3mp/Cleanup.h"

#include <fmt/format.h>

#include "s3mp/ErrorCode.h"

s3mp::Result<std::vector<s3mp::MultipartTransaction>>
s3mp::ListIncompleteTransfers(
    StorageClient* client, const ObjectLocator& locator) {
  return S3MP_CHECKED_CONTEXT(
      client->ListMultipartTransactions(locator),
      "listing incomplete transfers in {}", locator);
}

std::string
s3mp::FormatCancelCommand(
    const ObjectLocator& locator, const MultipartTransaction& txn) {
  return fmt::format(
      "s3mp cleanup {} --cancel {}  # {} {}", locator.WithKey(txn.key),
      txn.transaction_id, txn.initiator, txn.started_at);
}

s3mp::Result<s3mp::MultipartTransaction>
s3mp::CancelIncompleteTransfer(
    StorageClient* client, const ObjectLocator& locator,
    const std::string& transaction_id) {
  std::vector<MultipartTransaction> txns =
      S3MP_CHECKED(ListIncompleteTransfers(client, locator));

  for (const MultipartTransaction& txn : txns) {
    if (txn.transaction_id != transaction_id) {
      continue;
    }
    S3MP_CHECKED_CONTEXT(
        client->AbortMultipart(locator.WithKey(txn.key), transaction_id),
        "cancelling {}", transaction_id);
    return txn;
  }

  return S3MP_ERROR(
      ErrorCode::NotFound, "No multipart upload ID found for URI {}", locator);
}
