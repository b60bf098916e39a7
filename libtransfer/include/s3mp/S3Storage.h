#ifndef S3MP_LIBTRANSFER_S3MP_S3STORAGE_H_
#define S3MP_LIBTRANSFER_S3MP_S3STORAGE_H_

#include <memory>
#include <string_view>

#include "s3mp/Result.h"
#include "s3mp/StorageClient.h"
#include "s3mp/config.h"

namespace s3mp {

/// An S3StorageProvider connects to Amazon S3 (or an S3 compatible service)
/// through the AWS SDK for C++.
///
/// The SDK is initialized when the provider is made and shut down when it is
/// destroyed, so at most one provider should exist at a time. Every client
/// returned by Connect owns its own SDK client.
///
/// The region is read from $HOME/.aws/config, then env[AWS_DEFAULT_REGION],
/// then defaults to us-east-1. Setting env[S3MP_AWS_TEST_ENDPOINT] sends
/// requests to a plain HTTP endpoint with path style addressing, as used by
/// local S3 compatible servers. Credentials come from the usual AWS
/// credential chain.
class S3MP_EXPORT S3StorageProvider : public StorageProvider {
public:
  ~S3StorageProvider() override;
  S3StorageProvider(const S3StorageProvider&) = delete;
  S3StorageProvider& operator=(const S3StorageProvider&) = delete;

  static Result<std::unique_ptr<S3StorageProvider>> Make();

  Result<std::unique_ptr<StorageClient>> Connect() override;

  std::string_view scheme() const override {
    return ObjectLocator::kS3Scheme;
  }

private:
  S3StorageProvider() = default;
};

}  // namespace s3mp

#endif
