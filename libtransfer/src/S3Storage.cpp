#include "s3mp/S3Storage.h"

#include <atomic>

#include <aws/core/Aws.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/core/utils/stream/ResponseStream.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CopyObjectRequest.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListMultipartUploadsRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/StorageClass.h>
#include <aws/s3/model/UploadPartCopyRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include "s3.h"
#include "s3mp/Logging.h"

namespace {

Aws::SDKOptions sdk_options;
std::atomic<bool> sdk_initialized{false};

Aws::String
CopySource(const s3mp::ObjectLocator& source) {
  return s3mp::ToAwsString(source.container()) + "/" +
         Aws::Utils::StringUtils::URLEncode(
             s3mp::ToAwsString(source.key()).c_str());
}

/// S3StorageClient issues synchronous requests through one SDK client
class S3StorageClient : public s3mp::StorageClient {
public:
  explicit S3StorageClient(std::shared_ptr<Aws::S3::S3Client> client)
      : client_(std::move(client)) {}

  s3mp::Result<s3mp::ObjectInfo> HeadObject(
      const s3mp::ObjectLocator& object) override;

  s3mp::Result<std::string> InitiateMultipart(
      const s3mp::ObjectLocator& dest,
      const s3mp::WriteOptions& opts) override;

  s3mp::Result<std::string> UploadPart(
      const s3mp::ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, const uint8_t* data, uint64_t size) override;

  s3mp::Result<std::string> CopyPart(
      const s3mp::ObjectLocator& dest, const std::string& transaction_id,
      uint32_t part_index, const s3mp::ObjectLocator& source,
      const s3mp::ByteRange& range) override;

  s3mp::Result<void> CompleteMultipart(
      const s3mp::ObjectLocator& dest, const std::string& transaction_id,
      const std::vector<s3mp::PartAck>& parts) override;

  s3mp::Result<void> AbortMultipart(
      const s3mp::ObjectLocator& dest,
      const std::string& transaction_id) override;

  s3mp::Result<void> GetRange(
      const s3mp::ObjectLocator& source, const s3mp::ByteRange& range,
      uint8_t* data) override;

  s3mp::Result<void> PutObject(
      const s3mp::ObjectLocator& dest, const uint8_t* data, uint64_t size,
      const s3mp::WriteOptions& opts) override;

  s3mp::Result<std::vector<uint8_t>> GetObject(
      const s3mp::ObjectLocator& source) override;

  s3mp::Result<void> CopyObject(
      const s3mp::ObjectLocator& source, const s3mp::ObjectLocator& dest,
      const s3mp::WriteOptions& opts) override;

  s3mp::Result<std::vector<s3mp::MultipartTransaction>>
  ListMultipartTransactions(const s3mp::ObjectLocator& locator) override;

private:
  std::shared_ptr<Aws::S3::S3Client> client_;
};

s3mp::Result<s3mp::ObjectInfo>
S3StorageClient::HeadObject(const s3mp::ObjectLocator& object) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(s3mp::ToAwsString(object.container()));
  request.SetKey(s3mp::ToAwsString(object.key()));

  auto outcome = client_->HeadObject(request);
  if (auto res = s3mp::CheckS3Error(outcome, "HeadObject"); !res) {
    return res.error().WithContext("{}", object);
  }
  const auto& result = outcome.GetResult();
  return s3mp::ObjectInfo{
      static_cast<uint64_t>(result.GetContentLength()),
      std::string(s3mp::FromAwsString(result.GetETag()))};
}

s3mp::Result<std::string>
S3StorageClient::InitiateMultipart(
    const s3mp::ObjectLocator& dest, const s3mp::WriteOptions& opts) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(s3mp::ToAwsString(dest.container()));
  request.SetKey(s3mp::ToAwsString(dest.key()));
  request.SetContentType(s3mp::ToAwsString(opts.content_type));
  if (opts.reduced_redundancy) {
    request.SetStorageClass(
        Aws::S3::Model::StorageClass::REDUCED_REDUNDANCY);
  }

  auto outcome = client_->CreateMultipartUpload(request);
  if (auto res = s3mp::CheckS3Error(outcome, "CreateMultipartUpload"); !res) {
    return res.error().WithContext("{}", dest);
  }
  return std::string(s3mp::FromAwsString(outcome.GetResult().GetUploadId()));
}

s3mp::Result<std::string>
S3StorageClient::UploadPart(
    const s3mp::ObjectLocator& dest, const std::string& transaction_id,
    uint32_t part_index, const uint8_t* data, uint64_t size) {
  // The stream buffer only has to outlive the synchronous request
  Aws::Utils::Stream::PreallocatedStreamBuf stream_buf(
      const_cast<uint8_t*>(data), static_cast<size_t>(size));
  auto body = Aws::MakeShared<Aws::IOStream>(s3mp::kAwsTag, &stream_buf);

  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(s3mp::ToAwsString(dest.container()));
  request.SetKey(s3mp::ToAwsString(dest.key()));
  request.SetUploadId(s3mp::ToAwsString(transaction_id));
  request.SetPartNumber(static_cast<int>(part_index));
  request.SetContentLength(static_cast<long long>(size));
  request.SetBody(body);

  auto outcome = client_->UploadPart(request);
  if (auto res = s3mp::CheckS3Error(outcome, "UploadPart"); !res) {
    return res.error().WithContext("part {} of {}", part_index, dest);
  }
  return std::string(s3mp::FromAwsString(outcome.GetResult().GetETag()));
}

s3mp::Result<std::string>
S3StorageClient::CopyPart(
    const s3mp::ObjectLocator& dest, const std::string& transaction_id,
    uint32_t part_index, const s3mp::ObjectLocator& source,
    const s3mp::ByteRange& range) {
  Aws::S3::Model::UploadPartCopyRequest request;
  request.SetBucket(s3mp::ToAwsString(dest.container()));
  request.SetKey(s3mp::ToAwsString(dest.key()));
  request.SetUploadId(s3mp::ToAwsString(transaction_id));
  request.SetPartNumber(static_cast<int>(part_index));
  request.SetCopySource(CopySource(source));
  request.SetCopySourceRange(s3mp::S3RangeHeader(range.start, range.end));

  auto outcome = client_->UploadPartCopy(request);
  if (auto res = s3mp::CheckS3Error(outcome, "UploadPartCopy"); !res) {
    return res.error().WithContext(
        "part {} of {} from {}", part_index, dest, source);
  }
  return std::string(
      s3mp::FromAwsString(outcome.GetResult().GetCopyPartResult().GetETag()));
}

s3mp::Result<void>
S3StorageClient::CompleteMultipart(
    const s3mp::ObjectLocator& dest, const std::string& transaction_id,
    const std::vector<s3mp::PartAck>& parts) {
  Aws::S3::Model::CompletedMultipartUpload completed;
  for (const auto& ack : parts) {
    completed.AddParts(Aws::S3::Model::CompletedPart()
                           .WithPartNumber(static_cast<int>(ack.part_index))
                           .WithETag(s3mp::ToAwsString(ack.tag)));
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(s3mp::ToAwsString(dest.container()));
  request.SetKey(s3mp::ToAwsString(dest.key()));
  request.SetUploadId(s3mp::ToAwsString(transaction_id));
  request.SetMultipartUpload(std::move(completed));

  auto outcome = client_->CompleteMultipartUpload(request);
  if (auto res = s3mp::CheckS3Error(outcome, "CompleteMultipartUpload"); !res) {
    return res.error().WithContext("{} ({} parts)", dest, parts.size());
  }
  return s3mp::ResultSuccess();
}

s3mp::Result<void>
S3StorageClient::AbortMultipart(
    const s3mp::ObjectLocator& dest, const std::string& transaction_id) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(s3mp::ToAwsString(dest.container()));
  request.SetKey(s3mp::ToAwsString(dest.key()));
  request.SetUploadId(s3mp::ToAwsString(transaction_id));

  auto outcome = client_->AbortMultipartUpload(request);
  if (auto res = s3mp::CheckS3Error(outcome, "AbortMultipartUpload"); !res) {
    return res.error().WithContext("{}", dest);
  }
  return s3mp::ResultSuccess();
}

s3mp::Result<void>
S3StorageClient::GetRange(
    const s3mp::ObjectLocator& source, const s3mp::ByteRange& range,
    uint8_t* data) {
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(s3mp::ToAwsString(source.container()));
  request.SetKey(s3mp::ToAwsString(source.key()));
  request.SetRange(s3mp::S3RangeHeader(range.start, range.end));
  uint64_t length = range.size();
  request.SetResponseStreamFactory([data, length]() {
    return Aws::New<Aws::Utils::Stream::DefaultUnderlyingStream>(
        s3mp::kAwsTag,
        Aws::MakeUnique<Aws::Utils::Stream::PreallocatedStreamBuf>(
            s3mp::kAwsTag, data, static_cast<size_t>(length)));
  });

  auto outcome = client_->GetObject(request);
  if (auto res = s3mp::CheckS3Error(outcome, "GetObject"); !res) {
    return res.error().WithContext("{} {}", source, range);
  }
  auto received = static_cast<uint64_t>(outcome.GetResult().GetContentLength());
  if (received != length) {
    return S3MP_ERROR(
        s3mp::ErrorCode::TransientTransferError,
        "short read of {} {}: expected {} bytes, got {}", source, range, length,
        received);
  }
  return s3mp::ResultSuccess();
}

s3mp::Result<void>
S3StorageClient::PutObject(
    const s3mp::ObjectLocator& dest, const uint8_t* data, uint64_t size,
    const s3mp::WriteOptions& opts) {
  Aws::Utils::Stream::PreallocatedStreamBuf stream_buf(
      const_cast<uint8_t*>(data), static_cast<size_t>(size));
  auto body = Aws::MakeShared<Aws::IOStream>(s3mp::kAwsTag, &stream_buf);

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(s3mp::ToAwsString(dest.container()));
  request.SetKey(s3mp::ToAwsString(dest.key()));
  request.SetContentType(s3mp::ToAwsString(opts.content_type));
  request.SetContentLength(static_cast<long long>(size));
  if (opts.reduced_redundancy) {
    request.SetStorageClass(
        Aws::S3::Model::StorageClass::REDUCED_REDUNDANCY);
  }
  request.SetBody(body);

  auto outcome = client_->PutObject(request);
  if (auto res = s3mp::CheckS3Error(outcome, "PutObject"); !res) {
    return res.error().WithContext("{}", dest);
  }
  return s3mp::ResultSuccess();
}

s3mp::Result<std::vector<uint8_t>>
S3StorageClient::GetObject(const s3mp::ObjectLocator& source) {
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(s3mp::ToAwsString(source.container()));
  request.SetKey(s3mp::ToAwsString(source.key()));

  auto outcome = client_->GetObject(request);
  if (auto res = s3mp::CheckS3Error(outcome, "GetObject"); !res) {
    return res.error().WithContext("{}", source);
  }
  auto& result = outcome.GetResult();
  std::vector<uint8_t> bytes(static_cast<size_t>(result.GetContentLength()));
  auto& body = result.GetBody();
  body.read(reinterpret_cast<char*>(bytes.data()), bytes.size());
  if (static_cast<size_t>(body.gcount()) != bytes.size()) {
    return S3MP_ERROR(
        s3mp::ErrorCode::TransientTransferError,
        "short read of {}: expected {} bytes, got {}", source, bytes.size(),
        body.gcount());
  }
  return bytes;
}

s3mp::Result<void>
S3StorageClient::CopyObject(
    const s3mp::ObjectLocator& source, const s3mp::ObjectLocator& dest,
    const s3mp::WriteOptions& opts) {
  Aws::S3::Model::CopyObjectRequest request;
  request.SetBucket(s3mp::ToAwsString(dest.container()));
  request.SetKey(s3mp::ToAwsString(dest.key()));
  request.SetCopySource(CopySource(source));
  if (opts.reduced_redundancy) {
    request.SetStorageClass(
        Aws::S3::Model::StorageClass::REDUCED_REDUNDANCY);
  }

  auto outcome = client_->CopyObject(request);
  if (auto res = s3mp::CheckS3Error(outcome, "CopyObject"); !res) {
    return res.error().WithContext("{} to {}", source, dest);
  }
  return s3mp::ResultSuccess();
}

s3mp::Result<std::vector<s3mp::MultipartTransaction>>
S3StorageClient::ListMultipartTransactions(
    const s3mp::ObjectLocator& locator) {
  std::vector<s3mp::MultipartTransaction> transactions;

  Aws::S3::Model::ListMultipartUploadsRequest request;
  request.SetBucket(s3mp::ToAwsString(locator.container()));
  if (!locator.key().empty()) {
    request.SetPrefix(s3mp::ToAwsString(locator.key()));
  }

  while (true) {
    auto outcome = client_->ListMultipartUploads(request);
    if (auto res = s3mp::CheckS3Error(outcome, "ListMultipartUploads"); !res) {
      return res.error().WithContext("{}", locator);
    }
    const auto& result = outcome.GetResult();
    for (const auto& upload : result.GetUploads()) {
      transactions.emplace_back(s3mp::MultipartTransaction{
          std::string(s3mp::FromAwsString(upload.GetUploadId())),
          std::string(s3mp::FromAwsString(upload.GetKey())),
          std::string(
              s3mp::FromAwsString(upload.GetInitiator().GetDisplayName())),
          std::string(s3mp::FromAwsString(upload.GetInitiated().ToGmtString(
              Aws::Utils::DateFormat::ISO_8601))),
      });
    }
    if (!result.GetIsTruncated()) {
      break;
    }
    request.SetKeyMarker(result.GetNextKeyMarker());
    request.SetUploadIdMarker(result.GetNextUploadIdMarker());
  }
  return transactions;
}

}  // namespace

s3mp::Result<std::unique_ptr<s3mp::S3StorageProvider>>
s3mp::S3StorageProvider::Make() {
  bool expected = false;
  if (!sdk_initialized.compare_exchange_strong(expected, true)) {
    return S3MP_ERROR(
        ErrorCode::AlreadyExists, "an S3 storage provider already exists");
  }
  Aws::InitAPI(sdk_options);
  return std::unique_ptr<S3StorageProvider>(new S3StorageProvider());
}

s3mp::S3StorageProvider::~S3StorageProvider() {
  Aws::ShutdownAPI(sdk_options);
  sdk_initialized = false;
}

s3mp::Result<std::unique_ptr<s3mp::StorageClient>>
s3mp::S3StorageProvider::Connect() {
  auto client = GetS3Client();
  if (!client) {
    return S3MP_ERROR(ErrorCode::StorageError, "failed to create S3 client");
  }
  return std::unique_ptr<StorageClient>(new S3StorageClient(std::move(client)));
}
