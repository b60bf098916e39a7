#include "s3.h"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/auth/STSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>

#include "s3mp/Env.h"

namespace {

constexpr const char* kDefaultS3Region = "us-east-1";

class S3mpCredentialsChain : public Aws::Auth::AWSCredentialsProviderChain {
public:
  S3mpCredentialsChain() : AWSCredentialsProviderChain() {
    using s3mp::kAwsTag;
    AddProvider(
        Aws::MakeShared<Aws::Auth::EnvironmentAWSCredentialsProvider>(kAwsTag));
    AddProvider(
        Aws::MakeShared<Aws::Auth::ProfileConfigFileAWSCredentialsProvider>(
            kAwsTag));
    AddProvider(
        Aws::MakeShared<Aws::Auth::ProcessCredentialsProvider>(kAwsTag));
    AddProvider(
        Aws::MakeShared<Aws::Auth::STSAssumeRoleWebIdentityCredentialsProvider>(
            kAwsTag));

    // Based on source code from the Default provider chain
    std::string relative_uri;
    std::string absolute_uri;
    bool ec2_metadata_disabled = false;

    s3mp::GetEnv("AWS_CONTAINER_CREDENTIALS_RELATIVE_URI", &relative_uri);
    s3mp::GetEnv("AWS_CONTAINER_CREDENTIALS_FULL_URI", &absolute_uri);
    s3mp::GetEnv("AWS_EC2_METADATA_DISABLED", &ec2_metadata_disabled);

    if (!relative_uri.empty()) {
      AddProvider(Aws::MakeShared<Aws::Auth::TaskRoleCredentialsProvider>(
          kAwsTag, relative_uri.c_str()));
    } else if (!absolute_uri.empty()) {
      std::string token;
      s3mp::GetEnv("AWS_CONTAINER_AUTHORIZATION_TOKEN", &token);
      AddProvider(Aws::MakeShared<Aws::Auth::TaskRoleCredentialsProvider>(
          kAwsTag, absolute_uri.c_str(), token.c_str()));
    } else if (!ec2_metadata_disabled) {
      AddProvider(
          Aws::MakeShared<Aws::Auth::InstanceProfileCredentialsProvider>(
              kAwsTag));
    }
  }
};

}  // namespace

std::shared_ptr<Aws::S3::S3Client>
s3mp::GetS3Client() {
  Aws::Client::ClientConfiguration cfg("default");

  bool use_virtual_addressing = true;

  std::string region;
  if (GetEnv("AWS_DEFAULT_REGION", &region)) {
    cfg.region = region;
  }

  if (cfg.region.empty()) {
    // The AWS SDK says the default region is us-east-1 but it appears we need
    // to set it ourselves.
    cfg.region = kDefaultS3Region;
  }

  std::string test_endpoint;
  // No official AWS environment analog so use S3MP prefix
  GetEnv("S3MP_AWS_TEST_ENDPOINT", &test_endpoint);
  if (!test_endpoint.empty()) {
    cfg.endpointOverride = test_endpoint;
    cfg.scheme = Aws::Http::Scheme::HTTP;

    // if false SDK will build "path-style" URLs if true the URLs will be
    // "virtual-host-style" URLs. Local S3 compatible servers generally only
    // support the former but they are deprecated for new buckets in s3
    use_virtual_addressing = false;
  }

  return Aws::MakeShared<Aws::S3::S3Client>(
      kAwsTag, Aws::MakeShared<S3mpCredentialsChain>(kAwsTag), cfg,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing);
}
