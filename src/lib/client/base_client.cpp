#include "base_client.hpp"

#include <aws/core/client/DefaultRetryStrategy.h>

#include "configuration.hpp"
#include "utils/assert.hpp"
#include "utils/region.hpp"

namespace stratus {

BaseClient::BaseClient() {
  const auto credentials_provider = std::make_shared<Aws::Auth::DefaultAWSCredentialsProviderChain>();
  if (credentials_provider->GetAWSCredentials().IsExpiredOrEmpty()) {
    Fail("AWS credentials are missing or expired. Configure a profile or export AWS_ACCESS_KEY_ID and "
         "AWS_SECRET_ACCESS_KEY.\n");
  }

  auto client_configuration_lambda = GenerateClientConfig();
  client_region_ = client_configuration_lambda.region;
  // Mutating Lambda calls must be issued at most once. Reads are retried by the deployer itself.
  client_configuration_lambda.retryStrategy = std::make_shared<Aws::Client::DefaultRetryStrategy>(0);

  const auto client_configuration_s3 = GenerateClientConfig();

  const auto endpoint_provider = std::make_shared<Aws::S3::S3EndpointProvider>();

  lambda_client_ =
      std::make_shared<const Aws::Lambda::LambdaClient>(credentials_provider, client_configuration_lambda);
  s3_client_ =
      std::make_shared<const Aws::S3::S3Client>(credentials_provider, endpoint_provider, client_configuration_s3);
}

std::shared_ptr<const Aws::Lambda::LambdaClient> BaseClient::GetLambdaClient() const { return lambda_client_; }

std::shared_ptr<const Aws::S3::S3Client> BaseClient::GetS3Client() const { return s3_client_; }

const Aws::String& BaseClient::GetClientRegion() const { return client_region_; }

Aws::Client::ClientConfiguration BaseClient::GenerateClientConfig() {
  Aws::Client::ClientConfiguration client_configuration;
  const std::string region = GetAwsRegion();
  if (!region.empty()) {
    client_configuration.region = region;
  }
  client_configuration.scheme = kHttpScheme;
  client_configuration.maxConnections = kMaxConnections;
  client_configuration.requestTimeoutMs = kClientRequestTimeoutMilliseconds;
  client_configuration.connectTimeoutMs = kClientConnectTimeoutMilliseconds;
  client_configuration.enableTcpKeepAlive = kEnableTcpKeepAlive;
  client_configuration.verifySSL = kVerifySsl;

  return client_configuration;
}

}  // namespace stratus
