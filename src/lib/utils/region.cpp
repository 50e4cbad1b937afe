#include "region.hpp"

#include <cstdlib>

#include <aws/core/internal/AWSHttpResourceClient.h>

namespace stratus {

std::string GetAwsRegion() {
  for (const char* variable : {"AWS_REGION", "AWS_DEFAULT_REGION"}) {
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char* aws_region = std::getenv(variable);
    if (aws_region && *aws_region != '\0') {
      return aws_region;
    }
  }

  // Runners on EC2 instances can fetch the region from the metadata service.
  Aws::Internal::InitEC2MetadataClient();
  auto client = Aws::Internal::GetEC2MetadataClient();
  return client ? client->GetCurrentRegion() : "";
}

}  // namespace stratus
