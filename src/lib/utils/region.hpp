#pragma once

#include <string>

namespace stratus {

/*
 * Determine the AWS region of the caller from AWS_REGION or AWS_DEFAULT_REGION, falling back to the EC2 metadata
 * service. If no region is found, an empty string is returned and the SDK's profile configuration applies.
 */
std::string GetAwsRegion();

}  // namespace stratus
