#pragma once

#include <cstddef>

#include "constants.hpp"

namespace stratus {

/**
 * After creation or an update, a Lambda function is in a pending state until all required resources are available
 * (cf. https://docs.aws.amazon.com/lambda/latest/dg/functions-states.html). We poll the function's state until it
 * settles before issuing the next step. Without VPC configuration this takes seconds, with VPC configuration it may
 * take several minutes.
 */
inline constexpr size_t kFunctionStatePollingTimeoutSeconds = 300;

/**
 * The interval for polling a function's state.
 */
inline constexpr size_t kFunctionStatePollingIntervalMilliseconds = 1000;

/**
 * Read-only calls are retried on throttling and transient faults. Mutating calls are never retried.
 */
inline constexpr size_t kReadRetryAttempts = 3;
inline constexpr size_t kReadRetryBackoffBaseMilliseconds = 200;

/**
 * Code packages are read into memory before they are delivered. Anything larger than this cannot be a valid Lambda
 * deployment package, not even via S3.
 */
inline constexpr size_t kMaxArtifactSizeBytes = 250 * 1024 * 1024;

/**
 * Connection settings for the service clients.
 */
inline constexpr size_t kClientRequestTimeoutMilliseconds = 60'000;
inline constexpr size_t kClientConnectTimeoutMilliseconds = 5'000;

}  // namespace stratus
