#pragma once

#include <cstddef>
#include <string>
#include <string_view>


namespace stratus {

const std::string kConstPrefix = "k";

const std::string kBaseTag = "Stratus";
const std::string kDeployTag = "StratusDeploy";
const std::string kExecutorTag = "StratusExecutor";

/**
 * Defaults the deployer applies to a function that does not exist yet, for fields the caller omitted. An existing
 * function keeps its remote values instead.
 */
inline constexpr std::string_view kDefaultHandler = "index.handler";
inline constexpr std::string_view kDefaultRuntime = "nodejs20.x";
inline constexpr int kDefaultTimeoutSeconds = 3;
inline constexpr int kDefaultEphemeralStorageMb = 512;

/**
 * Defaults for the run flags. Without an explicit --dry_run=false, a run only validates and plans.
 */
inline constexpr bool kDefaultPublish = true;
inline constexpr bool kDefaultDryRun = true;

/**
 * Service-side parameter bounds (cf. https://docs.aws.amazon.com/lambda/latest/dg/gettingstarted-limits.html).
 */
inline constexpr int kLambdaMinimumMemorySizeMb = 128;
inline constexpr int kLambdaMaximumMemorySizeMb = 10240;
inline constexpr int kLambdaMinimumTimeoutSeconds = 1;
inline constexpr int kLambdaMaximumTimeoutSeconds = 900;
inline constexpr int kLambdaMinimumEphemeralStorageMb = 512;
inline constexpr int kLambdaMaximumEphemeralStorageMb = 10240;
inline constexpr size_t kLambdaMaximumFunctionNameLength = 64;

/**
 * Zip packages up to 50 MB can be passed to the service directly. Larger packages must be uploaded to S3 first and
 * referenced by bucket and key.
 */
inline constexpr size_t kLambdaDirectUploadLimitBytes = 50 * 1024 * 1024;

/**
 * S3 creates buckets in us-east-1 when no location constraint is passed; every other region requires one.
 */
inline constexpr std::string_view kS3DefaultRegion = "us-east-1";

}  // namespace stratus
