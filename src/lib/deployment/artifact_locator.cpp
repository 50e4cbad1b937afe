#include "artifact_locator.hpp"

#include <iomanip>
#include <sstream>

#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/logging/LogMacros.h>

#include "configuration.hpp"
#include "constants.hpp"
#include "deployment/deployment_errors.hpp"
#include "utils/assert.hpp"
#include "utils/filesystem.hpp"
#include "utils/string.hpp"

namespace stratus {

namespace {

constexpr size_t kObjectKeyDigestLength = 12;

// UTC keeps keys from runners in different time zones comparable.
std::string FormatUtcTimestamp(const std::time_t time_in_seconds) {
  tm calendar_date{};
  gmtime_r(&time_in_seconds, &calendar_date);

  std::stringstream timestamp;
  timestamp << std::put_time(&calendar_date, "%Y%m%dT%H%M%SZ");
  return timestamp.str();
}

[[noreturn]] void ThrowStorageError(const ArtifactRequest& request, const std::string& operation,
                                    const ObjectStoreError& error) {
  AWS_LOGSTREAM_ERROR(kDeployTag.c_str(), operation << " failed: " << error.GetMessage());
  throw DeploymentException(FaultKind::kServiceFault, operation, request.identity.name, ServiceErrorType::kFault,
                            error.GetMessage());
}

}  // namespace

std::string ComputeCodeSha256(const std::string& bytes) {
  return Aws::Utils::HashingUtils::Base64Encode(Aws::Utils::HashingUtils::CalculateSHA256(bytes));
}

std::string GenerateObjectKey(const std::string& function_name, const std::time_t time_in_seconds,
                              const std::string& hex_digest) {
  return SanitizeForObjectKey(function_name) + "/" + FormatUtcTimestamp(time_in_seconds) +
         "-" + hex_digest.substr(0, kObjectKeyDigestLength) + ".zip";
}

ArtifactLocator::ArtifactLocator(std::shared_ptr<ObjectStore> object_store) : object_store_(std::move(object_store)) {}

CodeSource ArtifactLocator::Locate(const ArtifactRequest& request) const {
  const auto bytes =
      std::make_shared<const std::string>(ReadFileToString(request.code_artifact, kMaxArtifactSizeBytes));
  const auto digest = Aws::Utils::HashingUtils::CalculateSHA256(*bytes);
  const std::string sha256 = Aws::Utils::HashingUtils::Base64Encode(digest);

  if (request.GetPackagingMode() == PackagingMode::kDirect) {
    if (bytes->size() > kLambdaDirectUploadLimitBytes) {
      throw ValidationException({"code_artifact '" + request.code_artifact + "' has " + std::to_string(bytes->size()) +
                                 " bytes and exceeds the direct upload limit of " +
                                 std::to_string(kLambdaDirectUploadLimitBytes) + " bytes; pass s3_bucket to upload "
                                 "it to S3 instead."});
    }
    AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Passing " << bytes->size() << " bytes inline (sha256 " << sha256 << ").");
    return InlineCode{.bytes = bytes, .sha256 = sha256};
  }

  Assert(object_store_ != nullptr, "Object-store packaging requires an object store.");

  const std::string& bucket = *request.s3_bucket;
  const std::string key = request.s3_key ? *request.s3_key
                                         : GenerateObjectKey(request.identity.name, std::time(nullptr),
                                                             std::string(Aws::Utils::HashingUtils::HexEncode(digest)));

  EnsureBucket(request);

  if (request.dry_run) {
    AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Dry run: would upload " << bytes->size() << " bytes to s3://" << bucket
                                                                    << "/" << key << ".");
  } else {
    const auto error = object_store_->PutObject(bucket, key, bytes);
    if (error) {
      ThrowStorageError(request, "PutObject", error);
    }
    AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Uploaded " << bytes->size() << " bytes to s3://" << bucket << "/" << key
                                                       << ".");
  }

  return ObjectStoreCode{.bucket = bucket, .key = key, .sha256 = sha256};
}

void ArtifactLocator::EnsureBucket(const ArtifactRequest& request) const {
  const std::string& bucket = *request.s3_bucket;

  const auto head_error = object_store_->HeadBucket(bucket);
  if (!head_error) {
    return;
  }
  if (head_error.GetType() != ObjectStoreErrorType::kNotFound) {
    ThrowStorageError(request, "HeadBucket", head_error);
  }

  AWS_LOGSTREAM_WARN(kDeployTag.c_str(), "Bucket '" << bucket << "' does not exist; bucket provisioning required.");
  if (request.dry_run) {
    return;
  }

  const auto create_error = object_store_->CreateBucket(bucket);
  // Another run may have provisioned the bucket in the meantime.
  if (create_error && create_error.GetType() != ObjectStoreErrorType::kAlreadyExist) {
    ThrowStorageError(request, "CreateBucket", create_error);
  }
  AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Provisioned bucket '" << bucket << "'.");
}

}  // namespace stratus
