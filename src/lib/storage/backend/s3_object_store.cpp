#include "s3_object_store.hpp"

#include <aws/core/utils/logging/LogMacros.h>
#include <aws/s3/model/BucketLocationConstraint.h>
#include <aws/s3/model/CreateBucketConfiguration.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/PutObjectRequest.h>

#include "constants.hpp"

namespace stratus {

namespace {

template <class AwsOutcomeClass>
ObjectStoreError GetErrorFromOutcome(const AwsOutcomeClass& outcome) {
  const auto& error = outcome.GetError();
  return ObjectStoreError(TranslateS3Error(error.GetErrorType()), error.GetMessage());
}

}  // namespace

ObjectStoreErrorType TranslateS3Error(const Aws::S3::S3Errors error) {
  switch (error) {
    case Aws::S3::S3Errors::INCOMPLETE_SIGNATURE:
    case Aws::S3::S3Errors::INVALID_ACTION:
    case Aws::S3::S3Errors::INVALID_PARAMETER_COMBINATION:
    case Aws::S3::S3Errors::INVALID_PARAMETER_VALUE:
    case Aws::S3::S3Errors::INVALID_QUERY_PARAMETER:
    case Aws::S3::S3Errors::INVALID_SIGNATURE:
    case Aws::S3::S3Errors::MALFORMED_QUERY_STRING:
    case Aws::S3::S3Errors::MISSING_ACTION:
    case Aws::S3::S3Errors::MISSING_PARAMETER:
    case Aws::S3::S3Errors::OPT_IN_REQUIRED:
    case Aws::S3::S3Errors::REQUEST_EXPIRED:
    case Aws::S3::S3Errors::REQUEST_TIME_TOO_SKEWED:
      return ObjectStoreErrorType::kInvalidArgument;

    case Aws::S3::S3Errors::INTERNAL_FAILURE:
    case Aws::S3::S3Errors::SERVICE_UNAVAILABLE:
      return ObjectStoreErrorType::kInternalError;

    // A bucket we already own is as good as a freshly created one.
    case Aws::S3::S3Errors::BUCKET_ALREADY_EXISTS:
    case Aws::S3::S3Errors::BUCKET_ALREADY_OWNED_BY_YOU:
      return ObjectStoreErrorType::kAlreadyExist;

    case Aws::S3::S3Errors::ACCESS_DENIED:
    case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
    case Aws::S3::S3Errors::INVALID_CLIENT_TOKEN_ID:
    case Aws::S3::S3Errors::MISSING_AUTHENTICATION_TOKEN:
    case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
    case Aws::S3::S3Errors::UNRECOGNIZED_CLIENT:
    case Aws::S3::S3Errors::VALIDATION:
      return ObjectStoreErrorType::kPermissionDenied;

    case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
    case Aws::S3::S3Errors::NO_SUCH_BUCKET:
    case Aws::S3::S3Errors::NO_SUCH_KEY:
      return ObjectStoreErrorType::kNotFound;

    case Aws::S3::S3Errors::SLOW_DOWN:
    case Aws::S3::S3Errors::THROTTLING:
      return ObjectStoreErrorType::kTemporary;

    case Aws::S3::S3Errors::NETWORK_CONNECTION:
    case Aws::S3::S3Errors::REQUEST_TIMEOUT:
      return ObjectStoreErrorType::kIOError;

    default:
      return ObjectStoreErrorType::kUnknown;
  }
}

S3ObjectStore::S3ObjectStore(std::shared_ptr<const Aws::S3::S3Client> client, std::string region)
    : client_(std::move(client)), region_(std::move(region)) {}

ObjectStoreError S3ObjectStore::HeadBucket(const std::string& bucket) {
  const auto head_bucket_outcome = client_->HeadBucket(Aws::S3::Model::HeadBucketRequest().WithBucket(bucket));
  if (!head_bucket_outcome.IsSuccess()) {
    return GetErrorFromOutcome(head_bucket_outcome);
  }

  return ObjectStoreError::Success();
}

ObjectStoreError S3ObjectStore::CreateBucket(const std::string& bucket) {
  auto create_bucket_request = Aws::S3::Model::CreateBucketRequest().WithBucket(bucket);

  if (!region_.empty() && region_ != kS3DefaultRegion) {
    create_bucket_request.WithCreateBucketConfiguration(
        Aws::S3::Model::CreateBucketConfiguration().WithLocationConstraint(
            Aws::S3::Model::BucketLocationConstraintMapper::GetBucketLocationConstraintForName(region_)));
  }

  const auto create_bucket_outcome = client_->CreateBucket(create_bucket_request);
  if (!create_bucket_outcome.IsSuccess()) {
    return GetErrorFromOutcome(create_bucket_outcome);
  }

  AWS_LOGSTREAM_INFO(kBaseTag.c_str(), "Created bucket " << bucket << " in " << region_ << ".");
  return ObjectStoreError::Success();
}

ObjectStoreError S3ObjectStore::PutObject(const std::string& bucket, const std::string& key,
                                      const std::shared_ptr<const std::string>& object) {
  auto stream = Aws::MakeShared<Aws::StringStream>(kBaseTag.c_str());
  stream->write(object->data(), static_cast<std::streamsize>(object->size()));

  auto put_object_request = Aws::S3::Model::PutObjectRequest().WithBucket(bucket).WithKey(key);
  put_object_request.SetBody(stream);
  put_object_request.SetContentLength(static_cast<long long>(object->size()));

  const auto put_object_outcome = client_->PutObject(put_object_request);
  if (!put_object_outcome.IsSuccess()) {
    AWS_LOGSTREAM_ERROR(kBaseTag.c_str(), put_object_outcome.GetError().GetExceptionName()
                                              << ": " << put_object_outcome.GetError().GetMessage());
    return GetErrorFromOutcome(put_object_outcome);
  }

  AWS_LOGSTREAM_INFO(kBaseTag.c_str(), "s3://" << bucket << "/" << key << " was uploaded successfully.");
  return ObjectStoreError::Success();
}

}  // namespace stratus
