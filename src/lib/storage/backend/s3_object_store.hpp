#pragma once

#include <memory>
#include <string>

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>

#include "object_store.hpp"

namespace stratus {

ObjectStoreErrorType TranslateS3Error(const Aws::S3::S3Errors error);

class S3ObjectStore : public ObjectStore {
 public:
  S3ObjectStore(std::shared_ptr<const Aws::S3::S3Client> client, std::string region);

  ObjectStoreError HeadBucket(const std::string& bucket) override;
  ObjectStoreError CreateBucket(const std::string& bucket) override;
  ObjectStoreError PutObject(const std::string& bucket, const std::string& key,
                         const std::shared_ptr<const std::string>& object) override;

 private:
  std::shared_ptr<const Aws::S3::S3Client> client_;
  const std::string region_;
};

}  // namespace stratus
