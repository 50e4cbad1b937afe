#include "storage/backend/s3_object_store.hpp"

#include <gtest/gtest.h>

namespace stratus {

TEST(S3ObjectStoreTest, TranslatesS3Errors) {
  EXPECT_EQ(TranslateS3Error(Aws::S3::S3Errors::NO_SUCH_BUCKET), ObjectStoreErrorType::kNotFound);
  EXPECT_EQ(TranslateS3Error(Aws::S3::S3Errors::RESOURCE_NOT_FOUND), ObjectStoreErrorType::kNotFound);
  EXPECT_EQ(TranslateS3Error(Aws::S3::S3Errors::BUCKET_ALREADY_OWNED_BY_YOU), ObjectStoreErrorType::kAlreadyExist);
  EXPECT_EQ(TranslateS3Error(Aws::S3::S3Errors::BUCKET_ALREADY_EXISTS), ObjectStoreErrorType::kAlreadyExist);
  EXPECT_EQ(TranslateS3Error(Aws::S3::S3Errors::ACCESS_DENIED), ObjectStoreErrorType::kPermissionDenied);
  EXPECT_EQ(TranslateS3Error(Aws::S3::S3Errors::SLOW_DOWN), ObjectStoreErrorType::kTemporary);
  EXPECT_EQ(TranslateS3Error(Aws::S3::S3Errors::INTERNAL_FAILURE), ObjectStoreErrorType::kInternalError);
  EXPECT_EQ(TranslateS3Error(Aws::S3::S3Errors::INVALID_PARAMETER_VALUE), ObjectStoreErrorType::kInvalidArgument);
}

}  // namespace stratus
