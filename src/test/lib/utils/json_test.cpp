#include "utils/json.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "testing/aws_test.hpp"

namespace stratus {

class JsonTest : public ::testing::Test {
 protected:
  const AwsApi aws_api_;
};

TEST_F(JsonTest, RecognizesStringArrays) {
  EXPECT_TRUE(IsJsonStringArray(Aws::Utils::Json::JsonValue(R"(["a", "b"])").View()));
  EXPECT_TRUE(IsJsonStringArray(Aws::Utils::Json::JsonValue("[]").View()));
  EXPECT_FALSE(IsJsonStringArray(Aws::Utils::Json::JsonValue(R"(["a", 1])").View()));
  EXPECT_FALSE(IsJsonStringArray(Aws::Utils::Json::JsonValue(R"({"a": "b"})").View()));
}

TEST_F(JsonTest, RecognizesStringObjects) {
  EXPECT_TRUE(IsJsonStringObject(Aws::Utils::Json::JsonValue(R"({"a": "b"})").View()));
  EXPECT_TRUE(IsJsonStringObject(Aws::Utils::Json::JsonValue("{}").View()));
  EXPECT_FALSE(IsJsonStringObject(Aws::Utils::Json::JsonValue(R"({"a": true})").View()));
  EXPECT_FALSE(IsJsonStringObject(Aws::Utils::Json::JsonValue(R"(["a"])").View()));
}

TEST_F(JsonTest, ConvertsArraysAndObjects) {
  const Aws::Utils::Json::JsonValue strings(R"(["sg-1", "sg-2"])");
  EXPECT_THAT(JsonArrayToVector<std::string>(strings.View().AsArray()), testing::ElementsAre("sg-1", "sg-2"));

  const Aws::Utils::Json::JsonValue numbers("[1, 2, 3]");
  EXPECT_THAT(JsonArrayToVector<int>(numbers.View().AsArray()), testing::ElementsAre(1, 2, 3));

  const Aws::Utils::Json::JsonValue object(R"({"STAGE": "prod", "REGION": "eu-central-1"})");
  EXPECT_THAT(JsonObjectToStringMap(object.View()),
              testing::ElementsAre(testing::Pair("REGION", "eu-central-1"), testing::Pair("STAGE", "prod")));
}

}  // namespace stratus
