#include "deployment/deployment_plan.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace stratus {

class DeploymentPlanTest : public ::testing::Test {
 protected:
  static CodeSource MakeInlineCode() {
    return InlineCode{.bytes = std::make_shared<const std::string>(16, 'x'), .sha256 = "sha"};
  }
};

TEST_F(DeploymentPlanTest, NamesOperationTypes) {
  EXPECT_EQ(OperationTypeToString(OperationType::kCreateFunction), "CreateFunction");
  EXPECT_EQ(OperationTypeToString(OperationType::kUpdateConfiguration), "UpdateConfiguration");
  EXPECT_EQ(OperationTypeToString(OperationType::kNoOp), "NoOp");
}

TEST_F(DeploymentPlanTest, DescribesOperations) {
  const Operation create{.payload = CreateFunctionOperation{.config = {.handler = "index.handler", .timeout = 3},
                                                            .code_source = MakeInlineCode()}};
  EXPECT_EQ(create.Describe(), "CreateFunction(handler, timeout; inline package (16 bytes))");

  const Operation update_code{.payload = UpdateCodeOperation{.code_source = ObjectStoreCode{.bucket = "b", .key = "k"},
                                                             .architecture = "arm64"},
                              .simulated = true};
  EXPECT_EQ(update_code.Describe(), "would UpdateCode(s3://b/k; architecture arm64)");

  const Operation publish{.payload = PublishVersionOperation{}};
  EXPECT_EQ(publish.Describe(), "PublishVersion");
}

TEST_F(DeploymentPlanTest, OnlyNoOpIsNotMutating) {
  EXPECT_FALSE(Operation{.payload = NoOpOperation{}}.IsMutating());
  EXPECT_TRUE(Operation{.payload = PublishVersionOperation{}}.IsMutating());
  EXPECT_TRUE(Operation{.payload = UpdateConfigurationOperation{}}.IsMutating());
}

TEST_F(DeploymentPlanTest, DetectsNoOpPlan) {
  DeploymentPlan plan;
  plan.operations.push_back(Operation{.payload = NoOpOperation{}});
  EXPECT_TRUE(plan.IsNoOp());

  plan.operations = {Operation{.payload = UpdateCodeOperation{.code_source = MakeInlineCode()}},
                     Operation{.payload = PublishVersionOperation{}}};
  EXPECT_FALSE(plan.IsNoOp());
  EXPECT_THAT(plan.GetOperationTypes(),
              testing::ElementsAre(OperationType::kUpdateCode, OperationType::kPublishVersion));
}

TEST_F(DeploymentPlanTest, ReportsCodeDigest) {
  EXPECT_EQ(GetCodeSha256(MakeInlineCode()), "sha");
  EXPECT_FALSE(GetCodeSha256(ObjectStoreCode{.bucket = "b", .key = "k"}).has_value());
  EXPECT_EQ(DescribeCodeSource(ObjectStoreCode{.bucket = "b", .key = "k"}), "s3://b/k");
}

}  // namespace stratus
