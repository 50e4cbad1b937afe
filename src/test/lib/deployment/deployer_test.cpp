#include "deployment/deployer.hpp"

#include <cstdio>
#include <fstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "deployment/deployment_errors.hpp"
#include "deployment/result_reporter.hpp"
#include "mock_function_service.hpp"
#include "storage/backend/mock_object_store.hpp"
#include "testing/aws_test.hpp"

namespace stratus {

class DeployerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    function_service_ = std::make_shared<MockFunctionService>();
    object_store_ = std::make_shared<MockObjectStore>();
    artifact_path_ = ::testing::TempDir() + "deployer_test.zip";
    std::ofstream output_stream(artifact_path_, std::ios::binary | std::ios::trunc);
    output_stream << "PK deployer";
  }

  void TearDown() override { std::remove(artifact_path_.c_str()); }

  Deployer MakeDeployer() const {
    return Deployer(function_service_, object_store_,
                    RetryPolicy{.retry_attempts = 1, .backoff_base = std::chrono::milliseconds(0)},
                    ExecutorOptions{.polling_interval = std::chrono::milliseconds(0),
                                    .polling_timeout = std::chrono::milliseconds(1'000)});
  }

  DeploymentInput MakeInput() const {
    DeploymentInput input;
    input.identity = {"f1"};
    input.code_artifact = artifact_path_;
    input.config.role = "arn:aws:iam::123456789012:role/x";
    input.publish = true;
    input.dry_run = false;
    return input;
  }

  const AwsApi aws_api_;
  std::shared_ptr<MockFunctionService> function_service_;
  std::shared_ptr<MockObjectStore> object_store_;
  std::string artifact_path_;
};

TEST_F(DeployerTest, CreatesAndPublishesMissingFunction) {
  const auto result = MakeDeployer().Deploy(MakeInput());

  EXPECT_EQ(result.function_arn, std::string(MockFunctionService::kAccountArnPrefix) + "f1");
  EXPECT_EQ(result.published_version, "1");
  EXPECT_THAT(result.operations_applied, testing::SizeIs(2));
  EXPECT_EQ(ReportResult(result), (DeploymentOutputs{.function_arn = result.function_arn, .published_version = "1"}));

  const auto stored_function = function_service_->GetStoredFunction("f1");
  ASSERT_TRUE(stored_function.has_value());
  EXPECT_EQ(stored_function->config.handler, "index.handler");
  EXPECT_EQ(stored_function->config.runtime, "nodejs20.x");
  EXPECT_EQ(stored_function->config.timeout, 3);
  EXPECT_EQ(stored_function->config.ephemeral_storage, 512);
}

TEST_F(DeployerTest, SecondRunIsNoOp) {
  MakeDeployer().Deploy(MakeInput());
  const size_t mutating_calls = function_service_->CountMutatingCalls();

  const auto result = MakeDeployer().Deploy(MakeInput());

  EXPECT_EQ(function_service_->CountMutatingCalls(), mutating_calls);
  ASSERT_EQ(result.operations_applied.size(), 1);
  EXPECT_EQ(result.operations_applied.front().GetType(), OperationType::kNoOp);
  EXPECT_EQ(result.function_arn, std::string(MockFunctionService::kAccountArnPrefix) + "f1");
  EXPECT_FALSE(ReportResult(result).published_version.has_value());
}

TEST_F(DeployerTest, UpdatesChangedConfigurationOnly) {
  MakeDeployer().Deploy(MakeInput());
  auto input = MakeInput();
  input.config.timeout = 30;

  const auto result = MakeDeployer().Deploy(input);

  EXPECT_EQ(result.published_version, "2");
  EXPECT_EQ(function_service_->CountCalls("UpdateFunctionCode"), 0);
  ASSERT_EQ(function_service_->GetConfigurationUpdates().size(), 1);
  EXPECT_EQ(function_service_->GetConfigurationUpdates().front(), (FunctionConfig{.timeout = 30}));
}

TEST_F(DeployerTest, DryRunStillValidatesRole) {
  auto input = MakeInput();
  input.config.role.reset();
  input.dry_run = true;

  EXPECT_THROW(
      try { MakeDeployer().Deploy(input); } catch (const ValidationException& exception) {
        EXPECT_THAT(exception.GetViolations(), testing::ElementsAre(testing::HasSubstr("role is required")));
        throw;
      },
      ValidationException);
  EXPECT_EQ(function_service_->CountMutatingCalls(), 0);
}

TEST_F(DeployerTest, DryRunIssuesNoMutations) {
  auto input = MakeInput();
  input.dry_run = true;

  const auto result = MakeDeployer().Deploy(input);

  EXPECT_TRUE(result.dry_run);
  EXPECT_EQ(function_service_->CountMutatingCalls(), 0);
  EXPECT_EQ(ReportResult(result), DeploymentOutputs{});
}

TEST_F(DeployerTest, InvalidInputFailsBeforeRemoteCalls) {
  auto input = MakeInput();
  input.config.memory_size = 64;

  EXPECT_THROW(MakeDeployer().Deploy(input), ValidationException);
  EXPECT_TRUE(function_service_->GetCalls().empty());
  EXPECT_TRUE(object_store_->GetCalls().empty());
}

TEST_F(DeployerTest, StagesLargePackagesInBucket) {
  auto input = MakeInput();
  input.s3_bucket = "artifacts";
  input.s3_key = "f1.zip";

  MakeDeployer().Deploy(input);

  EXPECT_NE(object_store_->GetObject("artifacts", "f1.zip"), nullptr);
  EXPECT_EQ(function_service_->CountCalls("CreateFunction"), 1);
}

}  // namespace stratus
