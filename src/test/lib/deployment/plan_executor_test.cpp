#include "deployment/plan_executor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "deployment/deployment_errors.hpp"
#include "deployment/reconciler.hpp"
#include "mock_function_service.hpp"

namespace stratus {

class PlanExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    service_ = std::make_shared<MockFunctionService>();
    executor_ = std::make_unique<PlanExecutor>(
        service_,
        ExecutorOptions{.polling_interval = std::chrono::milliseconds(0),
                        .polling_timeout = std::chrono::milliseconds(60'000)},
        RetryPolicy{.retry_attempts = 3, .backoff_base = std::chrono::milliseconds(0)});
  }

  DeploymentPlan Plan(const FunctionConfig& desired, const std::string& sha256, const ReconcileOptions& options) {
    Reconciler reconciler({kFunctionName});
    reconciler.ObserveRemoteState(service_->GetStoredFunction(kFunctionName));
    return reconciler.BuildPlan(desired, InlineCode{.bytes = std::make_shared<const std::string>("zip"),
                                                    .sha256 = sha256},
                                options);
  }

  void AddExistingFunction(const LastUpdateStatus status = LastUpdateStatus::kSuccessful) {
    service_->AddFunction(kFunctionName, {.role = kRole, .timeout = 10}, "old-sha", status);
  }

  static DeploymentException ExecuteAndCatch(PlanExecutor& executor, const DeploymentPlan& plan) {
    try {
      executor.Execute(plan);
    } catch (const DeploymentException& exception) {
      return exception;
    }
    ADD_FAILURE() << "Expected a DeploymentException.";
    return DeploymentException(FaultKind::kServiceFault, "", "", ServiceErrorType::kNoError, "");
  }

  static constexpr auto kFunctionName = "f1";
  static constexpr auto kRole = "arn:aws:iam::123456789012:role/x";

  std::shared_ptr<MockFunctionService> service_;
  std::unique_ptr<PlanExecutor> executor_;
};

TEST_F(PlanExecutorTest, CreatesAndPublishes) {
  const auto plan = Plan({.handler = "index.handler", .runtime = "nodejs20.x", .role = kRole}, "sha",
                         {.publish = true, .dry_run = false});

  const auto result = executor_->Execute(plan);

  EXPECT_EQ(result.function_arn, "arn:aws:lambda:us-east-1:123456789012:function:f1");
  EXPECT_EQ(result.published_version, "1");
  EXPECT_FALSE(result.dry_run);
  ASSERT_EQ(result.operations_applied.size(), 2);
  EXPECT_THAT(service_->GetCalls(), testing::ElementsAre("CreateFunction", "GetFunction", "PublishVersion"));
}

TEST_F(PlanExecutorTest, WaitsForPendingFunctionBeforePublishing) {
  service_->SetPendingPolls(0, 3);
  const auto plan = Plan({.role = kRole}, "sha", {.publish = true, .dry_run = false});

  const auto result = executor_->Execute(plan);

  EXPECT_EQ(result.published_version, "1");
  EXPECT_EQ(service_->CountCalls("GetFunction"), 4);
}

TEST_F(PlanExecutorTest, PendingTimeoutAfterCreateIsPartialSuccess) {
  service_->SetPendingPolls(0, 1'000);
  PlanExecutor executor(service_, ExecutorOptions{.polling_interval = std::chrono::milliseconds(0),
                                                  .polling_timeout = std::chrono::milliseconds(0)});
  const auto plan = Plan({.role = kRole}, "sha", {.publish = true, .dry_run = false});

  const auto exception = ExecuteAndCatch(executor, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kPartialSuccess);
  EXPECT_EQ(exception.GetCauseKind(), FaultKind::kTimeout);
  EXPECT_EQ(exception.GetOperation(), "PublishVersion");
  EXPECT_THAT(exception.GetCompletedOperations(), testing::ElementsAre(OperationType::kCreateFunction));
  EXPECT_EQ(service_->CountCalls("PublishVersion"), 0);
}

TEST_F(PlanExecutorTest, RetriesThrottledPollAfterCreate) {
  const auto plan = Plan({.role = kRole}, "sha", {.publish = true, .dry_run = false});
  service_->QueueError("GetFunction", ServiceError(ServiceErrorType::kThrottled, "TooManyRequestsException"));

  const auto result = executor_->Execute(plan);

  EXPECT_EQ(result.published_version, "1");
  EXPECT_THAT(service_->GetCalls(),
              testing::ElementsAre("CreateFunction", "GetFunction", "GetFunction", "PublishVersion"));
}

TEST_F(PlanExecutorTest, ExhaustedPollRetriesAfterCreateIsPartialSuccess) {
  const auto plan = Plan({.role = kRole}, "sha", {.publish = true, .dry_run = false});
  for (int attempt = 0; attempt < 4; ++attempt) {
    service_->QueueError("GetFunction", ServiceError(ServiceErrorType::kThrottled, "TooManyRequestsException"));
  }

  const auto exception = ExecuteAndCatch(*executor_, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kPartialSuccess);
  EXPECT_EQ(exception.GetCauseKind(), FaultKind::kServiceFault);
  EXPECT_THAT(exception.GetCompletedOperations(), testing::ElementsAre(OperationType::kCreateFunction));
  EXPECT_EQ(service_->CountCalls("GetFunction"), 4);
  EXPECT_EQ(service_->CountCalls("PublishVersion"), 0);
}

TEST_F(PlanExecutorTest, CreatedFunctionWithRejectedConcurrencyIsPartialSuccess) {
  const auto plan = Plan({.role = kRole, .reserved_concurrency = 5}, "sha", {.publish = true, .dry_run = false});
  service_->QueueFollowUpError("CreateFunction", ServiceError(ServiceErrorType::kThrottled,
                                                              "PutFunctionConcurrency: TooManyRequestsException"));

  const auto exception = ExecuteAndCatch(*executor_, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kPartialSuccess);
  EXPECT_EQ(exception.GetCauseKind(), FaultKind::kServiceFault);
  EXPECT_EQ(exception.GetOperation(), "CreateFunction");
  EXPECT_THAT(exception.GetCompletedOperations(), testing::ElementsAre(OperationType::kCreateFunction));
  EXPECT_EQ(exception.GetFunctionArn(), "arn:aws:lambda:us-east-1:123456789012:function:f1");
  EXPECT_THAT(exception.what(), testing::HasSubstr("PutFunctionConcurrency"));
  EXPECT_EQ(service_->CountCalls("PublishVersion"), 0);
  EXPECT_TRUE(service_->GetStoredFunction(kFunctionName).has_value());
}

TEST_F(PlanExecutorTest, ConfigurationFollowUpFailureIsPartialSuccess) {
  AddExistingFunction();
  const auto plan = Plan({.timeout = 30, .tags = std::map<std::string, std::string>{{"team", "a"}}}, "old-sha",
                         {.publish = true, .dry_run = false});
  service_->QueueFollowUpError("UpdateFunctionConfiguration",
                               ServiceError(ServiceErrorType::kFault, "TagResource: ServiceException"));

  const auto exception = ExecuteAndCatch(*executor_, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kPartialSuccess);
  EXPECT_EQ(exception.GetOperation(), "UpdateConfiguration");
  EXPECT_THAT(exception.GetCompletedOperations(), testing::ElementsAre(OperationType::kUpdateConfiguration));
  EXPECT_EQ(service_->GetStoredFunction(kFunctionName)->config.timeout, 30);
  EXPECT_EQ(service_->CountCalls("PublishVersion"), 0);
}

TEST_F(PlanExecutorTest, StaleRevisionIdIssuesNoMutation) {
  AddExistingFunction();
  const auto plan = Plan({.timeout = 30}, "new-sha", {.publish = true, .dry_run = false, .revision_id = "stale"});

  const auto exception = ExecuteAndCatch(*executor_, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kConcurrencyConflict);
  EXPECT_EQ(exception.GetOperation(), "UpdateCode");
  EXPECT_EQ(exception.GetFunctionName(), kFunctionName);
  EXPECT_EQ(service_->CountMutatingCalls(), 0);
}

TEST_F(PlanExecutorTest, RevisionIdForAbsentFunctionIsConflict) {
  const auto plan = Plan({.role = kRole}, "sha", {.publish = true, .dry_run = false, .revision_id = "revision-1"});

  const auto exception = ExecuteAndCatch(*executor_, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kConcurrencyConflict);
  EXPECT_EQ(service_->CountMutatingCalls(), 0);
}

TEST_F(PlanExecutorTest, MatchingRevisionIdIsPassedToFirstMutation) {
  AddExistingFunction();
  const std::string revision_id = service_->GetStoredFunction(kFunctionName)->revision_id;
  const auto plan = Plan({.timeout = 30}, "new-sha", {.publish = false, .dry_run = false, .revision_id = revision_id});

  executor_->Execute(plan);

  EXPECT_THAT(service_->GetPassedRevisionIds(), testing::ElementsAre(revision_id, std::nullopt));
  EXPECT_EQ(service_->GetStoredFunction(kFunctionName)->config.timeout, 30);
}

TEST_F(PlanExecutorTest, ServiceConflictIsConcurrencyConflict) {
  AddExistingFunction();
  const auto plan = Plan({.timeout = 30}, "old-sha", {.publish = false, .dry_run = false});
  service_->QueueError("UpdateFunctionConfiguration",
                       ServiceError(ServiceErrorType::kConflict, "PreconditionFailedException"));

  const auto exception = ExecuteAndCatch(*executor_, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kConcurrencyConflict);
  EXPECT_EQ(exception.GetServiceErrorType(), ServiceErrorType::kConflict);
}

TEST_F(PlanExecutorTest, ConfigurationFailureAfterCodeUpdateIsPartialSuccess) {
  AddExistingFunction();
  const auto plan = Plan({.memory_size = 1024}, "new-sha", {.publish = true, .dry_run = false});
  service_->QueueError("UpdateFunctionConfiguration",
                       ServiceError(ServiceErrorType::kInvalidInput, "InvalidParameterValueException"));

  const auto exception = ExecuteAndCatch(*executor_, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kPartialSuccess);
  EXPECT_EQ(exception.GetCauseKind(), FaultKind::kServiceFault);
  EXPECT_EQ(exception.GetOperation(), "UpdateConfiguration");
  EXPECT_THAT(exception.GetCompletedOperations(), testing::ElementsAre(OperationType::kUpdateCode));
  EXPECT_THAT(exception.what(), testing::HasSubstr("Completed operations: UpdateCode"));
  EXPECT_EQ(service_->CountCalls("PublishVersion"), 0);
  // Nothing is rolled back.
  EXPECT_EQ(service_->GetStoredFunction(kFunctionName)->code_sha256, "new-sha");
}

TEST_F(PlanExecutorTest, CreateFailureAbortsImmediately) {
  const auto plan = Plan({.role = kRole}, "sha", {.publish = true, .dry_run = false});
  service_->QueueError("CreateFunction", ServiceError(ServiceErrorType::kThrottled, "TooManyRequestsException"));

  const auto exception = ExecuteAndCatch(*executor_, plan);

  EXPECT_EQ(exception.GetKind(), FaultKind::kServiceFault);
  EXPECT_EQ(exception.GetOperation(), "CreateFunction");
  EXPECT_TRUE(exception.GetCompletedOperations().empty());
  // Mutating calls are not retried.
  EXPECT_THAT(service_->GetCalls(), testing::ElementsAre("CreateFunction"));
}

TEST_F(PlanExecutorTest, WaitsForNotReadyFunctionBeforeFirstMutation) {
  AddExistingFunction(LastUpdateStatus::kPending);
  const auto plan = Plan({.timeout = 30}, "old-sha", {.publish = false, .dry_run = false});
  service_->SetPendingPolls(2, 0);

  executor_->Execute(plan);

  EXPECT_THAT(service_->GetCalls(), testing::ElementsAre("GetFunction", "GetFunction", "GetFunction",
                                                         "UpdateFunctionConfiguration"));
}

TEST_F(PlanExecutorTest, ProceedsAfterPreviouslyFailedUpdate) {
  AddExistingFunction(LastUpdateStatus::kFailed);
  const auto plan = Plan({.timeout = 30}, "old-sha", {.publish = false, .dry_run = false});

  executor_->Execute(plan);

  EXPECT_EQ(service_->GetStoredFunction(kFunctionName)->last_update_status, LastUpdateStatus::kSuccessful);
}

TEST_F(PlanExecutorTest, DryRunIssuesNoCalls) {
  const auto plan = Plan({.role = kRole}, "sha", {.publish = true, .dry_run = true});

  const auto result = executor_->Execute(plan);

  EXPECT_TRUE(result.dry_run);
  EXPECT_TRUE(result.function_arn.empty());
  EXPECT_FALSE(result.published_version.has_value());
  EXPECT_EQ(result.operations_applied.size(), 2);
  EXPECT_TRUE(service_->GetCalls().empty());
}

TEST_F(PlanExecutorTest, NoOpKeepsExistingArn) {
  AddExistingFunction();
  const auto plan = Plan({.timeout = 10}, "old-sha", {.publish = true, .dry_run = false});

  const auto result = executor_->Execute(plan);

  EXPECT_EQ(result.function_arn, "arn:aws:lambda:us-east-1:123456789012:function:f1");
  EXPECT_FALSE(result.published_version.has_value());
  EXPECT_EQ(service_->CountMutatingCalls(), 0);
}

}  // namespace stratus
