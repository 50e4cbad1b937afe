#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "configuration.hpp"
#include "deployment/deployment_plan.hpp"
#include "deployment/state_reader.hpp"
#include "function/function_service.hpp"

namespace stratus {

struct ExecutorOptions {
  std::chrono::milliseconds polling_interval{kFunctionStatePollingIntervalMilliseconds};
  std::chrono::milliseconds polling_timeout{kFunctionStatePollingTimeoutSeconds * 1'000};
};

/**
 * Applies a DeploymentPlan in order. Mutating calls are issued one after another and never retried. Before every
 * step that follows a mutation, and before the first mutation of a function that is not ready, the executor waits
 * for the function to leave the pending state.
 *
 * The polls are reads and are retried like the initial read. A failure aborts the remaining plan. If earlier
 * mutations already succeeded, or the failing operation changed the function before one of its calls failed, the
 * failure is raised as a kPartialSuccess DeploymentException that lists those operations. Nothing is rolled back.
 */
class PlanExecutor {
 public:
  explicit PlanExecutor(std::shared_ptr<FunctionService> function_service, const ExecutorOptions& options = {},
                        const RetryPolicy& retry_policy = {});

  DeploymentResult Execute(const DeploymentPlan& plan);

 private:
  /**
   * Raises a kConcurrencyConflict if the plan carries a token that does not match @param current_revision_id.
   */
  static void CheckConcurrencyToken(const DeploymentPlan& plan, const std::optional<std::string>& current_revision_id);

  RemoteFunctionState WaitUntilReady(const FunctionIdentity& identity, const std::string& next_operation,
                                     const bool tolerate_failed_update);

  /**
   * Sets @param partially_applied if the operation failed after changing the function.
   */
  void ApplyOperation(const FunctionIdentity& identity, const Operation& operation, DeploymentResult* result,
                      bool* partially_applied);

  std::shared_ptr<FunctionService> function_service_;
  StateReader state_reader_;
  ExecutorOptions options_;
};

}  // namespace stratus
