#include "plan_executor.hpp"

#include <thread>
#include <type_traits>
#include <variant>

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "deployment/deployment_errors.hpp"

namespace stratus {

namespace {

[[noreturn]] void ThrowServiceError(const FunctionIdentity& identity, const OperationType type,
                                    const ServiceError& error, const bool partially_applied) {
  // A rejected revision id is the only conflict the service reports.
  const FaultKind kind = error.GetType() == ServiceErrorType::kConflict ? FaultKind::kConcurrencyConflict
                                                                        : FaultKind::kServiceFault;
  const std::string detail =
      partially_applied ? "the function was changed, but a follow-up call failed: " + error.GetMessage()
                        : error.GetMessage();
  AWS_LOGSTREAM_ERROR(kExecutorTag.c_str(), OperationTypeToString(type) << " failed: " << detail);
  throw DeploymentException(kind, OperationTypeToString(type), identity.name, error.GetType(), detail);
}

}  // namespace

PlanExecutor::PlanExecutor(std::shared_ptr<FunctionService> function_service, const ExecutorOptions& options,
                           const RetryPolicy& retry_policy)
    : function_service_(function_service),
      state_reader_(std::move(function_service), retry_policy),
      options_(options) {}

DeploymentResult PlanExecutor::Execute(const DeploymentPlan& plan) {
  DeploymentResult result{.function_arn = plan.existing_arn, .dry_run = plan.dry_run};

  if (plan.dry_run || plan.IsNoOp()) {
    CheckConcurrencyToken(plan, plan.observed_revision_id);
    for (const auto& operation : plan.operations) {
      AWS_LOGSTREAM_INFO(kExecutorTag.c_str(), operation.Describe() << " on '" << plan.identity.name << "'.");
    }
    result.operations_applied = plan.operations;
    return result;
  }

  const std::string first_operation = OperationTypeToString(plan.operations.front().GetType());
  std::optional<std::string> current_revision_id = plan.observed_revision_id;
  if (plan.wait_for_ready) {
    // A previously failed update does not block further updates. Only a pending function does.
    current_revision_id = WaitUntilReady(plan.identity, first_operation, true).revision_id;
  }
  CheckConcurrencyToken(plan, current_revision_id);

  std::vector<OperationType> completed_operations;
  for (const auto& operation : plan.operations) {
    bool partially_applied = false;
    try {
      if (!completed_operations.empty()) {
        WaitUntilReady(plan.identity, OperationTypeToString(operation.GetType()), false);
      }
      ApplyOperation(plan.identity, operation, &result, &partially_applied);
    } catch (const DeploymentException& exception) {
      if (partially_applied) {
        completed_operations.push_back(operation.GetType());
      }
      if (completed_operations.empty()) {
        throw;
      }
      AWS_LOGSTREAM_ERROR(kExecutorTag.c_str(), "Deployment of '" << plan.identity.name << "' stopped after "
                                                                  << completed_operations.size()
                                                                  << " completed operation(s).");
      throw DeploymentException(exception, completed_operations, result.function_arn);
    }

    completed_operations.push_back(operation.GetType());
    result.operations_applied.push_back(operation);
  }

  return result;
}

void PlanExecutor::CheckConcurrencyToken(const DeploymentPlan& plan,
                                         const std::optional<std::string>& current_revision_id) {
  if (!plan.concurrency_token) {
    return;
  }

  const std::string operation = OperationTypeToString(plan.operations.front().GetType());
  if (!current_revision_id) {
    throw DeploymentException(FaultKind::kConcurrencyConflict, operation, plan.identity.name,
                              ServiceErrorType::kConflict,
                              "revision id '" + *plan.concurrency_token +
                                  "' was given, but the function does not exist");
  }
  if (*current_revision_id != *plan.concurrency_token) {
    throw DeploymentException(FaultKind::kConcurrencyConflict, operation, plan.identity.name,
                              ServiceErrorType::kConflict,
                              "revision id '" + *plan.concurrency_token + "' is stale, the function is at revision '" +
                                  *current_revision_id + "'");
  }
}

RemoteFunctionState PlanExecutor::WaitUntilReady(const FunctionIdentity& identity, const std::string& next_operation,
                                                 const bool tolerate_failed_update) {
  const auto function_state_polling_start = std::chrono::steady_clock::now();

  while (true) {
    const auto read_state = state_reader_.Read(identity);
    if (!read_state) {
      throw DeploymentException(FaultKind::kServiceFault, next_operation, identity.name, ServiceErrorType::kNotFound,
                                "the function disappeared while waiting for it to become ready");
    }
    const RemoteFunctionState& remote_state = *read_state;

    switch (remote_state.last_update_status) {
      case LastUpdateStatus::kSuccessful:
        return remote_state;
      case LastUpdateStatus::kFailed:
        if (tolerate_failed_update) {
          AWS_LOGSTREAM_WARN(kExecutorTag.c_str(), "Last update of '" << identity.name << "' failed ("
                                                                      << remote_state.last_update_status_reason
                                                                      << "). Proceeding with " << next_operation
                                                                      << ".");
          return remote_state;
        }
        throw DeploymentException(FaultKind::kServiceFault, next_operation, identity.name, ServiceErrorType::kFault,
                                  "the preceding update failed: " + remote_state.last_update_status_reason);
      case LastUpdateStatus::kPending:
        break;
    }

    if (std::chrono::steady_clock::now() - function_state_polling_start >= options_.polling_timeout) {
      throw DeploymentException(FaultKind::kTimeout, next_operation, identity.name, ServiceErrorType::kNoError,
                                "function did not leave the pending state within " +
                                    std::to_string(options_.polling_timeout.count()) + " ms");
    }

    AWS_LOGSTREAM_INFO(kExecutorTag.c_str(), "Function '" << identity.name << "' is pending. Waiting before "
                                                          << next_operation << ".");
    std::this_thread::sleep_for(options_.polling_interval);
  }
}

void PlanExecutor::ApplyOperation(const FunctionIdentity& identity, const Operation& operation,
                                  DeploymentResult* result, bool* partially_applied) {
  AWS_LOGSTREAM_INFO(kExecutorTag.c_str(), "Applying " << operation.Describe() << " on '" << identity.name << "'.");

  std::visit(
      [this, &identity, result, partially_applied](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, CreateFunctionOperation>) {
          const auto [mutation_result, error] =
              function_service_->CreateFunction(identity, payload.config, payload.code_source);
          if (error) {
            if (mutation_result.partially_applied) {
              result->function_arn = mutation_result.arn;
              *partially_applied = true;
            }
            ThrowServiceError(identity, OperationType::kCreateFunction, error, mutation_result.partially_applied);
          }
          result->function_arn = mutation_result.arn;
        } else if constexpr (std::is_same_v<T, UpdateCodeOperation>) {
          const auto [mutation_result, error] = function_service_->UpdateFunctionCode(
              identity, payload.code_source, payload.architecture, payload.revision_id);
          if (error) {
            ThrowServiceError(identity, OperationType::kUpdateCode, error, false);
          }
          if (!mutation_result.arn.empty()) {
            result->function_arn = mutation_result.arn;
          }
        } else if constexpr (std::is_same_v<T, UpdateConfigurationOperation>) {
          const auto [mutation_result, error] =
              function_service_->UpdateFunctionConfiguration(identity, payload.changes, payload.revision_id);
          if (error) {
            if (mutation_result.partially_applied && !mutation_result.arn.empty()) {
              result->function_arn = mutation_result.arn;
            }
            *partially_applied = mutation_result.partially_applied;
            ThrowServiceError(identity, OperationType::kUpdateConfiguration, error,
                              mutation_result.partially_applied);
          }
          if (!mutation_result.arn.empty()) {
            result->function_arn = mutation_result.arn;
          }
        } else if constexpr (std::is_same_v<T, PublishVersionOperation>) {
          const auto [version, error] = function_service_->PublishVersion(identity);
          if (error) {
            ThrowServiceError(identity, OperationType::kPublishVersion, error, false);
          }
          result->published_version = version;
        } else {
          static_assert(std::is_same_v<T, NoOpOperation>, "Unhandled operation type.");
        }
      },
      operation.payload);
}

}  // namespace stratus
