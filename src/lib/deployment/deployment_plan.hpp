#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "deployment/code_source.hpp"
#include "function/function_config.hpp"

namespace stratus {

enum class OperationType { kCreateFunction, kUpdateCode, kUpdateConfiguration, kPublishVersion, kNoOp };

/**
 * @return the operation name without the enum prefix, e.g., "UpdateCode".
 */
std::string OperationTypeToString(const OperationType type);

struct CreateFunctionOperation {
  FunctionConfig config;
  CodeSource code_source;
};

struct UpdateCodeOperation {
  CodeSource code_source;
  // Set if the instruction set changes together with the code.
  std::optional<std::string> architecture;
  std::optional<std::string> revision_id;
};

struct UpdateConfigurationOperation {
  // Only the changed fields are set.
  FunctionConfig changes;
  std::optional<std::string> revision_id;
};

struct PublishVersionOperation {};

struct NoOpOperation {};

using OperationPayload = std::variant<CreateFunctionOperation, UpdateCodeOperation, UpdateConfigurationOperation,
                                      PublishVersionOperation, NoOpOperation>;

/**
 * A single step of a deployment plan. A simulated operation is part of a dry run and is never sent to the service.
 */
struct Operation {
  OperationPayload payload;
  bool simulated = false;

  OperationType GetType() const;
  bool IsMutating() const;

  /**
   * @return a one-line summary, e.g., "UpdateConfiguration(timeout)" or "would CreateFunction(...)" if simulated.
   */
  std::string Describe() const;
};

/**
 * The ordered, immutable result of reconciliation. The executor consumes it front to back.
 */
struct DeploymentPlan {
  FunctionIdentity identity;
  std::vector<Operation> operations;
  // The live function is not ready to be mutated yet. The executor waits for it before the first mutation.
  bool wait_for_ready = false;
  bool dry_run = false;
  // ARN of the existing function. Empty if the plan creates the function.
  std::string existing_arn;
  // Caller-supplied revision id the function must still have when the first mutation is issued.
  std::optional<std::string> concurrency_token;
  // Revision id of the existing function as observed by the read phase.
  std::optional<std::string> observed_revision_id;

  std::vector<OperationType> GetOperationTypes() const;
  bool IsNoOp() const;
};

struct DeploymentResult {
  std::string function_arn;
  std::optional<std::string> published_version;
  std::vector<Operation> operations_applied;
  bool dry_run = false;
};

}  // namespace stratus
