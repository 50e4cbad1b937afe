#pragma once

#include <memory>

#include "deployment/artifact_locator.hpp"
#include "deployment/deployment_input.hpp"
#include "deployment/deployment_plan.hpp"
#include "deployment/plan_executor.hpp"
#include "deployment/state_reader.hpp"
#include "function/function_service.hpp"
#include "storage/backend/object_store.hpp"

namespace stratus {

/**
 * Runs one deployment: validation, locating the package concurrently with reading the remote state, reconciliation
 * and execution. Throws a ValidationException for bad input and a DeploymentException for every remote fault.
 */
class Deployer {
 public:
  Deployer(std::shared_ptr<FunctionService> function_service, std::shared_ptr<ObjectStore> object_store,
           const RetryPolicy& retry_policy = {}, const ExecutorOptions& executor_options = {});

  DeploymentResult Deploy(const DeploymentInput& input);

 private:
  StateReader state_reader_;
  ArtifactLocator artifact_locator_;
  PlanExecutor plan_executor_;
};

}  // namespace stratus
