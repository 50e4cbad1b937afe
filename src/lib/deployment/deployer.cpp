#include "deployer.hpp"

#include <future>

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "deployment/deployment_errors.hpp"
#include "deployment/desired_state_builder.hpp"
#include "deployment/reconciler.hpp"

namespace stratus {

Deployer::Deployer(std::shared_ptr<FunctionService> function_service, std::shared_ptr<ObjectStore> object_store,
                   const RetryPolicy& retry_policy, const ExecutorOptions& executor_options)
    : state_reader_(function_service, retry_policy),
      artifact_locator_(std::move(object_store)),
      plan_executor_(function_service, executor_options, retry_policy) {}

DeploymentResult Deployer::Deploy(const DeploymentInput& input) {
  // Everything except the create-only rules can be checked before the first remote call.
  auto violations = ValidateDeploymentInput(input, true);
  if (!violations.empty()) {
    throw ValidationException(std::move(violations));
  }

  AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Deploying function '" << input.identity.name << "'"
                                                                 << (input.dry_run ? " (dry run)." : "."));

  const ArtifactRequest artifact_request{.identity = input.identity,
                                        .code_artifact = input.code_artifact,
                                        .s3_bucket = input.s3_bucket,
                                        .s3_key = input.s3_key,
                                        .dry_run = input.dry_run};
  // The future joins the locator on destruction, also if reading or validation throws.
  auto code_source_future = std::async(std::launch::async, [this, &artifact_request]() {
    return artifact_locator_.Locate(artifact_request);
  });

  Reconciler reconciler(input.identity);
  reconciler.ObserveRemoteState(state_reader_.Read(input.identity));
  const bool function_exists = reconciler.GetState() != Reconciler::State::kNotExists;

  const FunctionConfig desired = BuildDesiredState(input, function_exists);
  const CodeSource code_source = code_source_future.get();

  const auto& plan = reconciler.BuildPlan(
      desired, code_source,
      ReconcileOptions{.publish = input.publish, .dry_run = input.dry_run, .revision_id = input.revision_id});

  auto result = plan_executor_.Execute(plan);
  reconciler.MarkCompleted();
  reconciler.Finish();

  AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Deployment of '" << input.identity.name << "' finished with "
                                                           << result.operations_applied.size() << " operation(s).");
  return result;
}

}  // namespace stratus
