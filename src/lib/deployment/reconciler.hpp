#pragma once

#include <optional>
#include <string>

#include "deployment/code_source.hpp"
#include "deployment/deployment_plan.hpp"
#include "deployment/state_reader.hpp"
#include "function/function_config.hpp"
#include "function/function_service.hpp"

namespace stratus {

/**
 * @return the fields of @param desired that differ from @param remote. Only set fields of @param desired are
 * compared, so unset fields never appear in the result. Architecture is excluded since it changes together with
 * the code. Subnet and security group ids are compared regardless of their order.
 */
FunctionConfig DiffFunctionConfig(const FunctionConfig& desired, const FunctionConfig& remote);

/**
 * @return true if the code must be pushed. Without a digest of the package, code cannot be compared and is always
 * pushed.
 */
bool IsCodeUpdateRequired(const CodeSource& code_source, const RemoteFunctionState& remote_state);

struct ReconcileOptions {
  bool publish = true;
  bool dry_run = false;
  std::optional<std::string> revision_id;
};

/**
 * The Reconciler decides which operations bring the remote function to the desired state. It moves through
 *
 *   kStart -> {kExists, kNotExists, kNotReady} -> kPlanBuilt -> {kDry, kExecuted} -> kDone
 *
 * and asserts that its methods are called in this order. It never calls the service itself.
 */
class Reconciler {
 public:
  enum class State { kStart, kExists, kNotExists, kNotReady, kPlanBuilt, kDry, kExecuted, kDone };

  explicit Reconciler(FunctionIdentity identity);

  /**
   * Records the result of the read phase.
   */
  void ObserveRemoteState(std::optional<RemoteFunctionState> remote_state);

  /**
   * Builds the plan for @param desired, which must already be validated and defaulted for the observed state.
   */
  const DeploymentPlan& BuildPlan(const FunctionConfig& desired, const CodeSource& code_source,
                                  const ReconcileOptions& options);

  /**
   * Records that the plan was simulated or applied.
   */
  void MarkCompleted();

  void Finish();

  State GetState() const { return state_; }
  const DeploymentPlan& GetPlan() const;
  const std::optional<RemoteFunctionState>& GetRemoteState() const { return remote_state_; }

 private:
  std::vector<Operation> PlanCreate(const FunctionConfig& desired, const CodeSource& code_source) const;
  std::vector<Operation> PlanUpdate(const FunctionConfig& desired, const CodeSource& code_source,
                                    const std::optional<std::string>& revision_id) const;

  FunctionIdentity identity_;
  State state_ = State::kStart;
  std::optional<RemoteFunctionState> remote_state_;
  std::optional<DeploymentPlan> plan_;
};

}  // namespace stratus
