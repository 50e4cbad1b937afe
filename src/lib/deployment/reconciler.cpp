#include "reconciler.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

#include <aws/core/utils/logging/LogMacros.h>
#include <magic_enum/magic_enum.hpp>

#include "constants.hpp"
#include "utils/assert.hpp"

namespace stratus {

namespace {

template <typename T>
void DiffField(const std::optional<T>& desired, const std::optional<T>& remote, std::optional<T>* change) {
  if (desired && desired != remote) {
    *change = desired;
  }
}

bool EqualIgnoringOrder(std::vector<std::string> lhs, std::vector<std::string> rhs) {
  std::sort(lhs.begin(), lhs.end());
  std::sort(rhs.begin(), rhs.end());
  return lhs == rhs;
}

bool IsVpcConfigEqual(const VpcConfig& desired, const VpcConfig& remote) {
  return EqualIgnoringOrder(desired.subnet_ids, remote.subnet_ids) &&
         EqualIgnoringOrder(desired.security_group_ids, remote.security_group_ids) &&
         desired.ipv6_allowed_for_dual_stack == remote.ipv6_allowed_for_dual_stack;
}

// The service fills in log levels and the log group if they are omitted. Only the levels the caller set count.
bool IsLoggingConfigEqual(const LoggingConfig& desired, const LoggingConfig& remote) {
  const auto matches = [](const std::optional<std::string>& desired_value,
                          const std::optional<std::string>& remote_value) {
    return !desired_value || desired_value == remote_value;
  };
  return desired.log_format == remote.log_format &&
         matches(desired.application_log_level, remote.application_log_level) &&
         matches(desired.system_log_level, remote.system_log_level) && matches(desired.log_group, remote.log_group);
}

}  // namespace

FunctionConfig DiffFunctionConfig(const FunctionConfig& desired, const FunctionConfig& remote) {
  FunctionConfig changes;
  DiffField(desired.handler, remote.handler, &changes.handler);
  DiffField(desired.runtime, remote.runtime, &changes.runtime);
  DiffField(desired.role, remote.role, &changes.role);
  DiffField(desired.description, remote.description, &changes.description);
  DiffField(desired.memory_size, remote.memory_size, &changes.memory_size);
  DiffField(desired.timeout, remote.timeout, &changes.timeout);
  DiffField(desired.environment, remote.environment, &changes.environment);
  DiffField(desired.dead_letter_target_arn, remote.dead_letter_target_arn, &changes.dead_letter_target_arn);
  DiffField(desired.kms_key_arn, remote.kms_key_arn, &changes.kms_key_arn);
  DiffField(desired.tracing_mode, remote.tracing_mode, &changes.tracing_mode);
  DiffField(desired.layers, remote.layers, &changes.layers);
  DiffField(desired.file_system_configs, remote.file_system_configs, &changes.file_system_configs);
  DiffField(desired.ephemeral_storage, remote.ephemeral_storage, &changes.ephemeral_storage);
  DiffField(desired.snap_start, remote.snap_start, &changes.snap_start);
  DiffField(desired.reserved_concurrency, remote.reserved_concurrency, &changes.reserved_concurrency);
  DiffField(desired.tags, remote.tags, &changes.tags);
  DiffField(desired.code_signing_config_arn, remote.code_signing_config_arn, &changes.code_signing_config_arn);

  if (desired.vpc_config && (!remote.vpc_config || !IsVpcConfigEqual(*desired.vpc_config, *remote.vpc_config))) {
    changes.vpc_config = desired.vpc_config;
  }
  if (desired.logging_config &&
      (!remote.logging_config || !IsLoggingConfigEqual(*desired.logging_config, *remote.logging_config))) {
    changes.logging_config = desired.logging_config;
  }

  return changes;
}

bool IsCodeUpdateRequired(const CodeSource& code_source, const RemoteFunctionState& remote_state) {
  const auto code_sha256 = GetCodeSha256(code_source);
  return !code_sha256 || *code_sha256 != remote_state.code_sha256;
}

Reconciler::Reconciler(FunctionIdentity identity) : identity_(std::move(identity)) {}

void Reconciler::ObserveRemoteState(std::optional<RemoteFunctionState> remote_state) {
  Assert(state_ == State::kStart, "Remote state can only be observed once.");
  remote_state_ = std::move(remote_state);

  switch (ClassifyRemoteState(remote_state_)) {
    case ReadPhaseState::kNotExists:
      state_ = State::kNotExists;
      break;
    case ReadPhaseState::kExists:
      state_ = State::kExists;
      break;
    case ReadPhaseState::kNotReady:
      state_ = State::kNotReady;
      AWS_LOGSTREAM_WARN(kDeployTag.c_str(),
                         "Function '" << identity_.name << "' is not ready ("
                                      << magic_enum::enum_name(remote_state_->last_update_status) << ": "
                                      << remote_state_->last_update_status_reason << ").");
      break;
  }
}

const DeploymentPlan& Reconciler::BuildPlan(const FunctionConfig& desired, const CodeSource& code_source,
                                            const ReconcileOptions& options) {
  Assert(state_ == State::kExists || state_ == State::kNotExists || state_ == State::kNotReady,
         "A plan requires an observed remote state.");

  DeploymentPlan plan{.identity = identity_,
                      .wait_for_ready = state_ == State::kNotReady,
                      .dry_run = options.dry_run,
                      .concurrency_token = options.revision_id};

  if (state_ == State::kNotExists) {
    plan.operations = PlanCreate(desired, code_source);
  } else {
    plan.existing_arn = remote_state_->arn;
    plan.observed_revision_id = remote_state_->revision_id;
    plan.operations = PlanUpdate(desired, code_source, options.revision_id);
  }

  if (options.publish && !plan.IsNoOp()) {
    plan.operations.push_back(Operation{.payload = PublishVersionOperation{}});
  }

  if (options.dry_run) {
    for (auto& operation : plan.operations) {
      operation.simulated = operation.IsMutating();
    }
  }

  for (const auto& operation : plan.operations) {
    AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Planned " << operation.Describe() << " for '" << identity_.name << "'.");
  }

  plan_ = std::move(plan);
  state_ = State::kPlanBuilt;
  return *plan_;
}

void Reconciler::MarkCompleted() {
  Assert(state_ == State::kPlanBuilt, "Only a built plan can be completed.");
  state_ = plan_->dry_run ? State::kDry : State::kExecuted;
}

void Reconciler::Finish() {
  Assert(state_ == State::kDry || state_ == State::kExecuted, "Cannot finish before the plan was completed.");
  state_ = State::kDone;
}

const DeploymentPlan& Reconciler::GetPlan() const {
  Assert(plan_.has_value(), "No plan was built yet.");
  return *plan_;
}

std::vector<Operation> Reconciler::PlanCreate(const FunctionConfig& desired, const CodeSource& code_source) const {
  // Configuration and code are passed together; a new function needs no separate update.
  return {Operation{.payload = CreateFunctionOperation{.config = desired, .code_source = code_source}}};
}

std::vector<Operation> Reconciler::PlanUpdate(const FunctionConfig& desired, const CodeSource& code_source,
                                              const std::optional<std::string>& revision_id) const {
  const auto& remote = *remote_state_;
  std::vector<Operation> operations;

  const bool architecture_changed = desired.architecture && desired.architecture != remote.config.architecture;
  if (architecture_changed || IsCodeUpdateRequired(code_source, remote)) {
    operations.push_back(Operation{.payload = UpdateCodeOperation{
                              .code_source = code_source,
                              .architecture = architecture_changed ? desired.architecture : std::nullopt}});
  }

  auto changes = DiffFunctionConfig(desired, remote.config);
  if (!changes.IsEmpty()) {
    operations.push_back(Operation{.payload = UpdateConfigurationOperation{.changes = std::move(changes)}});
  }

  if (operations.empty()) {
    return {Operation{.payload = NoOpOperation{}}};
  }

  // The token guards the first mutation only. Later steps see the revision produced by our own first step.
  if (revision_id) {
    std::visit(
        [&revision_id](auto& operation) {
          using T = std::decay_t<decltype(operation)>;
          if constexpr (std::is_same_v<T, UpdateCodeOperation> || std::is_same_v<T, UpdateConfigurationOperation>) {
            operation.revision_id = revision_id;
          }
        },
        operations.front().payload);
  }

  return operations;
}

}  // namespace stratus
