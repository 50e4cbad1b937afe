#include "state_reader.hpp"

#include <thread>

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "deployment/deployment_errors.hpp"

namespace stratus {

ReadPhaseState ClassifyRemoteState(const std::optional<RemoteFunctionState>& remote_state) {
  if (!remote_state) {
    return ReadPhaseState::kNotExists;
  }
  return remote_state->last_update_status == LastUpdateStatus::kSuccessful ? ReadPhaseState::kExists
                                                                           : ReadPhaseState::kNotReady;
}

StateReader::StateReader(std::shared_ptr<FunctionService> function_service, const RetryPolicy& retry_policy)
    : function_service_(std::move(function_service)), retry_policy_(retry_policy) {}

std::optional<RemoteFunctionState> StateReader::Read(const FunctionIdentity& identity) const {
  for (size_t attempt = 0;; ++attempt) {
    if (attempt > 0) {
      std::this_thread::sleep_for(retry_policy_.backoff_base * (1 << (attempt - 1)));
    }

    auto [remote_state, error] = function_service_->GetFunction(identity);
    if (!error) {
      AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Function '" << identity.name << "' exists (revision "
                                                          << remote_state.revision_id << ").");
      return remote_state;
    }

    if (error.GetType() == ServiceErrorType::kNotFound) {
      AWS_LOGSTREAM_INFO(kDeployTag.c_str(), "Function '" << identity.name << "' does not exist.");
      return std::nullopt;
    }

    if (!error.IsTransient() || attempt >= retry_policy_.retry_attempts) {
      AWS_LOGSTREAM_ERROR(kDeployTag.c_str(), error.GetMessage());
      throw DeploymentException(FaultKind::kServiceFault, "GetFunction", identity.name, error.GetType(),
                                error.GetMessage());
    }

    AWS_LOGSTREAM_WARN(kDeployTag.c_str(), "Retrying GetFunction for '" << identity.name << "' after attempt "
                                                                        << attempt + 1 << ": " << error.GetMessage());
  }
}

}  // namespace stratus
