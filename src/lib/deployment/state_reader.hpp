#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "configuration.hpp"
#include "function/function_service.hpp"

namespace stratus {

/**
 * Bounded exponential backoff for idempotent reads: attempt i (starting at 0) is preceded by a pause of
 * backoff_base * 2^(i-1).
 */
struct RetryPolicy {
  size_t retry_attempts = kReadRetryAttempts;
  std::chrono::milliseconds backoff_base{kReadRetryBackoffBaseMilliseconds};
};

/**
 * The three states a function can be in before the first mutation. A function that is pending or whose last update
 * failed is not safe to mutate yet and is handled as kNotReady.
 */
enum class ReadPhaseState { kNotExists, kExists, kNotReady };

ReadPhaseState ClassifyRemoteState(const std::optional<RemoteFunctionState>& remote_state);

class StateReader {
 public:
  explicit StateReader(std::shared_ptr<FunctionService> function_service, const RetryPolicy& retry_policy = {});

  /**
   * @return the live state of the function or std::nullopt if it does not exist. Throttling and service faults are
   * retried; any other error, or exhausting the retries, raises a DeploymentException.
   */
  std::optional<RemoteFunctionState> Read(const FunctionIdentity& identity) const;

 private:
  std::shared_ptr<FunctionService> function_service_;
  RetryPolicy retry_policy_;
};

}  // namespace stratus
