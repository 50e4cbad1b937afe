#pragma once

#include <optional>
#include <string>
#include <utility>

#include "deployment/code_source.hpp"
#include "function/function_config.hpp"
#include "function/service_error.hpp"

namespace stratus {

enum class LastUpdateStatus { kPending, kSuccessful, kFailed };

/**
 * Snapshot of an existing function. Every field of config is set; remote values that are not configured are
 * represented by their empty value (e.g., an empty environment or an empty dead-letter target).
 */
struct RemoteFunctionState {
  FunctionConfig config;
  std::string revision_id;
  std::string arn;
  std::string code_sha256;
  std::string package_type;
  LastUpdateStatus last_update_status = LastUpdateStatus::kSuccessful;
  std::string last_update_status_reason;
};

struct MutationResult {
  std::string arn;
  std::string revision_id;
  // Set together with an error if a call of the operation already changed the function before a later one failed.
  bool partially_applied = false;
};

/**
 * FunctionService is the seam between the deployer and the remote function-execution service. Implementations
 * issue exactly one logical operation per call and never retry mutating calls. A missing function is reported as
 * ServiceErrorType::kNotFound. An operation that takes several remote calls reports a failure after its first
 * successful mutating call with MutationResult::partially_applied set.
 */
class FunctionService {
 public:
  virtual ~FunctionService() = default;

  virtual std::pair<RemoteFunctionState, ServiceError> GetFunction(const FunctionIdentity& identity) = 0;

  virtual std::pair<MutationResult, ServiceError> CreateFunction(const FunctionIdentity& identity,
                                                                 const FunctionConfig& config,
                                                                 const CodeSource& code_source) = 0;

  /**
   * Replaces the code of the function. A set @param architecture switches the instruction set together with the
   * code. A set @param revision_id makes the call fail with kConflict if the function was modified since.
   */
  virtual std::pair<MutationResult, ServiceError> UpdateFunctionCode(
      const FunctionIdentity& identity, const CodeSource& code_source, const std::optional<std::string>& architecture,
      const std::optional<std::string>& revision_id) = 0;

  /**
   * Applies the set fields of @param changes. Unset fields are never sent and keep their remote value. A set
   * @param revision_id is checked before the first change is made.
   */
  virtual std::pair<MutationResult, ServiceError> UpdateFunctionConfiguration(
      const FunctionIdentity& identity, const FunctionConfig& changes,
      const std::optional<std::string>& revision_id) = 0;

  /**
   * @return the number of the published version.
   */
  virtual std::pair<std::string, ServiceError> PublishVersion(const FunctionIdentity& identity) = 0;
};

}  // namespace stratus
