#pragma once

#include <memory>

#include <aws/lambda/LambdaClient.h>

#include "function/function_service.hpp"

namespace stratus {

/**
 * FunctionService backed by AWS Lambda. Each method maps to one Lambda API call, plus the auxiliary calls for
 * settings Lambda keeps outside the function configuration (tags, reserved concurrency, code signing). The requests
 * are built by lambda_requests.hpp.
 */
class LambdaFunctionService : public FunctionService {
 public:
  explicit LambdaFunctionService(std::shared_ptr<const Aws::Lambda::LambdaClient> client);

  std::pair<RemoteFunctionState, ServiceError> GetFunction(const FunctionIdentity& identity) override;

  std::pair<MutationResult, ServiceError> CreateFunction(const FunctionIdentity& identity,
                                                         const FunctionConfig& config,
                                                         const CodeSource& code_source) override;

  std::pair<MutationResult, ServiceError> UpdateFunctionCode(const FunctionIdentity& identity,
                                                             const CodeSource& code_source,
                                                             const std::optional<std::string>& architecture,
                                                             const std::optional<std::string>& revision_id) override;

  std::pair<MutationResult, ServiceError> UpdateFunctionConfiguration(
      const FunctionIdentity& identity, const FunctionConfig& changes,
      const std::optional<std::string>& revision_id) override;

  std::pair<std::string, ServiceError> PublishVersion(const FunctionIdentity& identity) override;

 private:
  std::shared_ptr<const Aws::Lambda::LambdaClient> client_;
};

}  // namespace stratus
