#pragma once

#include <map>
#include <optional>
#include <string>

#include <aws/lambda/model/CreateFunctionRequest.h>
#include <aws/lambda/model/DeleteFunctionCodeSigningConfigRequest.h>
#include <aws/lambda/model/PutFunctionCodeSigningConfigRequest.h>
#include <aws/lambda/model/PutFunctionConcurrencyRequest.h>
#include <aws/lambda/model/TagResourceRequest.h>
#include <aws/lambda/model/UntagResourceRequest.h>
#include <aws/lambda/model/UpdateFunctionConfigurationRequest.h>

#include "deployment/code_source.hpp"
#include "function/function_config.hpp"

namespace stratus {

/**
 * Lambda keeps reserved concurrency outside the function. A create therefore takes up to two calls, in this order.
 */
struct CreateFunctionRequests {
  Aws::Lambda::Model::CreateFunctionRequest create_function;
  std::optional<Aws::Lambda::Model::PutFunctionConcurrencyRequest> put_function_concurrency;
};

CreateFunctionRequests BuildCreateFunctionRequests(const std::string& function_name, const FunctionConfig& config,
                                                   const CodeSource& code_source);

/**
 * The calls that apply one configuration change, in the order they are issued. Every member that is set becomes one
 * call.
 */
struct ConfigurationUpdateRequests {
  std::optional<Aws::Lambda::Model::UpdateFunctionConfigurationRequest> update_function_configuration;
  std::optional<Aws::Lambda::Model::UntagResourceRequest> untag_resource;
  std::optional<Aws::Lambda::Model::TagResourceRequest> tag_resource;
  std::optional<Aws::Lambda::Model::PutFunctionConcurrencyRequest> put_function_concurrency;
  std::optional<Aws::Lambda::Model::PutFunctionCodeSigningConfigRequest> put_function_code_signing_config;
  std::optional<Aws::Lambda::Model::DeleteFunctionCodeSigningConfigRequest> delete_function_code_signing_config;

  // Tagging, concurrency and code-signing calls cannot carry a revision id. If none of the requests carries the
  // expected revision, it is set here and must match the current revision before the first call is issued.
  std::optional<std::string> revision_id_to_check;

  bool IsEmpty() const;
};

/**
 * Splits @param changes into Lambda requests. Tag requests address the function by @param function_arn and replace
 * @param current_tags by the desired tags, so that removed keys are untagged. A set @param revision_id is attached to
 * the UpdateFunctionConfiguration request if there is one.
 */
ConfigurationUpdateRequests BuildConfigurationUpdateRequests(const std::string& function_name,
                                                             const std::string& function_arn,
                                                             const std::map<std::string, std::string>& current_tags,
                                                             const FunctionConfig& changes,
                                                             const std::optional<std::string>& revision_id);

/**
 * @return true if the requests need the function's ARN and current tags, which only GetFunction returns.
 */
bool NeedsCurrentFunctionState(const FunctionConfig& changes, const std::optional<std::string>& revision_id);

}  // namespace stratus
