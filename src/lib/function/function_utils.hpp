#pragma once

#include <map>
#include <string>

#include <aws/core/Aws.h>
#include <aws/lambda/LambdaErrors.h>
#include <aws/lambda/model/FunctionCode.h>
#include <aws/lambda/model/FunctionConfiguration.h>
#include <aws/lambda/model/LastUpdateStatus.h>
#include <aws/lambda/model/State.h>

#include "deployment/code_source.hpp"
#include "function/function_config.hpp"
#include "function/function_service.hpp"
#include "function/service_error.hpp"

namespace stratus {

ServiceErrorType TranslateLambdaError(const Aws::Lambda::LambdaErrors error);

/**
 * Folds the function's state and the status of its last update into one value. A function that is still being
 * created or whose last update is in progress is pending.
 */
LastUpdateStatus TranslateFunctionStatus(const Aws::Lambda::Model::State state,
                                         const Aws::Lambda::Model::LastUpdateStatus last_update_status);

/**
 * Builds the fully populated config of an existing function. Tags, reserved concurrency and the code-signing config
 * are not part of FunctionConfiguration and are passed separately.
 */
FunctionConfig FunctionConfigFromRemote(const Aws::Lambda::Model::FunctionConfiguration& configuration,
                                        const std::map<std::string, std::string>& tags,
                                        const std::optional<int>& reserved_concurrency,
                                        const std::string& code_signing_config_arn);

Aws::Lambda::Model::FunctionCode ToFunctionCode(const CodeSource& code_source);

/**
 * @return true if @param changes holds a field that is applied via UpdateFunctionConfiguration. Tags, reserved
 * concurrency and the code-signing config use their own calls.
 */
bool HasFunctionConfigurationFields(const FunctionConfig& changes);

}  // namespace stratus
