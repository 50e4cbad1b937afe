#pragma once

#include <string>
#include <vector>

#include "deployment/deployment_input.hpp"
#include "function/function_config.hpp"

namespace stratus {

/**
 * @return every constraint @param input violates, including the decoding problems recorded by the parser. The
 * rules depend on @param function_exists: creating a function requires a role.
 */
std::vector<std::string> ValidateDeploymentInput(const DeploymentInput& input, const bool function_exists);

/**
 * Applies the creation defaults to the fields of @param config the caller omitted. Existing functions keep their
 * remote values, so this is only used if @param function_exists is false.
 */
FunctionConfig ApplyCreationDefaults(FunctionConfig config, const bool function_exists);

/**
 * Validates @param input and returns the canonical desired configuration. Throws a ValidationException listing all
 * violations.
 */
FunctionConfig BuildDesiredState(const DeploymentInput& input, const bool function_exists);

}  // namespace stratus
