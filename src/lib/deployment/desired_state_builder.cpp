#include "desired_state_builder.hpp"

#include <regex>
#include <set>

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "deployment/deployment_errors.hpp"
#include "utils/string.hpp"

namespace stratus {

namespace {

const std::regex kFunctionNameRegex("^[A-Za-z0-9_-]{1,64}$");
const std::regex kFunctionArnRegex("^arn:aws[a-zA-Z-]*:lambda:[a-z0-9-]+:[0-9]{12}:function:[A-Za-z0-9_-]{1,64}$");
const std::regex kRoleArnRegex("^arn:aws[a-zA-Z-]*:iam::[0-9]{12}:role/.+$");

const std::set<std::string> kArchitectures = {"x86_64", "arm64"};
const std::set<std::string> kTracingModes = {"Active", "PassThrough"};
const std::set<std::string> kSnapStartApplyOn = {"PublishedVersions", "None"};
const std::set<std::string> kLogFormats = {"JSON", "Text"};
const std::set<std::string> kApplicationLogLevels = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
const std::set<std::string> kSystemLogLevels = {"DEBUG", "INFO", "WARN"};

class ViolationCollector {
 public:
  void Check(const bool condition, const std::string& violation) {
    if (!condition) {
      violations_.push_back(violation);
    }
  }

  void CheckRange(const std::optional<int>& value, const std::string& name, const int minimum, const int maximum) {
    if (value) {
      Check(*value >= minimum && *value <= maximum, name + " must be between " + std::to_string(minimum) + " and " +
                                                        std::to_string(maximum) + ", got " +
                                                        std::to_string(*value) + ".");
    }
  }

  void CheckOneOf(const std::optional<std::string>& value, const std::string& name,
                  const std::set<std::string>& allowed_values) {
    if (value) {
      Check(allowed_values.contains(*value),
            name + " must be one of " +
                VectorToString(std::vector<std::string>(allowed_values.cbegin(), allowed_values.cend()), "|") +
                ", got '" + *value + "'.");
    }
  }

  std::vector<std::string> Release() { return std::move(violations_); }

 private:
  std::vector<std::string> violations_;
};

}  // namespace

std::vector<std::string> ValidateDeploymentInput(const DeploymentInput& input, const bool function_exists) {
  ViolationCollector collector;
  for (const auto& parse_violation : input.parse_violations) {
    collector.Check(false, parse_violation);
  }

  const auto& name = input.identity.name;
  collector.Check(!name.empty(), "function_name is required.");
  if (!name.empty()) {
    collector.Check(std::regex_match(name, kFunctionNameRegex) || std::regex_match(name, kFunctionArnRegex),
                    "function_name '" + name + "' must be 1 to " + std::to_string(kLambdaMaximumFunctionNameLength) +
                        " characters of [A-Za-z0-9-_] or a function ARN.");
  }
  collector.Check(!input.code_artifact.empty(), "code_artifact is required.");

  const auto& config = input.config;
  if (!function_exists) {
    collector.Check(config.role.has_value(), "role is required when creating function '" + name + "'.");
  }
  if (config.role) {
    collector.Check(std::regex_match(*config.role, kRoleArnRegex),
                    "role '" + *config.role + "' is not an IAM role ARN.");
  }
  if (config.handler) {
    collector.Check(!config.handler->empty(), "handler must not be empty.");
  }
  if (config.runtime) {
    collector.Check(!config.runtime->empty(), "runtime must not be empty.");
  }

  collector.CheckRange(config.memory_size, "memory_size", kLambdaMinimumMemorySizeMb, kLambdaMaximumMemorySizeMb);
  collector.CheckRange(config.timeout, "timeout", kLambdaMinimumTimeoutSeconds, kLambdaMaximumTimeoutSeconds);
  collector.CheckRange(config.ephemeral_storage, "ephemeral_storage", kLambdaMinimumEphemeralStorageMb,
                       kLambdaMaximumEphemeralStorageMb);
  if (config.reserved_concurrency) {
    collector.Check(*config.reserved_concurrency >= 0, "reserved_concurrency must not be negative.");
  }

  collector.CheckOneOf(config.architecture, "architecture", kArchitectures);
  collector.CheckOneOf(config.tracing_mode, "tracing_config", kTracingModes);
  collector.CheckOneOf(config.snap_start, "snap_start.ApplyOn", kSnapStartApplyOn);

  if (config.logging_config) {
    const auto& logging_config = *config.logging_config;
    collector.CheckOneOf(logging_config.log_format, "logging_config.LogFormat", kLogFormats);
    collector.CheckOneOf(logging_config.application_log_level, "logging_config.ApplicationLogLevel",
                         kApplicationLogLevels);
    collector.CheckOneOf(logging_config.system_log_level, "logging_config.SystemLogLevel", kSystemLogLevels);
    collector.Check(
        logging_config.log_format == "JSON" ||
            (!logging_config.application_log_level && !logging_config.system_log_level),
        "logging_config.ApplicationLogLevel and logging_config.SystemLogLevel require logging_config.LogFormat JSON.");
  }

  if (config.vpc_config) {
    collector.Check(config.vpc_config->subnet_ids.empty() == config.vpc_config->security_group_ids.empty(),
                    "vpc_config requires both SubnetIds and SecurityGroupIds, or neither.");
  }

  collector.Check(!input.s3_key || input.s3_bucket, "s3_key requires s3_bucket.");
  if (input.s3_bucket) {
    collector.Check(!input.s3_bucket->empty(), "s3_bucket must not be empty.");
  }
  if (input.revision_id) {
    collector.Check(!input.revision_id->empty(), "revision_id must not be empty.");
  }

  // Container images and zip packages exclude each other. All conflicts are reported.
  if (input.image_config) {
    collector.Check(!config.handler, "image_config is incompatible with handler.");
    collector.Check(!config.runtime, "image_config is incompatible with runtime.");
    collector.Check(!config.layers, "image_config is incompatible with layers.");
    collector.Check(false, "image_config requires container-image packaging, which is not supported; use a zip "
                           "package via code_artifact.");
  }

  return collector.Release();
}

FunctionConfig ApplyCreationDefaults(FunctionConfig config, const bool function_exists) {
  if (function_exists) {
    return config;
  }

  if (!config.handler) {
    config.handler = std::string(kDefaultHandler);
  }
  if (!config.runtime) {
    config.runtime = std::string(kDefaultRuntime);
  }
  if (!config.timeout) {
    config.timeout = kDefaultTimeoutSeconds;
  }
  if (!config.ephemeral_storage) {
    config.ephemeral_storage = kDefaultEphemeralStorageMb;
  }
  return config;
}

FunctionConfig BuildDesiredState(const DeploymentInput& input, const bool function_exists) {
  auto violations = ValidateDeploymentInput(input, function_exists);
  if (!violations.empty()) {
    AWS_LOGSTREAM_ERROR(kDeployTag.c_str(), "Found " << violations.size() << " invalid input(s) for function '"
                                                     << input.identity.name << "'.");
    throw ValidationException(std::move(violations));
  }

  return ApplyCreationDefaults(input.config, function_exists);
}

}  // namespace stratus
