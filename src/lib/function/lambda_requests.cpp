#include "lambda_requests.hpp"

#include <aws/core/utils/memory/stl/AWSMap.h>
#include <aws/core/utils/memory/stl/AWSVector.h>
#include <aws/lambda/model/Architecture.h>
#include <aws/lambda/model/DeadLetterConfig.h>
#include <aws/lambda/model/EphemeralStorage.h>
#include <aws/lambda/model/Environment.h>
#include <aws/lambda/model/FileSystemConfig.h>
#include <aws/lambda/model/LoggingConfig.h>
#include <aws/lambda/model/PackageType.h>
#include <aws/lambda/model/Runtime.h>
#include <aws/lambda/model/SnapStart.h>
#include <aws/lambda/model/TracingConfig.h>
#include <aws/lambda/model/VpcConfig.h>

#include "function/function_utils.hpp"
#include "utils/map.hpp"

namespace stratus {

namespace {

/**
 * Sets every field that CreateFunctionRequest and UpdateFunctionConfigurationRequest share. Unset fields are not
 * touched, so the service keeps their current values on update.
 */
template <typename RequestType>
void ApplySharedConfiguration(const FunctionConfig& config, RequestType* request) {
  if (config.handler) {
    request->SetHandler(*config.handler);
  }
  if (config.runtime) {
    request->SetRuntime(Aws::Lambda::Model::RuntimeMapper::GetRuntimeForName(*config.runtime));
  }
  if (config.role) {
    request->SetRole(*config.role);
  }
  if (config.description) {
    request->SetDescription(*config.description);
  }
  if (config.memory_size) {
    request->SetMemorySize(*config.memory_size);
  }
  if (config.timeout) {
    request->SetTimeout(*config.timeout);
  }
  if (config.environment) {
    request->SetEnvironment(Aws::Lambda::Model::Environment().WithVariables(
        Aws::Map<Aws::String, Aws::String>(config.environment->cbegin(), config.environment->cend())));
  }
  if (config.vpc_config) {
    request->SetVpcConfig(
        Aws::Lambda::Model::VpcConfig()
            .WithSubnetIds(Aws::Vector<Aws::String>(config.vpc_config->subnet_ids.cbegin(),
                                                    config.vpc_config->subnet_ids.cend()))
            .WithSecurityGroupIds(Aws::Vector<Aws::String>(config.vpc_config->security_group_ids.cbegin(),
                                                           config.vpc_config->security_group_ids.cend()))
            .WithIpv6AllowedForDualStack(config.vpc_config->ipv6_allowed_for_dual_stack));
  }
  if (config.dead_letter_target_arn) {
    request->SetDeadLetterConfig(Aws::Lambda::Model::DeadLetterConfig().WithTargetArn(*config.dead_letter_target_arn));
  }
  if (config.kms_key_arn) {
    request->SetKMSKeyArn(*config.kms_key_arn);
  }
  if (config.tracing_mode) {
    request->SetTracingConfig(Aws::Lambda::Model::TracingConfig().WithMode(
        Aws::Lambda::Model::TracingModeMapper::GetTracingModeForName(*config.tracing_mode)));
  }
  if (config.layers) {
    request->SetLayers(Aws::Vector<Aws::String>(config.layers->cbegin(), config.layers->cend()));
  }
  if (config.file_system_configs) {
    Aws::Vector<Aws::Lambda::Model::FileSystemConfig> file_system_configs;
    for (const auto& file_system_config : *config.file_system_configs) {
      file_system_configs.emplace_back(Aws::Lambda::Model::FileSystemConfig()
                                           .WithArn(file_system_config.arn)
                                           .WithLocalMountPath(file_system_config.local_mount_path));
    }
    request->SetFileSystemConfigs(file_system_configs);
  }
  if (config.ephemeral_storage) {
    request->SetEphemeralStorage(Aws::Lambda::Model::EphemeralStorage().WithSize(*config.ephemeral_storage));
  }
  if (config.snap_start) {
    request->SetSnapStart(Aws::Lambda::Model::SnapStart().WithApplyOn(
        Aws::Lambda::Model::SnapStartApplyOnMapper::GetSnapStartApplyOnForName(*config.snap_start)));
  }
  if (config.logging_config) {
    auto logging_config = Aws::Lambda::Model::LoggingConfig().WithLogFormat(
        Aws::Lambda::Model::LogFormatMapper::GetLogFormatForName(config.logging_config->log_format));
    if (config.logging_config->application_log_level) {
      logging_config.SetApplicationLogLevel(
          Aws::Lambda::Model::ApplicationLogLevelMapper::GetApplicationLogLevelForName(
              *config.logging_config->application_log_level));
    }
    if (config.logging_config->system_log_level) {
      logging_config.SetSystemLogLevel(Aws::Lambda::Model::SystemLogLevelMapper::GetSystemLogLevelForName(
          *config.logging_config->system_log_level));
    }
    if (config.logging_config->log_group) {
      logging_config.SetLogGroup(*config.logging_config->log_group);
    }
    request->SetLoggingConfig(logging_config);
  }
}

}  // namespace

CreateFunctionRequests BuildCreateFunctionRequests(const std::string& function_name, const FunctionConfig& config,
                                                   const CodeSource& code_source) {
  CreateFunctionRequests requests;
  requests.create_function = Aws::Lambda::Model::CreateFunctionRequest()
                                 .WithFunctionName(function_name)
                                 .WithCode(ToFunctionCode(code_source))
                                 .WithPackageType(Aws::Lambda::Model::PackageType::Zip)
                                 .WithPublish(false);
  ApplySharedConfiguration(config, &requests.create_function);

  if (config.architecture) {
    requests.create_function.SetArchitectures(Aws::Vector<Aws::Lambda::Model::Architecture>{
        Aws::Lambda::Model::ArchitectureMapper::GetArchitectureForName(*config.architecture)});
  }
  if (config.tags && !config.tags->empty()) {
    requests.create_function.SetTags(Aws::Map<Aws::String, Aws::String>(config.tags->cbegin(), config.tags->cend()));
  }
  if (config.code_signing_config_arn && !config.code_signing_config_arn->empty()) {
    requests.create_function.SetCodeSigningConfigArn(*config.code_signing_config_arn);
  }

  // Reserved concurrency can be set while the new function is still pending.
  if (config.reserved_concurrency) {
    requests.put_function_concurrency = Aws::Lambda::Model::PutFunctionConcurrencyRequest()
                                            .WithFunctionName(function_name)
                                            .WithReservedConcurrentExecutions(*config.reserved_concurrency);
  }

  return requests;
}

bool ConfigurationUpdateRequests::IsEmpty() const {
  return !update_function_configuration && !untag_resource && !tag_resource && !put_function_concurrency &&
         !put_function_code_signing_config && !delete_function_code_signing_config;
}

ConfigurationUpdateRequests BuildConfigurationUpdateRequests(const std::string& function_name,
                                                             const std::string& function_arn,
                                                             const std::map<std::string, std::string>& current_tags,
                                                             const FunctionConfig& changes,
                                                             const std::optional<std::string>& revision_id) {
  ConfigurationUpdateRequests requests;

  if (HasFunctionConfigurationFields(changes)) {
    requests.update_function_configuration =
        Aws::Lambda::Model::UpdateFunctionConfigurationRequest().WithFunctionName(function_name);
    ApplySharedConfiguration(changes, &*requests.update_function_configuration);
    if (revision_id) {
      requests.update_function_configuration->SetRevisionId(*revision_id);
    }
  } else if (revision_id) {
    requests.revision_id_to_check = revision_id;
  }

  if (changes.tags) {
    const auto removed_tag_keys = RemovedMapKeys(current_tags, *changes.tags);
    if (!removed_tag_keys.empty()) {
      requests.untag_resource = Aws::Lambda::Model::UntagResourceRequest().WithResource(function_arn).WithTagKeys(
          Aws::Vector<Aws::String>(removed_tag_keys.cbegin(), removed_tag_keys.cend()));
    }
    if (!changes.tags->empty()) {
      requests.tag_resource = Aws::Lambda::Model::TagResourceRequest().WithResource(function_arn).WithTags(
          Aws::Map<Aws::String, Aws::String>(changes.tags->cbegin(), changes.tags->cend()));
    }
  }

  if (changes.reserved_concurrency) {
    requests.put_function_concurrency = Aws::Lambda::Model::PutFunctionConcurrencyRequest()
                                            .WithFunctionName(function_name)
                                            .WithReservedConcurrentExecutions(*changes.reserved_concurrency);
  }

  // An empty ARN clears the code-signing config.
  if (changes.code_signing_config_arn) {
    if (changes.code_signing_config_arn->empty()) {
      requests.delete_function_code_signing_config =
          Aws::Lambda::Model::DeleteFunctionCodeSigningConfigRequest().WithFunctionName(function_name);
    } else {
      requests.put_function_code_signing_config = Aws::Lambda::Model::PutFunctionCodeSigningConfigRequest()
                                                      .WithFunctionName(function_name)
                                                      .WithCodeSigningConfigArn(*changes.code_signing_config_arn);
    }
  }

  return requests;
}

bool NeedsCurrentFunctionState(const FunctionConfig& changes, const std::optional<std::string>& revision_id) {
  return changes.tags.has_value() || (revision_id.has_value() && !HasFunctionConfigurationFields(changes));
}

}  // namespace stratus
