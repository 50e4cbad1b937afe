#include "function_utils.hpp"

#include <type_traits>

#include <aws/core/utils/memory/stl/AWSVector.h>
#include <aws/lambda/model/ApplicationLogLevel.h>
#include <aws/lambda/model/Architecture.h>
#include <aws/lambda/model/LogFormat.h>
#include <aws/lambda/model/PackageType.h>
#include <aws/lambda/model/Runtime.h>
#include <aws/lambda/model/SnapStartApplyOn.h>
#include <aws/lambda/model/SystemLogLevel.h>
#include <aws/lambda/model/TracingMode.h>

namespace stratus {

namespace {

std::optional<std::string> NonEmptyOrNullopt(const Aws::String& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace

ServiceErrorType TranslateLambdaError(const Aws::Lambda::LambdaErrors error) {
  switch (error) {
    case Aws::Lambda::LambdaErrors::RESOURCE_NOT_FOUND:
      return ServiceErrorType::kNotFound;

    // Raised when the passed revision id does not match the function's current one.
    case Aws::Lambda::LambdaErrors::PRECONDITION_FAILED:
      return ServiceErrorType::kConflict;

    case Aws::Lambda::LambdaErrors::THROTTLING:
    case Aws::Lambda::LambdaErrors::SLOW_DOWN:
    case Aws::Lambda::LambdaErrors::TOO_MANY_REQUESTS:
      return ServiceErrorType::kThrottled;

    case Aws::Lambda::LambdaErrors::INVALID_PARAMETER_VALUE:
    case Aws::Lambda::LambdaErrors::INVALID_PARAMETER_COMBINATION:
    case Aws::Lambda::LambdaErrors::INVALID_QUERY_PARAMETER:
    case Aws::Lambda::LambdaErrors::MISSING_PARAMETER:
    case Aws::Lambda::LambdaErrors::MALFORMED_QUERY_STRING:
    case Aws::Lambda::LambdaErrors::VALIDATION:
    case Aws::Lambda::LambdaErrors::INVALID_REQUEST_CONTENT:
    case Aws::Lambda::LambdaErrors::INVALID_RUNTIME:
    case Aws::Lambda::LambdaErrors::INVALID_ZIP_FILE:
    case Aws::Lambda::LambdaErrors::REQUEST_TOO_LARGE:
    case Aws::Lambda::LambdaErrors::CODE_STORAGE_EXCEEDED:
    case Aws::Lambda::LambdaErrors::CODE_SIGNING_CONFIG_NOT_FOUND:
    case Aws::Lambda::LambdaErrors::CODE_VERIFICATION_FAILED:
    case Aws::Lambda::LambdaErrors::INVALID_CODE_SIGNATURE:
      return ServiceErrorType::kInvalidInput;

    default:
      return ServiceErrorType::kFault;
  }
}

LastUpdateStatus TranslateFunctionStatus(const Aws::Lambda::Model::State state,
                                         const Aws::Lambda::Model::LastUpdateStatus last_update_status) {
  if (state == Aws::Lambda::Model::State::Pending ||
      last_update_status == Aws::Lambda::Model::LastUpdateStatus::InProgress) {
    return LastUpdateStatus::kPending;
  }

  if (state == Aws::Lambda::Model::State::Failed ||
      last_update_status == Aws::Lambda::Model::LastUpdateStatus::Failed) {
    return LastUpdateStatus::kFailed;
  }

  return LastUpdateStatus::kSuccessful;
}

FunctionConfig FunctionConfigFromRemote(const Aws::Lambda::Model::FunctionConfiguration& configuration,
                                        const std::map<std::string, std::string>& tags,
                                        const std::optional<int>& reserved_concurrency,
                                        const std::string& code_signing_config_arn) {
  FunctionConfig config;
  config.handler = configuration.GetHandler();
  config.runtime = Aws::Lambda::Model::RuntimeMapper::GetNameForRuntime(configuration.GetRuntime());
  config.role = configuration.GetRole();
  config.description = configuration.GetDescription();
  config.memory_size = configuration.GetMemorySize();
  config.timeout = configuration.GetTimeout();

  const auto& architectures = configuration.GetArchitectures();
  config.architecture = architectures.empty()
                            ? std::string("x86_64")
                            : Aws::Lambda::Model::ArchitectureMapper::GetNameForArchitecture(architectures.front());

  const auto& variables = configuration.GetEnvironment().GetVariables();
  config.environment = std::map<std::string, std::string>(variables.cbegin(), variables.cend());

  const auto& vpc_config = configuration.GetVpcConfig();
  config.vpc_config = VpcConfig{
      .subnet_ids = std::vector<std::string>(vpc_config.GetSubnetIds().cbegin(), vpc_config.GetSubnetIds().cend()),
      .security_group_ids = std::vector<std::string>(vpc_config.GetSecurityGroupIds().cbegin(),
                                                     vpc_config.GetSecurityGroupIds().cend()),
      .ipv6_allowed_for_dual_stack = vpc_config.GetIpv6AllowedForDualStack()};

  config.dead_letter_target_arn = configuration.GetDeadLetterConfig().GetTargetArn();
  config.kms_key_arn = configuration.GetKMSKeyArn();
  config.tracing_mode =
      Aws::Lambda::Model::TracingModeMapper::GetNameForTracingMode(configuration.GetTracingConfig().GetMode());

  std::vector<std::string> layers;
  for (const auto& layer : configuration.GetLayers()) {
    layers.emplace_back(layer.GetArn());
  }
  config.layers = std::move(layers);

  std::vector<FileSystemConfig> file_system_configs;
  for (const auto& file_system_config : configuration.GetFileSystemConfigs()) {
    file_system_configs.push_back(
        {.arn = file_system_config.GetArn(), .local_mount_path = file_system_config.GetLocalMountPath()});
  }
  config.file_system_configs = std::move(file_system_configs);

  config.ephemeral_storage = configuration.GetEphemeralStorage().GetSize();
  config.snap_start = Aws::Lambda::Model::SnapStartApplyOnMapper::GetNameForSnapStartApplyOn(
      configuration.GetSnapStart().GetApplyOn());

  const auto& logging_config = configuration.GetLoggingConfig();
  config.logging_config = LoggingConfig{
      .log_format = Aws::Lambda::Model::LogFormatMapper::GetNameForLogFormat(logging_config.GetLogFormat()),
      .application_log_level =
          NonEmptyOrNullopt(Aws::Lambda::Model::ApplicationLogLevelMapper::GetNameForApplicationLogLevel(
              logging_config.GetApplicationLogLevel())),
      .system_log_level = NonEmptyOrNullopt(
          Aws::Lambda::Model::SystemLogLevelMapper::GetNameForSystemLogLevel(logging_config.GetSystemLogLevel())),
      .log_group = NonEmptyOrNullopt(logging_config.GetLogGroup())};

  config.reserved_concurrency = reserved_concurrency;
  config.tags = tags;
  config.code_signing_config_arn = code_signing_config_arn;

  return config;
}

Aws::Lambda::Model::FunctionCode ToFunctionCode(const CodeSource& code_source) {
  return std::visit(
      [](const auto& code) {
        using T = std::decay_t<decltype(code)>;
        if constexpr (std::is_same_v<T, InlineCode>) {
          return Aws::Lambda::Model::FunctionCode().WithZipFile(
              Aws::Utils::CryptoBuffer(reinterpret_cast<const unsigned char*>(code.bytes->data()), code.bytes->size()));
        } else {
          static_assert(std::is_same_v<T, ObjectStoreCode>, "Unhandled code source type.");
          return Aws::Lambda::Model::FunctionCode().WithS3Bucket(code.bucket).WithS3Key(code.key);
        }
      },
      code_source);
}

bool HasFunctionConfigurationFields(const FunctionConfig& changes) {
  FunctionConfig configuration_fields = changes;
  configuration_fields.architecture.reset();
  configuration_fields.reserved_concurrency.reset();
  configuration_fields.tags.reset();
  configuration_fields.code_signing_config_arn.reset();
  return !configuration_fields.IsEmpty();
}

}  // namespace stratus
