#include "input_parser.hpp"

#include <charconv>
#include <set>

#include <aws/core/utils/json/JsonSerializer.h>

#include "utils/json.hpp"
#include "utils/string.hpp"

namespace stratus {

namespace {

using Aws::Utils::Json::JsonValue;
using Aws::Utils::Json::JsonView;

class OptionDecoder {
 public:
  OptionDecoder(const std::map<std::string, std::string>& options, std::vector<std::string>* violations)
      : options_(options), violations_(violations) {}

  std::optional<std::string> String(const std::string& name) const {
    const auto it = options_.find(name);
    if (it == options_.cend()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<int> Integer(const std::string& name) const {
    const auto value = String(name);
    if (!value) {
      return std::nullopt;
    }

    int result = 0;
    const auto* const end = value->data() + value->size();
    const auto [pointer, error] = std::from_chars(value->data(), end, result);
    if (value->empty() || error != std::errc() || pointer != end) {
      violations_->emplace_back(name + ": '" + *value + "' is not an integer.");
      return std::nullopt;
    }
    return result;
  }

  std::optional<bool> Boolean(const std::string& name) const {
    const auto value = String(name);
    if (!value) {
      return std::nullopt;
    }

    const std::string lower_case_value = ToLowerCase(*value);
    if (lower_case_value == "true") {
      return true;
    }
    if (lower_case_value == "false") {
      return false;
    }
    violations_->emplace_back(name + ": '" + *value + "' is not a boolean (true|false).");
    return std::nullopt;
  }

  /**
   * Parses the option @param name as JSON. The returned JsonValue owns the document; views into it are only valid
   * while it lives.
   */
  std::optional<JsonValue> Json(const std::string& name) const {
    const auto value = String(name);
    if (!value) {
      return std::nullopt;
    }

    JsonValue json(Aws::String(value->cbegin(), value->cend()));
    if (!json.WasParseSuccessful()) {
      violations_->emplace_back(name + ": malformed JSON (" + json.GetErrorMessage() + ").");
      return std::nullopt;
    }
    return json;
  }

  void Violation(const std::string& name, const std::string& message) const {
    violations_->emplace_back(name + ": " + message);
  }

 private:
  const std::map<std::string, std::string>& options_;
  std::vector<std::string>* violations_;
};

/**
 * Reports members of @param object that are not in @param allowed_keys. Misspelled keys would otherwise be ignored.
 */
bool CheckKeys(const OptionDecoder& decoder, const std::string& name, const JsonView& object,
               const std::set<std::string>& allowed_keys) {
  bool valid = true;
  for (const auto& [key, value] : object.GetAllObjects()) {
    if (!allowed_keys.contains(key)) {
      decoder.Violation(name, "unknown key '" + key + "'.");
      valid = false;
    }
  }
  return valid;
}

std::optional<std::map<std::string, std::string>> DecodeStringMap(const OptionDecoder& decoder,
                                                                  const std::string& name) {
  const auto json = decoder.Json(name);
  if (!json) {
    return std::nullopt;
  }

  const auto view = json->View();
  if (!IsJsonStringObject(view)) {
    decoder.Violation(name, "expected a JSON object with string values.");
    return std::nullopt;
  }
  return JsonObjectToStringMap(view);
}

std::optional<std::vector<std::string>> DecodeStringList(const OptionDecoder& decoder, const std::string& name) {
  const auto json = decoder.Json(name);
  if (!json) {
    return std::nullopt;
  }

  const auto view = json->View();
  if (!IsJsonStringArray(view)) {
    decoder.Violation(name, "expected a JSON array of strings.");
    return std::nullopt;
  }
  return JsonArrayToVector<std::string>(view.AsArray());
}

std::optional<VpcConfig> DecodeVpcConfig(const OptionDecoder& decoder) {
  const auto json = decoder.Json(kVpcConfigOption);
  if (!json) {
    return std::nullopt;
  }

  const auto view = json->View();
  if (!view.IsObject()) {
    decoder.Violation(kVpcConfigOption, "expected a JSON object.");
    return std::nullopt;
  }

  bool valid =
      CheckKeys(decoder, kVpcConfigOption, view, {"SubnetIds", "SecurityGroupIds", "Ipv6AllowedForDualStack"});
  VpcConfig vpc_config;
  const std::vector<std::pair<std::string, std::vector<std::string>*>> id_lists = {
      {"SubnetIds", &vpc_config.subnet_ids}, {"SecurityGroupIds", &vpc_config.security_group_ids}};
  for (const auto& [key, target] : id_lists) {
    if (!view.KeyExists(key)) {
      continue;
    }
    if (!IsJsonStringArray(view.GetObject(key))) {
      decoder.Violation(kVpcConfigOption, key + " must be an array of strings.");
      valid = false;
      continue;
    }
    *target = JsonArrayToVector<std::string>(view.GetArray(key));
  }

  if (view.KeyExists("Ipv6AllowedForDualStack")) {
    if (!view.GetObject("Ipv6AllowedForDualStack").IsBool()) {
      decoder.Violation(kVpcConfigOption, "Ipv6AllowedForDualStack must be a boolean.");
      valid = false;
    } else {
      vpc_config.ipv6_allowed_for_dual_stack = view.GetBool("Ipv6AllowedForDualStack");
    }
  }

  return valid ? std::optional<VpcConfig>(vpc_config) : std::nullopt;
}

std::optional<std::vector<FileSystemConfig>> DecodeFileSystemConfigs(const OptionDecoder& decoder) {
  const auto json = decoder.Json(kFileSystemConfigsOption);
  if (!json) {
    return std::nullopt;
  }

  const auto view = json->View();
  if (!view.IsListType()) {
    decoder.Violation(kFileSystemConfigsOption, "expected a JSON array of objects.");
    return std::nullopt;
  }

  bool valid = true;
  std::vector<FileSystemConfig> file_system_configs;
  const auto array = view.AsArray();
  for (size_t i = 0; i < array.GetLength(); ++i) {
    const auto& element = array[i];
    const std::string position = "entry " + std::to_string(i);
    if (!element.IsObject()) {
      decoder.Violation(kFileSystemConfigsOption, position + " must be an object with Arn and LocalMountPath.");
      valid = false;
      continue;
    }
    if (!CheckKeys(decoder, kFileSystemConfigsOption, element, {"Arn", "LocalMountPath"})) {
      valid = false;
      continue;
    }
    if (!element.KeyExists("Arn") || !element.GetObject("Arn").IsString() || !element.KeyExists("LocalMountPath") ||
        !element.GetObject("LocalMountPath").IsString()) {
      decoder.Violation(kFileSystemConfigsOption, position + " requires string values for Arn and LocalMountPath.");
      valid = false;
      continue;
    }
    file_system_configs.push_back(
        {.arn = element.GetString("Arn"), .local_mount_path = element.GetString("LocalMountPath")});
  }

  return valid ? std::optional<std::vector<FileSystemConfig>>(file_system_configs) : std::nullopt;
}

std::optional<ImageConfig> DecodeImageConfig(const OptionDecoder& decoder) {
  const auto json = decoder.Json(kImageConfigOption);
  if (!json) {
    return std::nullopt;
  }

  const auto view = json->View();
  if (!view.IsObject()) {
    decoder.Violation(kImageConfigOption, "expected a JSON object.");
    return std::nullopt;
  }

  bool valid = CheckKeys(decoder, kImageConfigOption, view, {"EntryPoint", "Command", "WorkingDirectory"});
  ImageConfig image_config;
  const std::vector<std::pair<std::string, std::vector<std::string>*>> argument_lists = {
      {"EntryPoint", &image_config.entry_point}, {"Command", &image_config.command}};
  for (const auto& [key, target] : argument_lists) {
    if (!view.KeyExists(key)) {
      continue;
    }
    if (!IsJsonStringArray(view.GetObject(key))) {
      decoder.Violation(kImageConfigOption, key + " must be an array of strings.");
      valid = false;
      continue;
    }
    *target = JsonArrayToVector<std::string>(view.GetArray(key));
  }

  if (view.KeyExists("WorkingDirectory")) {
    if (!view.GetObject("WorkingDirectory").IsString()) {
      decoder.Violation(kImageConfigOption, "WorkingDirectory must be a string.");
      valid = false;
    } else {
      image_config.working_directory = view.GetString("WorkingDirectory");
    }
  }

  return valid ? std::optional<ImageConfig>(image_config) : std::nullopt;
}

std::optional<std::string> DecodeSnapStart(const OptionDecoder& decoder) {
  const auto json = decoder.Json(kSnapStartOption);
  if (!json) {
    return std::nullopt;
  }

  const auto view = json->View();
  if (!view.IsObject() || !CheckKeys(decoder, kSnapStartOption, view, {"ApplyOn"}) || !view.KeyExists("ApplyOn") ||
      !view.GetObject("ApplyOn").IsString()) {
    decoder.Violation(kSnapStartOption, "expected a JSON object with a string ApplyOn.");
    return std::nullopt;
  }
  return view.GetString("ApplyOn");
}

std::optional<LoggingConfig> DecodeLoggingConfig(const OptionDecoder& decoder) {
  const auto json = decoder.Json(kLoggingConfigOption);
  if (!json) {
    return std::nullopt;
  }

  const auto view = json->View();
  if (!view.IsObject()) {
    decoder.Violation(kLoggingConfigOption, "expected a JSON object.");
    return std::nullopt;
  }

  bool valid = CheckKeys(decoder, kLoggingConfigOption, view,
                         {"LogFormat", "ApplicationLogLevel", "SystemLogLevel", "LogGroup"});
  for (const auto& [key, value] : view.GetAllObjects()) {
    if (!value.IsString()) {
      decoder.Violation(kLoggingConfigOption, key + " must be a string.");
      valid = false;
    }
  }
  if (!view.KeyExists("LogFormat")) {
    decoder.Violation(kLoggingConfigOption, "LogFormat is required.");
    valid = false;
  }
  if (!valid) {
    return std::nullopt;
  }

  const auto optional_string = [&view](const std::string& key) -> std::optional<std::string> {
    if (!view.KeyExists(key)) {
      return std::nullopt;
    }
    return view.GetString(key);
  };

  return LoggingConfig{.log_format = view.GetString("LogFormat"),
                       .application_log_level = optional_string("ApplicationLogLevel"),
                       .system_log_level = optional_string("SystemLogLevel"),
                       .log_group = optional_string("LogGroup")};
}

}  // namespace

DeploymentInput ParseDeploymentInput(const std::map<std::string, std::string>& options) {
  DeploymentInput input;
  const OptionDecoder decoder(options, &input.parse_violations);

  input.identity.name = decoder.String(kFunctionNameOption).value_or("");
  input.code_artifact = decoder.String(kCodeArtifactOption).value_or("");

  FunctionConfig& config = input.config;
  config.handler = decoder.String(kHandlerOption);
  config.runtime = decoder.String(kRuntimeOption);
  config.role = decoder.String(kRoleOption);
  config.description = decoder.String(kDescriptionOption);
  config.memory_size = decoder.Integer(kMemorySizeOption);
  config.timeout = decoder.Integer(kTimeoutOption);
  config.architecture = decoder.String(kArchitectureOption);
  config.environment = DecodeStringMap(decoder, kEnvironmentOption);
  config.vpc_config = DecodeVpcConfig(decoder);
  config.dead_letter_target_arn = decoder.String(kDeadLetterConfigOption);
  config.kms_key_arn = decoder.String(kKmsKeyArnOption);
  config.tracing_mode = decoder.String(kTracingConfigOption);
  config.layers = DecodeStringList(decoder, kLayersOption);
  config.file_system_configs = DecodeFileSystemConfigs(decoder);
  config.ephemeral_storage = decoder.Integer(kEphemeralStorageOption);
  config.snap_start = DecodeSnapStart(decoder);
  config.logging_config = DecodeLoggingConfig(decoder);
  config.reserved_concurrency = decoder.Integer(kReservedConcurrencyOption);
  config.tags = DecodeStringMap(decoder, kTagsOption);
  config.code_signing_config_arn = decoder.String(kCodeSigningConfigArnOption);

  input.image_config = DecodeImageConfig(decoder);
  input.s3_bucket = decoder.String(kS3BucketOption);
  input.s3_key = decoder.String(kS3KeyOption);
  input.publish = decoder.Boolean(kPublishOption).value_or(kDefaultPublish);
  input.dry_run = decoder.Boolean(kDryRunOption).value_or(kDefaultDryRun);
  input.revision_id = decoder.String(kRevisionIdOption);
  input.output_file = decoder.String(kOutputFileOption);

  return input;
}

}  // namespace stratus
