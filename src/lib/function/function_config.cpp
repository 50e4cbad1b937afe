#include "function_config.hpp"

namespace stratus {

namespace {

template <typename T>
void AppendIfSet(const std::optional<T>& field, const char* name, std::vector<std::string>* names) {
  if (field.has_value()) {
    names->emplace_back(name);
  }
}

}  // namespace

std::vector<std::string> FunctionConfig::SetFieldNames() const {
  std::vector<std::string> names;
  AppendIfSet(handler, "handler", &names);
  AppendIfSet(runtime, "runtime", &names);
  AppendIfSet(role, "role", &names);
  AppendIfSet(description, "description", &names);
  AppendIfSet(memory_size, "memory_size", &names);
  AppendIfSet(timeout, "timeout", &names);
  AppendIfSet(architecture, "architecture", &names);
  AppendIfSet(environment, "environment", &names);
  AppendIfSet(vpc_config, "vpc_config", &names);
  AppendIfSet(dead_letter_target_arn, "dead_letter_target_arn", &names);
  AppendIfSet(kms_key_arn, "kms_key_arn", &names);
  AppendIfSet(tracing_mode, "tracing_mode", &names);
  AppendIfSet(layers, "layers", &names);
  AppendIfSet(file_system_configs, "file_system_configs", &names);
  AppendIfSet(ephemeral_storage, "ephemeral_storage", &names);
  AppendIfSet(snap_start, "snap_start", &names);
  AppendIfSet(logging_config, "logging_config", &names);
  AppendIfSet(reserved_concurrency, "reserved_concurrency", &names);
  AppendIfSet(tags, "tags", &names);
  AppendIfSet(code_signing_config_arn, "code_signing_config_arn", &names);
  return names;
}

}  // namespace stratus
