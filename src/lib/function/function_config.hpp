#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stratus {

/**
 * The unique key of a remote function. It is fixed for the whole deployment.
 */
struct FunctionIdentity {
  std::string name;

  bool operator==(const FunctionIdentity& other) const = default;
};

struct VpcConfig {
  std::vector<std::string> subnet_ids;
  std::vector<std::string> security_group_ids;
  bool ipv6_allowed_for_dual_stack = false;

  bool operator==(const VpcConfig& other) const = default;
};

struct FileSystemConfig {
  std::string arn;
  std::string local_mount_path;

  bool operator==(const FileSystemConfig& other) const = default;
};

struct LoggingConfig {
  std::string log_format;
  std::optional<std::string> application_log_level;
  std::optional<std::string> system_log_level;
  std::optional<std::string> log_group;

  bool operator==(const LoggingConfig& other) const = default;
};

/**
 * FunctionConfig describes the configuration of a function. The same record is used for three purposes:
 *
 *  - the desired configuration produced by the DesiredStateBuilder,
 *  - the live configuration of an existing function as read from the service, where every field is set,
 *  - the partial configuration carried by an UpdateConfiguration operation, where only the changed fields are set.
 *
 * An unset field means "leave the remote value untouched". A set but empty collection (e.g., environment = {}) means
 * "clear all entries". The distinction is preserved through diffing.
 */
struct FunctionConfig {
  std::optional<std::string> handler;
  std::optional<std::string> runtime;
  std::optional<std::string> role;
  std::optional<std::string> description;
  std::optional<int> memory_size;
  std::optional<int> timeout;
  std::optional<std::string> architecture;
  std::optional<std::map<std::string, std::string>> environment;
  std::optional<VpcConfig> vpc_config;
  std::optional<std::string> dead_letter_target_arn;
  std::optional<std::string> kms_key_arn;
  std::optional<std::string> tracing_mode;
  std::optional<std::vector<std::string>> layers;
  std::optional<std::vector<FileSystemConfig>> file_system_configs;
  std::optional<int> ephemeral_storage;
  std::optional<std::string> snap_start;
  std::optional<LoggingConfig> logging_config;
  std::optional<int> reserved_concurrency;
  std::optional<std::map<std::string, std::string>> tags;
  std::optional<std::string> code_signing_config_arn;

  bool operator==(const FunctionConfig& other) const = default;

  /**
   * @return the names of all set fields in declaration order, e.g., {"memory_size", "timeout"}.
   */
  std::vector<std::string> SetFieldNames() const;

  bool IsEmpty() const { return SetFieldNames().empty(); }
};

}  // namespace stratus
