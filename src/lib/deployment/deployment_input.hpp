#pragma once

#include <optional>
#include <string>
#include <vector>

#include "constants.hpp"
#include "function/function_config.hpp"

namespace stratus {

/**
 * Container-image settings. They are accepted so that they can be validated, but zip packages are the only
 * packaging this deployer delivers.
 */
struct ImageConfig {
  std::vector<std::string> entry_point;
  std::vector<std::string> command;
  std::optional<std::string> working_directory;
};

/**
 * The caller-supplied deployment input after decoding. config only holds the fields the caller set; defaults are
 * applied later, depending on whether the function exists.
 */
struct DeploymentInput {
  FunctionIdentity identity;
  std::string code_artifact;
  FunctionConfig config;
  std::optional<ImageConfig> image_config;
  std::optional<std::string> s3_bucket;
  std::optional<std::string> s3_key;
  bool publish = kDefaultPublish;
  bool dry_run = kDefaultDryRun;
  std::optional<std::string> revision_id;
  std::optional<std::string> output_file;

  // Options that could not be decoded, e.g., malformed JSON. Reported together with all validation violations.
  std::vector<std::string> parse_violations;
};

}  // namespace stratus
