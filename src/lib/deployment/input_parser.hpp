#pragma once

#include <map>
#include <string>

#include "deployment/deployment_input.hpp"

namespace stratus {

static constexpr auto kFunctionNameOption = "function_name";
static constexpr auto kCodeArtifactOption = "code_artifact";
static constexpr auto kHandlerOption = "handler";
static constexpr auto kRuntimeOption = "runtime";
static constexpr auto kRoleOption = "role";
static constexpr auto kDescriptionOption = "description";
static constexpr auto kMemorySizeOption = "memory_size";
static constexpr auto kTimeoutOption = "timeout";
static constexpr auto kArchitectureOption = "architecture";
static constexpr auto kEnvironmentOption = "environment";
static constexpr auto kVpcConfigOption = "vpc_config";
static constexpr auto kDeadLetterConfigOption = "dead_letter_config";
static constexpr auto kKmsKeyArnOption = "kms_key_arn";
static constexpr auto kTracingConfigOption = "tracing_config";
static constexpr auto kLayersOption = "layers";
static constexpr auto kFileSystemConfigsOption = "file_system_configs";
static constexpr auto kImageConfigOption = "image_config";
static constexpr auto kEphemeralStorageOption = "ephemeral_storage";
static constexpr auto kSnapStartOption = "snap_start";
static constexpr auto kLoggingConfigOption = "logging_config";
static constexpr auto kCodeSigningConfigArnOption = "code_signing_config_arn";
static constexpr auto kReservedConcurrencyOption = "reserved_concurrency";
static constexpr auto kTagsOption = "tags";
static constexpr auto kS3BucketOption = "s3_bucket";
static constexpr auto kS3KeyOption = "s3_key";
static constexpr auto kPublishOption = "publish";
static constexpr auto kDryRunOption = "dry_run";
static constexpr auto kRevisionIdOption = "revision_id";
static constexpr auto kOutputFileOption = "output_file";

/**
 * Decodes the raw deployment options into a DeploymentInput. @param options maps option names to the values the
 * caller supplied; absent options stay unset. JSON-encoded options (environment, tags, vpc_config, layers,
 * file_system_configs, image_config, snap_start, logging_config) must have the documented shape. Decoding never
 * throws on bad input: every problem is recorded in DeploymentInput::parse_violations.
 */
DeploymentInput ParseDeploymentInput(const std::map<std::string, std::string>& options);

}  // namespace stratus
