#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <cxxopts.hpp>

#include "deployment/input_parser.hpp"

namespace stratus {

inline const std::vector<std::pair<std::string, std::string>> kFunctionDeployOptionHints = {
    {kFunctionNameOption, "Function name or ARN, e.g., my-function"},
    {kCodeArtifactOption, "Path to the zip package, e.g., build/function.zip"},
    {kHandlerOption, "Handler, default 'index.handler' for new functions"},
    {kRuntimeOption, "Runtime identifier, default 'nodejs20.x' for new functions"},
    {kRoleOption, "Execution role ARN, required for new functions"},
    {kDescriptionOption, "Function description"},
    {kMemorySizeOption, "Memory size in MB, e.g., 128"},
    {kTimeoutOption, "Timeout in seconds, default 3 for new functions"},
    {kArchitectureOption, "Instruction set architecture: x86_64|arm64"},
    {kEnvironmentOption, "Environment variables as JSON object, e.g., '{\"KEY\":\"value\"}'"},
    {kVpcConfigOption, "VPC settings as JSON, e.g., '{\"SubnetIds\":[...],\"SecurityGroupIds\":[...]}'"},
    {kDeadLetterConfigOption, "Dead-letter target ARN (SQS queue or SNS topic)"},
    {kKmsKeyArnOption, "KMS key ARN for environment variable encryption"},
    {kTracingConfigOption, "Tracing mode: Active|PassThrough"},
    {kLayersOption, "Layer version ARNs as JSON array"},
    {kFileSystemConfigsOption, "File systems as JSON array, e.g., '[{\"Arn\":\"...\",\"LocalMountPath\":\"/mnt/x\"}]'"},
    {kImageConfigOption, "Container image settings as JSON object"},
    {kEphemeralStorageOption, "Size of /tmp in MB, default 512 for new functions"},
    {kSnapStartOption, "SnapStart as JSON, e.g., '{\"ApplyOn\":\"PublishedVersions\"}'"},
    {kLoggingConfigOption, "Logging settings as JSON, e.g., '{\"LogFormat\":\"JSON\"}'"},
    {kCodeSigningConfigArnOption, "Code-signing config ARN, empty to detach"},
    {kReservedConcurrencyOption, "Reserved concurrent executions"},
    {kTagsOption, "Tags as JSON object"},
    {kS3BucketOption, "Stage the package in this S3 bucket instead of uploading it directly"},
    {kS3KeyOption, "S3 object key, generated if omitted"},
    {kRevisionIdOption, "Expected revision id of the function; the deployment fails if it changed"},
    {kOutputFileOption, "Append outputs as key=value lines to this file"}};

inline const std::vector<std::pair<std::string, std::string>> kFunctionDeployFlagHints = {
    {kPublishOption, "Publish a version after a change: true|false, default true"},
    {kDryRunOption, "Validate and plan without changing the function: true|false, default true"}};

/**
 * @return the function-deploy options present in @param parse_result, keyed by option name.
 */
std::map<std::string, std::string> CollectFunctionDeployOptions(const cxxopts::ParseResult& parse_result);

/**
 * Deploys a function to AWS Lambda based on the given flags and prints the outputs.
 */
void FunctionDeployTool(const cxxopts::ParseResult& parse_result);

}  // namespace stratus
