#pragma once

#include <string>

#include <aws/core/utils/logging/LogLevel.h>
#include <cxxopts.hpp>
#include <magic_enum/magic_enum.hpp>

namespace stratus {

enum class ToolType { kFunctionDeploy };

static constexpr auto kHelpOption = "help";
static constexpr auto kHelpHint = "Print usage";

static constexpr auto kToolOption = "tool";
static constexpr auto kToolHint = "Name of the non-interactive tool, e.g., 'function-deploy'";
static constexpr auto kToolRegex = "([a-z]*)-([a-z]*)";

static constexpr auto kVerboseOption = "verbose";
static constexpr auto kVerboseHint = "Log progress at level info";

static constexpr auto kLogLevelOption = "log_level";
static constexpr auto kLogLevelHint = "Log level: off|fatal|error|warn|info|debug|trace";

static constexpr auto kProgramName = "stratus";

/**
 * Transforms user input, e.g., 'function-deploy' to 'kFunctionDeploy' and returns the enum value.
 */
ToolType ToolOptionToEnum(const std::string& tool_option);

/**
 * Resolves the SDK log level from --log_level, e.g., 'debug', or --verbose. Defaults to warnings.
 */
Aws::Utils::Logging::LogLevel LogLevelFromCliOptions(const cxxopts::ParseResult& parse_result);

/**
 * Defines groups of valid CLI options which can be passed to the Stratus binary.
 */
cxxopts::Options ConfigureCliOptions();

}  // namespace stratus
