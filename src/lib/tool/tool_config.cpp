#include "tool_config.hpp"

#include <cctype>
#include <regex>
#include <string>

#include <boost/algorithm/string.hpp>

#include "constants.hpp"
#include "function_deploy_tool.hpp"
#include "utils/assert.hpp"

namespace stratus {

ToolType ToolOptionToEnum(const std::string& tool_option) {
  std::smatch match;
  std::regex_search(tool_option, match, static_cast<std::regex>(kToolRegex));
  AssertInput(match.size() == 3, "Tool must be specified in format 'tool-identifier'.");
  const std::string tool =
      match[1].str().replace(0, 1, boost::to_upper_copy(match[1].str().substr(0, 1))).insert(0, kConstPrefix);
  const std::string identifier = match[2].str().replace(0, 1, boost::to_upper_copy(match[2].str().substr(0, 1)));
  return magic_enum::enum_cast<ToolType>(tool + identifier).value();
}

Aws::Utils::Logging::LogLevel LogLevelFromCliOptions(const cxxopts::ParseResult& parse_result) {
  if (parse_result.count(kLogLevelOption)) {
    std::string log_level = boost::algorithm::to_lower_copy(parse_result[kLogLevelOption].as<std::string>());
    AssertInput(!log_level.empty(), "Log level must not be empty.");
    log_level[0] = static_cast<char>(std::toupper(log_level[0]));
    const auto level = magic_enum::enum_cast<Aws::Utils::Logging::LogLevel>(log_level);
    AssertInput(level.has_value(), "Unknown log level '" + parse_result[kLogLevelOption].as<std::string>() + "'.");
    return *level;
  }

  return parse_result.count(kVerboseOption) ? Aws::Utils::Logging::LogLevel::Info
                                            : Aws::Utils::Logging::LogLevel::Warn;
}

cxxopts::Options ConfigureCliOptions() {
  cxxopts::Options cli_options(kProgramName);
  // General options.
  cli_options.add_options(kHelpOption)("h, help", kHelpHint);
  cli_options.add_options(kToolOption)("t, tool", kToolHint, cxxopts::value<std::string>());
  cli_options.add_options("logging")("v, verbose", kVerboseHint)(kLogLevelOption, kLogLevelHint,
                                                                    cxxopts::value<std::string>());
  // Function-deploy specific option group. Every value is decoded and validated by the deployer.
  auto function_deploy_options = cli_options.add_options("function-deploy");
  for (const auto& [option, hint] : kFunctionDeployOptionHints) {
    function_deploy_options(option, hint, cxxopts::value<std::string>());
  }
  for (const auto& [option, hint] : kFunctionDeployFlagHints) {
    function_deploy_options(option, hint, cxxopts::value<std::string>()->implicit_value("true"));
  }
  return cli_options;
}

}  // namespace stratus
