#include <iostream>

#include <aws/core/Aws.h>
#include <aws/core/utils/logging/CRTLogSystem.h>
#include <aws/core/utils/logging/ConsoleLogSystem.h>
#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "deployment/deployment_errors.hpp"
#include "tool/function_deploy_tool.hpp"
#include "tool/tool_config.hpp"
#include "utils/assert.hpp"
#include "utils/signal_handler.hpp"

using namespace stratus;  // NOLINT(google-build-using-namespace)

namespace {

/**
 * Initializes the AWS SDK with console logging for the lifetime of the object.
 */
class ScopedAwsApi {
 public:
  explicit ScopedAwsApi(const Aws::Utils::Logging::LogLevel log_level) {
    const Aws::Utils::Logging::LogLevel crt_log_level{Aws::Utils::Logging::LogLevel::Warn};
    sdk_options_.loggingOptions.logLevel = log_level;
    sdk_options_.loggingOptions.logger_create_fn = [log_level]() {
      return Aws::MakeShared<Aws::Utils::Logging::ConsoleLogSystem>("console_logger", log_level);
    };
    sdk_options_.loggingOptions.crt_logger_create_fn = [crt_log_level]() {
      return Aws::MakeShared<Aws::Utils::Logging::DefaultCRTLogSystem>("default_crt_logger", crt_log_level);
    };
    Aws::InitAPI(sdk_options_);
  }

  ScopedAwsApi(const ScopedAwsApi&) = delete;
  ScopedAwsApi& operator=(const ScopedAwsApi&) = delete;

  ~ScopedAwsApi() { Aws::ShutdownAPI(sdk_options_); }

 private:
  Aws::SDKOptions sdk_options_;
};

}  // namespace

/**
 * The command line interface (CLI) for Stratus. E.g., ./stratus --tool function-deploy --function_name my-function
 * --code_artifact build/function.zip --role arn:aws:iam::123456789012:role/my-role --dry_run=false
 * Check ./stratus --help for all available options.
 */
int main(int argc, char** argv) {
  RegisterSignalHandler();
  cxxopts::ParseResult parse_result;
  try {
    cxxopts::Options cli_options = ConfigureCliOptions();
    parse_result = cli_options.parse(argc, argv);

    if (parse_result.arguments().empty() || parse_result.count(kHelpOption)) {
      // Print help and terminate.
      std::cout << cli_options.help() << std::endl;
      return 0;
    }

    AssertInput(parse_result.count(kToolOption), "Missing --tool, e.g., --tool function-deploy.");
    const ToolType tool = ToolOptionToEnum(parse_result[kToolOption].as<std::string>());
    const ScopedAwsApi aws_api(LogLevelFromCliOptions(parse_result));

    switch (tool) {
      case ToolType::kFunctionDeploy:
        FunctionDeployTool(parse_result);
        break;
      default:
        Fail("The tool '" + parse_result[kToolOption].as<std::string>() + "' is not implemented!");
    }
  } catch (const std::bad_optional_access& optional_error) {
    std::cerr << "Found no matching enum for name '" + parse_result[kToolOption].as<std::string>() + "'" << std::endl;
    return 1;
  } catch (const ValidationException& validation_exception) {
    std::cerr << validation_exception.what() << std::endl;
    return 1;
  } catch (const DeploymentException& deployment_exception) {
    std::cerr << deployment_exception.what() << std::endl;
    if (deployment_exception.GetKind() == FaultKind::kPartialSuccess) {
      std::cerr << "The function is no longer at its previous state. Re-run the deployment to reconcile."
                << std::endl;
    }
    return 1;
  } catch (const std::exception& exception) {
    // Handle cxxopts exceptions, invalid input and logical errors.
    std::cerr << exception.what() << std::endl;
    return 1;
  }
  DeregisterSignalHandler();
  return 0;
}
