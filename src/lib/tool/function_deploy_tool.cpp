#include "function_deploy_tool.hpp"

#include <iostream>
#include <memory>

#include <aws/core/utils/logging/LogMacros.h>

#include "client/base_client.hpp"
#include "constants.hpp"
#include "deployment/deployer.hpp"
#include "deployment/result_reporter.hpp"
#include "function/lambda_function_service.hpp"
#include "storage/backend/s3_object_store.hpp"
#include "utils/signal_handler.hpp"

namespace stratus {

std::map<std::string, std::string> CollectFunctionDeployOptions(const cxxopts::ParseResult& parse_result) {
  std::map<std::string, std::string> options;
  for (const auto& hints : {kFunctionDeployOptionHints, kFunctionDeployFlagHints}) {
    for (const auto& [option, hint] : hints) {
      if (parse_result.count(option)) {
        options.emplace(option, parse_result[option].as<std::string>());
      }
    }
  }
  return options;
}

void FunctionDeployTool(const cxxopts::ParseResult& parse_result) {
  const DeploymentInput input = ParseDeploymentInput(CollectFunctionDeployOptions(parse_result));

  SetFunctionInDeployment(input.identity.name);
  const BaseClient client;
  Deployer deployer(std::make_shared<LambdaFunctionService>(client.GetLambdaClient()),
                    std::make_shared<S3ObjectStore>(client.GetS3Client(), client.GetClientRegion()));

  const DeploymentResult result = deployer.Deploy(input);
  if (result.dry_run) {
    AWS_LOGSTREAM_WARN(kBaseTag.c_str(), "Dry run: no changes were applied. Pass --dry_run=false to deploy.");
  }

  WriteOutputs(ReportResult(result), input.output_file, &std::cout);
}

}  // namespace stratus
