#include "result_reporter.hpp"

#include <algorithm>

#include "utils/filesystem.hpp"

namespace stratus {

DeploymentOutputs ReportResult(const DeploymentResult& result) {
  DeploymentOutputs outputs;
  if (!result.function_arn.empty()) {
    outputs.function_arn = result.function_arn;
  }

  const bool version_published =
      std::any_of(result.operations_applied.cbegin(), result.operations_applied.cend(), [](const auto& operation) {
        return operation.GetType() == OperationType::kPublishVersion && !operation.simulated;
      });
  if (version_published && result.published_version) {
    outputs.published_version = result.published_version;
  }

  return outputs;
}

std::string FormatOutputs(const DeploymentOutputs& outputs) {
  std::string formatted_outputs;
  if (outputs.function_arn) {
    formatted_outputs += "function-arn=" + *outputs.function_arn + "\n";
  }
  if (outputs.published_version) {
    formatted_outputs += "version=" + *outputs.published_version + "\n";
  }
  return formatted_outputs;
}

void WriteOutputs(const DeploymentOutputs& outputs, const std::optional<std::string>& output_file,
                  std::ostream* stream) {
  const std::string formatted_outputs = FormatOutputs(outputs);
  *stream << formatted_outputs;
  if (output_file) {
    AppendStringToFile(formatted_outputs, *output_file);
  }
}

}  // namespace stratus
