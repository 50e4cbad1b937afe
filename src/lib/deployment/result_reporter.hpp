#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "deployment/deployment_plan.hpp"

namespace stratus {

struct DeploymentOutputs {
  // Empty only for a dry run that would create the function.
  std::optional<std::string> function_arn;
  // Set iff a version was actually published.
  std::optional<std::string> published_version;

  bool operator==(const DeploymentOutputs& other) const = default;
};

DeploymentOutputs ReportResult(const DeploymentResult& result);

/**
 * @return the outputs as "key=value" lines, e.g., "function-arn=arn:...\nversion=3\n".
 */
std::string FormatOutputs(const DeploymentOutputs& outputs);

/**
 * Writes the outputs to @param stream and, if @param output_file is set, appends them to that file.
 */
void WriteOutputs(const DeploymentOutputs& outputs, const std::optional<std::string>& output_file,
                  std::ostream* stream);

}  // namespace stratus
