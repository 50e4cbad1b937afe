#include "deployment_errors.hpp"

#include <magic_enum/magic_enum.hpp>

#include "constants.hpp"
#include "utils/string.hpp"

namespace stratus {

namespace {

std::string FormatViolations(const std::vector<std::string>& violations) {
  return "Invalid deployment input (" + std::to_string(violations.size()) + " violation(s)):\n  - " +
         VectorToString(violations, "\n  - ");
}

std::string FormatFault(const FaultKind kind, const std::string& operation, const std::string& function_name,
                        const std::string& detail) {
  return FaultKindToString(kind) + " during " + operation + " on function '" + function_name + "': " + detail;
}

std::string FormatCompletedOperations(const std::vector<OperationType>& completed_operations) {
  std::vector<std::string> names;
  names.reserve(completed_operations.size());
  for (const auto type : completed_operations) {
    names.emplace_back(OperationTypeToString(type));
  }
  return "Completed operations: " + (names.empty() ? std::string("none") : VectorToString(names, ", "));
}

}  // namespace

ValidationException::ValidationException(std::vector<std::string> violations)
    : InvalidInputException(FormatViolations(violations)), violations_(std::move(violations)) {}

std::string FaultKindToString(const FaultKind kind) {
  return std::string(magic_enum::enum_name(kind).substr(kConstPrefix.size()));
}

DeploymentException::DeploymentException(const FaultKind kind, const std::string& operation,
                                         const std::string& function_name, const ServiceErrorType service_error_type,
                                         const std::string& message)
    : std::runtime_error(FormatFault(kind, operation, function_name, message)),
      kind_(kind),
      cause_kind_(kind),
      operation_(operation),
      function_name_(function_name),
      service_error_type_(service_error_type),
      detail_(message) {}

DeploymentException::DeploymentException(const DeploymentException& cause,
                                         std::vector<OperationType> completed_operations,
                                         const std::string& function_arn)
    : std::runtime_error(FormatFault(FaultKind::kPartialSuccess, cause.GetOperation(), cause.GetFunctionName(),
                                     FaultKindToString(cause.GetKind()) + ": " + cause.GetDetail()) +
                         ". " + FormatCompletedOperations(completed_operations) +
                         (function_arn.empty() ? "" : ". Function ARN: " + function_arn)),
      kind_(FaultKind::kPartialSuccess),
      cause_kind_(cause.GetKind()),
      operation_(cause.GetOperation()),
      function_name_(cause.GetFunctionName()),
      service_error_type_(cause.GetServiceErrorType()),
      detail_(cause.GetDetail()),
      completed_operations_(std::move(completed_operations)),
      function_arn_(function_arn) {}

}  // namespace stratus
