#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "deployment/deployment_plan.hpp"
#include "function/service_error.hpp"
#include "utils/assert.hpp"

namespace stratus {

/**
 * Raised before any remote call if the caller-supplied configuration is inconsistent. Carries every violated
 * constraint, not only the first one.
 */
class ValidationException : public InvalidInputException {
 public:
  explicit ValidationException(std::vector<std::string> violations);

  const std::vector<std::string>& GetViolations() const { return violations_; }

 private:
  std::vector<std::string> violations_;
};

enum class FaultKind { kConcurrencyConflict, kServiceFault, kTimeout, kPartialSuccess };

std::string FaultKindToString(const FaultKind kind);

/**
 * Raised when a deployment cannot be completed. A fault after at least one completed mutation is reported as
 * kPartialSuccess; GetCauseKind() then holds the fault that interrupted the plan.
 */
class DeploymentException : public std::runtime_error {
 public:
  DeploymentException(const FaultKind kind, const std::string& operation, const std::string& function_name,
                      const ServiceErrorType service_error_type, const std::string& message);

  /**
   * Wraps @param cause into a kPartialSuccess fault listing @param completed_operations. A non-empty
   * @param function_arn names the function the completed operations left behind.
   */
  DeploymentException(const DeploymentException& cause, std::vector<OperationType> completed_operations,
                      const std::string& function_arn = "");

  FaultKind GetKind() const { return kind_; }
  FaultKind GetCauseKind() const { return cause_kind_; }
  const std::string& GetOperation() const { return operation_; }
  const std::string& GetFunctionName() const { return function_name_; }
  ServiceErrorType GetServiceErrorType() const { return service_error_type_; }
  const std::string& GetDetail() const { return detail_; }
  const std::vector<OperationType>& GetCompletedOperations() const { return completed_operations_; }
  const std::string& GetFunctionArn() const { return function_arn_; }

 private:
  FaultKind kind_;
  FaultKind cause_kind_;
  std::string operation_;
  std::string function_name_;
  ServiceErrorType service_error_type_;
  std::string detail_;
  std::vector<OperationType> completed_operations_;
  std::string function_arn_;
};

}  // namespace stratus
