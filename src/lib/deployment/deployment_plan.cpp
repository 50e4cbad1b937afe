#include "deployment_plan.hpp"

#include <type_traits>

#include <magic_enum/magic_enum.hpp>

#include "constants.hpp"
#include "utils/string.hpp"

namespace stratus {

std::string OperationTypeToString(const OperationType type) {
  return std::string(magic_enum::enum_name(type).substr(kConstPrefix.size()));
}

OperationType Operation::GetType() const {
  return std::visit(
      [](const auto& operation) {
        using T = std::decay_t<decltype(operation)>;
        if constexpr (std::is_same_v<T, CreateFunctionOperation>) {
          return OperationType::kCreateFunction;
        } else if constexpr (std::is_same_v<T, UpdateCodeOperation>) {
          return OperationType::kUpdateCode;
        } else if constexpr (std::is_same_v<T, UpdateConfigurationOperation>) {
          return OperationType::kUpdateConfiguration;
        } else if constexpr (std::is_same_v<T, PublishVersionOperation>) {
          return OperationType::kPublishVersion;
        } else {
          static_assert(std::is_same_v<T, NoOpOperation>, "Unhandled operation type.");
          return OperationType::kNoOp;
        }
      },
      payload);
}

bool Operation::IsMutating() const { return GetType() != OperationType::kNoOp; }

std::string Operation::Describe() const {
  const std::string details = std::visit(
      [](const auto& operation) -> std::string {
        using T = std::decay_t<decltype(operation)>;
        if constexpr (std::is_same_v<T, CreateFunctionOperation>) {
          return VectorToString(operation.config.SetFieldNames(), ", ") + "; " +
                 DescribeCodeSource(operation.code_source);
        } else if constexpr (std::is_same_v<T, UpdateCodeOperation>) {
          std::string description = DescribeCodeSource(operation.code_source);
          if (operation.architecture) {
            description += "; architecture " + *operation.architecture;
          }
          return description;
        } else if constexpr (std::is_same_v<T, UpdateConfigurationOperation>) {
          return VectorToString(operation.changes.SetFieldNames(), ", ");
        } else {
          static_assert(std::is_same_v<T, PublishVersionOperation> || std::is_same_v<T, NoOpOperation>,
                        "Unhandled operation type.");
          return "";
        }
      },
      payload);

  return (simulated ? "would " : "") + OperationTypeToString(GetType()) + (details.empty() ? "" : "(" + details + ")");
}

std::vector<OperationType> DeploymentPlan::GetOperationTypes() const {
  std::vector<OperationType> types;
  types.reserve(operations.size());
  for (const auto& operation : operations) {
    types.push_back(operation.GetType());
  }
  return types;
}

bool DeploymentPlan::IsNoOp() const {
  return operations.size() == 1 && operations.front().GetType() == OperationType::kNoOp;
}

}  // namespace stratus
