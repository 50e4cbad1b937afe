#pragma once

#include <string>

namespace stratus {

enum class ServiceErrorType {
  kNoError = 0,
  kNotFound,
  kConflict,
  kThrottled,
  kInvalidInput,
  kFault
};

/**
 * The outcome of a call against the function service. kConflict is reserved for a stale revision id; all other
 * service-side rejections map to the remaining types.
 */
class ServiceError {
 public:
  static ServiceError Success() { return ServiceError(ServiceErrorType::kNoError); }

  explicit ServiceError(ServiceErrorType type) : type_(type) {}
  ServiceError(ServiceErrorType type, std::string message) : type_(type), message_(std::move(message)) {}

  [[nodiscard]] ServiceErrorType GetType() const { return type_; }
  [[nodiscard]] const std::string& GetMessage() const { return message_; }

  bool IsError() const { return type_ != ServiceErrorType::kNoError; }
  explicit operator bool() const { return IsError(); }

  // Throttling and service-side faults may disappear on their own. Only idempotent reads act on this.
  bool IsTransient() const { return type_ == ServiceErrorType::kThrottled || type_ == ServiceErrorType::kFault; }

 private:
  ServiceErrorType type_;
  std::string message_;
};

}  // namespace stratus
