#pragma once

#include <memory>
#include <string>
#include <utility>


namespace stratus {

enum class ObjectStoreErrorType {
  kNoError = 0,
  kNotFound,
  kAlreadyExist,
  kPermissionDenied,
  kInvalidArgument,
  kTemporary,
  kIOError,
  kInternalError,
  kUnknown
};

/**
 * The outcome of a bucket or object request. A default success carries no message.
 */
class ObjectStoreError {
 public:
  static ObjectStoreError Success() { return ObjectStoreError(ObjectStoreErrorType::kNoError); }

  explicit ObjectStoreError(ObjectStoreErrorType type) : type_(type) {}
  ObjectStoreError(ObjectStoreErrorType type, std::string message) : type_(type), message_(std::move(message)) {}

  [[nodiscard]] ObjectStoreErrorType GetType() const { return type_; }
  [[nodiscard]] const std::string& GetMessage() const { return message_; }

  explicit operator bool() const { return type_ != ObjectStoreErrorType::kNoError; }

 private:
  ObjectStoreErrorType type_;
  std::string message_;
};

/**
 * ObjectStore is the minimal bucket/object interface needed to stage large code packages. The functions are safe to
 * call from a thread other than the one that created the store.
 */
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // Returns kNotFound if the bucket does not exist.
  virtual ObjectStoreError HeadBucket(const std::string& bucket) = 0;

  // Returns kAlreadyExist if the bucket was created concurrently.
  virtual ObjectStoreError CreateBucket(const std::string& bucket) = 0;

  virtual ObjectStoreError PutObject(const std::string& bucket, const std::string& key,
                                 const std::shared_ptr<const std::string>& object) = 0;
};

}  // namespace stratus
