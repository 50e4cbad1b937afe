#include "mock_object_store.hpp"

namespace stratus {

ObjectStoreError MockObjectStore::HeadBucket(const std::string& bucket) {
  const std::lock_guard<std::mutex> lock(mutex_);
  calls_.emplace_back("HeadBucket");
  if (auto error = TakeNextError("HeadBucket")) {
    return *error;
  }
  if (!buckets_.contains(bucket)) {
    return ObjectStoreError(ObjectStoreErrorType::kNotFound, "Bucket " + bucket + " does not exist.");
  }
  return ObjectStoreError::Success();
}

ObjectStoreError MockObjectStore::CreateBucket(const std::string& bucket) {
  const std::lock_guard<std::mutex> lock(mutex_);
  calls_.emplace_back("CreateBucket");
  if (auto error = TakeNextError("CreateBucket")) {
    return *error;
  }
  if (!buckets_.insert(bucket).second) {
    return ObjectStoreError(ObjectStoreErrorType::kAlreadyExist, "Bucket " + bucket + " already exists.");
  }
  return ObjectStoreError::Success();
}

ObjectStoreError MockObjectStore::PutObject(const std::string& bucket, const std::string& key,
                                       const std::shared_ptr<const std::string>& object) {
  const std::lock_guard<std::mutex> lock(mutex_);
  calls_.emplace_back("PutObject");
  if (auto error = TakeNextError("PutObject")) {
    return *error;
  }
  if (!buckets_.contains(bucket)) {
    return ObjectStoreError(ObjectStoreErrorType::kNotFound, "Bucket " + bucket + " does not exist.");
  }
  objects_[bucket + "/" + key] = object;
  return ObjectStoreError::Success();
}

void MockObjectStore::AddBucket(const std::string& bucket) {
  const std::lock_guard<std::mutex> lock(mutex_);
  buckets_.insert(bucket);
}

void MockObjectStore::SetNextError(const std::string& method, const ObjectStoreError& error) {
  const std::lock_guard<std::mutex> lock(mutex_);
  next_errors_.insert_or_assign(method, error);
}

std::shared_ptr<const std::string> MockObjectStore::GetObject(const std::string& bucket,
                                                              const std::string& key) const {
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto it = objects_.find(bucket + "/" + key);
  return it == objects_.cend() ? nullptr : it->second;
}

std::vector<std::string> MockObjectStore::GetCalls() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::optional<ObjectStoreError> MockObjectStore::TakeNextError(const std::string& method) {
  const auto it = next_errors_.find(method);
  if (it == next_errors_.cend()) {
    return std::nullopt;
  }
  const ObjectStoreError error = it->second;
  next_errors_.erase(it);
  return error;
}

}  // namespace stratus
