#pragma once

#include <ctime>
#include <memory>
#include <optional>
#include <string>

#include "deployment/code_source.hpp"
#include "function/function_config.hpp"
#include "storage/backend/object_store.hpp"

namespace stratus {

enum class PackagingMode { kDirect, kObjectStore };

struct ArtifactRequest {
  FunctionIdentity identity;
  // Path to a ready-made zip package.
  std::string code_artifact;
  std::optional<std::string> s3_bucket;
  std::optional<std::string> s3_key;
  bool dry_run = false;

  PackagingMode GetPackagingMode() const {
    return s3_bucket ? PackagingMode::kObjectStore : PackagingMode::kDirect;
  }
};

/**
 * @return the base64-encoded SHA-256 digest of @param bytes, the format the service reports as CodeSha256.
 */
std::string ComputeCodeSha256(const std::string& bytes);

/**
 * @return an object key of the form "<function name>/<UTC timestamp>-<digest prefix>.zip". Characters of the name
 * that are not safe in keys are replaced.
 */
std::string GenerateObjectKey(const std::string& function_name, const std::time_t time_in_seconds,
                              const std::string& hex_digest);

/**
 * The ArtifactLocator turns a zip package on disk into a CodeSource. In direct mode the package is passed inline and
 * must not exceed the synchronous upload limit. In object-store mode the package is uploaded to the bucket first; a
 * missing bucket is provisioned instead of failing the run. Dry runs read and hash the package but upload nothing.
 */
class ArtifactLocator {
 public:
  // @param object_store may be nullptr if only direct packaging is used.
  explicit ArtifactLocator(std::shared_ptr<ObjectStore> object_store);

  CodeSource Locate(const ArtifactRequest& request) const;

 private:
  void EnsureBucket(const ArtifactRequest& request) const;

  std::shared_ptr<ObjectStore> object_store_;
};

}  // namespace stratus
