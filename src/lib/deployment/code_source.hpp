#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace stratus {

/**
 * A zip package that is passed to the service within the request.
 */
struct InlineCode {
  std::shared_ptr<const std::string> bytes;
  // Base64-encoded SHA-256 digest of bytes, in the format the service reports as CodeSha256.
  std::string sha256;
};

/**
 * A zip package that was uploaded to an S3 bucket beforehand.
 */
struct ObjectStoreCode {
  std::string bucket;
  std::string key;
  std::optional<std::string> sha256;
};

/**
 * Exactly one delivery mechanism is active per deployment.
 */
using CodeSource = std::variant<InlineCode, ObjectStoreCode>;

/**
 * @return the digest of the package, if it is known. Without a digest, code cannot be diffed against the remote.
 */
std::optional<std::string> GetCodeSha256(const CodeSource& code_source);

/**
 * @return a short human-readable description, e.g., "inline package (1024 bytes)" or "s3://bucket/key".
 */
std::string DescribeCodeSource(const CodeSource& code_source);

}  // namespace stratus
