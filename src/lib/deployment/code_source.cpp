#include "code_source.hpp"

#include <type_traits>

namespace stratus {

std::optional<std::string> GetCodeSha256(const CodeSource& code_source) {
  return std::visit(
      [](const auto& code) -> std::optional<std::string> {
        using T = std::decay_t<decltype(code)>;
        if constexpr (std::is_same_v<T, InlineCode>) {
          return code.sha256;
        } else {
          static_assert(std::is_same_v<T, ObjectStoreCode>, "Unhandled code source type.");
          return code.sha256;
        }
      },
      code_source);
}

std::string DescribeCodeSource(const CodeSource& code_source) {
  return std::visit(
      [](const auto& code) -> std::string {
        using T = std::decay_t<decltype(code)>;
        if constexpr (std::is_same_v<T, InlineCode>) {
          return "inline package (" + std::to_string(code.bytes ? code.bytes->size() : 0) + " bytes)";
        } else {
          static_assert(std::is_same_v<T, ObjectStoreCode>, "Unhandled code source type.");
          return "s3://" + code.bucket + "/" + code.key;
        }
      },
      code_source);
}

}  // namespace stratus
