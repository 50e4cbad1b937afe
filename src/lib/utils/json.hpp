#pragma once

#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include <aws/core/utils/json/JsonSerializer.h>

namespace stratus {

/**
 * @return true if @param view is a JSON array whose elements are all strings.
 */
inline bool IsJsonStringArray(const Aws::Utils::Json::JsonView& view) {
  if (!view.IsListType()) {
    return false;
  }
  const auto array = view.AsArray();
  for (size_t i = 0; i < array.GetLength(); ++i) {
    if (!array[i].IsString()) {
      return false;
    }
  }
  return true;
}

/**
 * @return true if @param view is a JSON object whose values are all strings.
 */
inline bool IsJsonStringObject(const Aws::Utils::Json::JsonView& view) {
  if (!view.IsObject()) {
    return false;
  }
  for (const auto& [key, value] : view.GetAllObjects()) {
    if (!value.IsString()) {
      return false;
    }
  }
  return true;
}

template <typename T>
std::vector<T> JsonArrayToVector(const Aws::Utils::Array<Aws::Utils::Json::JsonView>& array) {
  // NOLINTNEXTLINE(cppcoreguidelines-init-variables)
  std::vector<T> result;
  result.reserve(array.GetLength());
  for (size_t i = 0; i < array.GetLength(); ++i) {
    if constexpr (std::is_same_v<T, std::string>) {
      result.emplace_back(array[i].AsString());
    } else {
      static_assert(std::is_integral_v<T>, "Unsupported element type.");
      result.emplace_back(static_cast<T>(array[i].AsInt64()));
    }
  }

  return result;
}

inline std::map<std::string, std::string> JsonObjectToStringMap(const Aws::Utils::Json::JsonView& view) {
  std::map<std::string, std::string> result;
  for (const auto& [key, value] : view.GetAllObjects()) {
    result.emplace(key, value.AsString());
  }
  return result;
}

}  // namespace stratus
