/**
 * Taken and modified from our sister project Hyrise (https://github.com/hyrise/hyrise)
 */
#pragma once

#include <algorithm>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace stratus {

/**
 * Crops @param file_path to ensure readable Assert messages.
 * E.g., "/long/path/1234/src/lib/file.cpp" becomes "src/lib/file.cpp"
 */
std::string TrimSourceFilePath(const std::string& file_path);

/**
 * Converts @param vector to a string using @param delimiter.
 */
template <typename T>
std::string VectorToString(const std::vector<T>& vector, const std::string& delimiter) {
  std::ostringstream string_stream;

  if (!vector.empty()) {
    std::copy(vector.cbegin(), vector.cend() - 1, std::ostream_iterator<T>(string_stream, delimiter.c_str()));

    string_stream << vector.back();
  }

  return string_stream.str();
}

/**
 * @return The passed string in lowercase characters.
 */
std::string ToLowerCase(const std::string& input_string);

/**
 * Replaces every character of @param input_string that is not alphanumeric, '-' or '_' with '-'. Used to derive
 * object keys from user-supplied names.
 */
std::string SanitizeForObjectKey(const std::string& input_string);

}  // namespace stratus
