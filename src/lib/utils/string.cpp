/**
 * Taken and modified from our sister project Hyrise (https://github.com/hyrise/hyrise)
 */

#include "string.hpp"

#include <cctype>

namespace stratus {

std::string TrimSourceFilePath(const std::string& file_path) {
  const auto src_position = file_path.find("/src/");

  return src_position == std::string::npos ? file_path : file_path.substr(src_position + 1);
}

std::string ToLowerCase(const std::string& input_string) {
  std::string output_string;
  output_string.resize(input_string.size());
  std::transform(input_string.begin(), input_string.end(), output_string.begin(),
                 [](unsigned char input_string_character) { return std::tolower(input_string_character); });
  return output_string;
}

std::string SanitizeForObjectKey(const std::string& input_string) {
  std::string output_string = input_string;
  std::replace_if(
      output_string.begin(), output_string.end(),
      [](unsigned char character) { return !std::isalnum(character) && character != '-' && character != '_'; }, '-');
  return output_string;
}

}  // namespace stratus
