#include "filesystem.hpp"

#include <fstream>

#include "assert.hpp"

namespace stratus {

std::string ReadFileToString(const std::string& filename, const size_t max_size_bytes) {
  std::ifstream in_stream(filename.c_str(), std::ios::in | std::ios::binary);

  if (!in_stream) {
    FailInput("'" + filename + "' could not be opened.");
  }

  std::string content;

  in_stream.seekg(0, std::ios::end);

  const size_t file_size = in_stream.tellg();

  if (file_size > max_size_bytes) {
    FailInput("'" + filename + "' is larger than " + std::to_string(max_size_bytes) + " bytes.");
  }

  if (file_size > 0) {
    content.resize(file_size);
    in_stream.seekg(0, std::ios::beg);
    in_stream.read(&content.front(), static_cast<int64_t>(content.size()));
  }

  in_stream.close();

  return content;
}

void AppendStringToFile(const std::string& content, const std::string& filename) {
  std::ofstream out_stream(filename.c_str(), std::ios::out | std::ios::app);

  if (!out_stream) {
    Fail(filename + " could not be opened.");
  }

  out_stream << content;
  out_stream.close();
}

}  // namespace stratus
