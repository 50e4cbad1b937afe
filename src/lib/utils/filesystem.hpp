#pragma once

#include <string>

namespace stratus {

// Read a file into a std::string; calls FailInput if the file is missing or larger than @param max_size_bytes
std::string ReadFileToString(const std::string& filename, const size_t max_size_bytes);

// Append a std::string to a file; calls Fail upon encountering an error
void AppendStringToFile(const std::string& content, const std::string& filename);

}  // namespace stratus
