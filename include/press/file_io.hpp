#pragma once
#include <string>

namespace press {

// Reads a whole file as bytes. Throws IoError.
std::string read_file_bytes(const std::string& path);

// Writes bytes to path, creating parent directories. Throws IoError.
void write_file_bytes(const std::string& path, const std::string& content);

// Copies a file, creating the destination's parent directories. Throws IoError.
void copy_file_over(const std::string& from, const std::string& to);

} // namespace press
