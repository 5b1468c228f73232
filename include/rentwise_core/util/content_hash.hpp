#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace rentwise_core {

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(std::string_view data);

// Lowercase hex SHA-256 of a file's contents. Throws std::runtime_error if
// the file cannot be read.
std::string sha256_file_hex(const std::filesystem::path &file_path);

}  // namespace rentwise_core
