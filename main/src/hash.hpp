#pragma once

#include <string>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

// Calculates the SHA256 hash of a file.
// Throws PofillException if the file cannot be opened.
std::string calculate_sha256(const fs::path& file_path);

// Calculates the SHA256 hash of an in-memory buffer.
std::string calculate_sha256_of(std::string_view data);
