#pragma once
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
// Streams the file through SHA-256. Empty string and ec set on read failure.
std::string sha256_file_hex(const std::filesystem::path& path, std::error_code& ec);
