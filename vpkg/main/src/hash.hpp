#pragma once

#include <filesystem>
#include <string>
#include <string_view>

// Calculates the SHA256 hash of a file as a lowercase hex digest.
// Throws VpkgException if the file cannot be opened.
std::string calculate_sha256(const std::filesystem::path& file_path);

// Exact comparison of a computed lowercase digest with the expected lowercase hex digest.
// An empty expected value never matches.
bool checksum_matches(std::string_view actual, std::string_view expected);
