#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

struct PackOptions {
    std::string version;
    std::string channel = "stable";
    // When false the source tree is archived as-is, manifest or not.
    bool generate_manifest = true;
};

struct PackResult {
    std::string sha256;
    std::uintmax_t size_bytes = 0;
    std::size_t file_count = 0;
};

// Builds a gzip-compressed tar package from source_dir. With generate_manifest the
// archive root gains a manifest.json holding the SHA256 of every other regular file.
PackResult pack_package(const std::filesystem::path& source_dir, const std::filesystem::path& output_file, const PackOptions& options);
