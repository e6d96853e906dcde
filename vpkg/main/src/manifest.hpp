#pragma once

#include <filesystem>
#include <map>
#include <string>

inline constexpr const char* MANIFEST_FILE = "manifest.json";

struct Manifest {
    std::string version;
    std::string channel;
    // Relative path -> expected SHA256 (hex)
    std::map<std::string, std::string> checksums;
};

// Parses manifest.json. A missing or malformed manifest throws VpkgException(Structural).
Manifest load_manifest(const std::filesystem::path& manifest_path);

// Recomputes the checksum of every listed file present under root. Listed files absent
// from root are skipped. Throws VpkgException(Integrity) on the first mismatch.
// Returns the number of files verified.
std::size_t verify_manifest(const Manifest& manifest, const std::filesystem::path& root);
