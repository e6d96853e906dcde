#pragma once

#include <filesystem>
#include <string>

struct archive;

// Extracts any archive format/filter libarchive understands into output_dir.
// Entries escaping output_dir are rejected. Throws VpkgException(Structural).
void extract_archive(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir);

// libarchive's last error message for a, or an empty string when it has none.
std::string archive_error_text(struct archive* a);
