#include "manifest.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

Manifest load_manifest(const fs::path& manifest_path) {
    std::error_code ec;
    if (!fs::is_regular_file(manifest_path, ec)) {
        throw VpkgException(ErrorKind::Structural, string_format("error.manifest_missing", manifest_path.string()));
    }

    json j;
    try {
        j = json::parse(read_text_file(manifest_path));
    } catch (const json::parse_error& e) {
        throw VpkgException(ErrorKind::Structural, string_format("error.manifest_invalid", manifest_path.string(), e.what()));
    } catch (const VpkgException& e) {
        throw VpkgException(ErrorKind::Structural, e.what());
    }
    if (!j.is_object()) {
        throw VpkgException(ErrorKind::Structural, string_format("error.manifest_invalid", manifest_path.string(), "not an object"));
    }

    Manifest manifest;
    if (auto it = j.find("version"); it != j.end() && it->is_string()) manifest.version = it->get<std::string>();
    if (auto it = j.find("channel"); it != j.end() && it->is_string()) manifest.channel = it->get<std::string>();

    auto checksums = j.find("checksums");
    if (checksums == j.end() || checksums->is_null()) {
        return manifest;
    }
    if (!checksums->is_object()) {
        throw VpkgException(ErrorKind::Structural, string_format("error.manifest_invalid", manifest_path.string(), "checksums is not an object"));
    }
    for (const auto& [path, digest] : checksums->items()) {
        if (!digest.is_string()) {
            throw VpkgException(ErrorKind::Structural, string_format("error.manifest_invalid", manifest_path.string(), "checksum for " + path + " is not a string"));
        }
        manifest.checksums.emplace(path, digest.get<std::string>());
    }
    return manifest;
}

std::size_t verify_manifest(const Manifest& manifest, const fs::path& root) {
    if (manifest.checksums.empty()) {
        return 0;
    }
    log_info(get_string("info.verifying_checksums"));

    std::size_t verified = 0;
    for (const auto& [rel_path, expected] : manifest.checksums) {
        const fs::path full_path = validate_path(rel_path, root);
        std::error_code ec;
        if (!fs::exists(full_path, ec)) {
            continue;
        }
        if (!fs::is_regular_file(full_path, ec) || !checksum_matches(calculate_sha256(full_path), expected)) {
            throw VpkgException(ErrorKind::Integrity, string_format("error.checksum_mismatch_file", rel_path));
        }
        ++verified;
    }
    log_info(string_format("info.checksums_verified", verified, manifest.checksums.size()));
    return verified;
}
