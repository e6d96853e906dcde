#pragma once

#include "config.hpp"
#include "version_store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Response of GET /api/v1/package/{version}
struct PackageInfo {
    std::string version;
    std::string download_url;
    std::string checksum;
    std::string channel;
    std::string release_date;
    std::uintmax_t size_bytes = 0;
};

// One entry of GET /api/v1/versions
struct VersionInfo {
    std::string version;
    std::string channel;
    std::string release_date;
    std::uintmax_t size_bytes = 0;
    bool is_installed = false;
    bool is_current = false;
};

// Response of GET /api/v1/updates
struct UpdateInfo {
    bool update_available = false;
    std::optional<VersionInfo> latest;
    std::string message;
};

// Client of the remote update server. Artifacts are staged under downloads/.
class PackageFetcher {
public:
    PackageFetcher(const VersionStore& store, const AgentConfig& config);

    // Throws VpkgException(Network) if the server cannot be reached or answers with an
    // error, VpkgException(NotFound) if the version is unknown to it.
    PackageInfo fetch_metadata(const std::string& version, const std::string& server_url) const;

    // Streams the artifact into downloads/ and verifies its SHA256 against the metadata.
    // Returns the staged path, or nullopt with no staged file left behind.
    std::optional<std::filesystem::path> download(const std::string& version, const std::string& server_url) const;

    std::optional<UpdateInfo> check_for_updates(const std::string& server_url, const std::string& channel) const;
    std::vector<VersionInfo> list_available_versions(const std::string& server_url, const std::string& channel) const;
    std::optional<std::string> get_changelog(const std::string& version, const std::string& server_url) const;

private:
    std::string resolve_url(const std::string& server_url, const std::string& url) const;

    const VersionStore& store_;
    const AgentConfig& config_;
};
