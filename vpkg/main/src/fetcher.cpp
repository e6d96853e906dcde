#include "fetcher.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

std::uintmax_t size_field(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_number_unsigned()) ? it->get<std::uintmax_t>() : 0;
}

VersionInfo parse_version_info(const json& j) {
    VersionInfo info;
    info.version = string_field(j, "version");
    info.channel = string_field(j, "channel");
    info.release_date = string_field(j, "release_date");
    info.size_bytes = size_field(j, "size_bytes");
    return info;
}

json parse_body(const HttpResponse& response, const std::string& url) {
    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw VpkgException(ErrorKind::Network, string_format("error.bad_server_response", url));
    }
    return body;
}

void remove_staged(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        log_warning(string_format("warning.remove_file_failed", path.string(), ec.message()));
    }
}

} // anonymous namespace

PackageFetcher::PackageFetcher(const VersionStore& store, const AgentConfig& config)
    : store_(store), config_(config) {}

std::string PackageFetcher::resolve_url(const std::string& server_url, const std::string& url) const {
    if (url.find("://") != std::string::npos) {
        return url;
    }
    return strip_trailing_slash(server_url) + (url.starts_with('/') ? "" : "/") + url;
}

PackageInfo PackageFetcher::fetch_metadata(const std::string& version, const std::string& server_url) const {
    const std::string url = strip_trailing_slash(server_url) + "/api/v1/package/" + url_encode(version);
    log_info(string_format("info.fetching_metadata", version, url));

    HttpResponse response = http_get(url, config_.request_timeout_seconds);
    if (response.status == 404) {
        throw VpkgException(ErrorKind::NotFound, string_format("error.version_not_on_server", version));
    }
    if (!response.ok()) {
        throw VpkgException(ErrorKind::Network, string_format("error.http_status", url, response.status));
    }

    const json body = parse_body(response, url);
    PackageInfo info;
    info.version = string_field(body, "version");
    info.download_url = string_field(body, "download_url");
    info.checksum = string_field(body, "checksum");
    info.channel = string_field(body, "channel");
    info.release_date = string_field(body, "release_date");
    info.size_bytes = size_field(body, "size_bytes");
    if (info.version.empty()) info.version = version;

    if (info.download_url.empty()) {
        throw VpkgException(ErrorKind::NotFound, string_format("error.no_download_url", version));
    }
    info.download_url = resolve_url(server_url, info.download_url);
    return info;
}

std::optional<fs::path> PackageFetcher::download(const std::string& version, const std::string& server_url) const {
    if (!is_valid_version_name(version)) {
        log_error(string_format("error.invalid_version_name", version));
        return std::nullopt;
    }

    PackageInfo info;
    try {
        info = fetch_metadata(version, server_url);
        ensure_dir_exists(store_.layout().downloads_dir);
    } catch (const VpkgException& e) {
        log_error(string_format("error.download_failed_kind", version, error_kind_name(e.kind()), e.what()));
        return std::nullopt;
    }

    const fs::path staged = store_.layout().staged_package(config_.product, version);
    log_info(string_format("info.downloading_from", info.download_url, staged.string()));

    try {
        download_file(info.download_url, staged, config_.download_timeout_seconds);
    } catch (const VpkgException& e) {
        log_error(string_format("error.download_failed_kind", version, error_kind_name(e.kind()), e.what()));
        remove_staged(staged);
        return std::nullopt;
    }

    try {
        const std::string actual = calculate_sha256(staged);
        if (!checksum_matches(actual, info.checksum)) {
            log_error(string_format("error.hash_mismatch", version, info.checksum, actual));
            remove_staged(staged);
            return std::nullopt;
        }
    } catch (const VpkgException& e) {
        log_error(string_format("error.download_failed_kind", version, error_kind_name(e.kind()), e.what()));
        remove_staged(staged);
        return std::nullopt;
    }

    log_info(string_format("info.checksum_verified", version));
    return staged;
}

std::optional<UpdateInfo> PackageFetcher::check_for_updates(const std::string& server_url, const std::string& channel) const {
    const std::string current = store_.current_version().value_or("0.0.0");
    const std::string url = strip_trailing_slash(server_url) + "/api/v1/updates?current_version=" + url_encode(current)
        + "&channel=" + url_encode(channel);
    log_info(string_format("info.checking_updates", url));

    try {
        HttpResponse response = http_get(url, config_.request_timeout_seconds);
        if (!response.ok()) {
            throw VpkgException(ErrorKind::Network, string_format("error.http_status", url, response.status));
        }
        const json body = parse_body(response, url);

        UpdateInfo info;
        auto available = body.find("update_available");
        info.update_available = available != body.end() && available->is_boolean() && available->get<bool>();
        info.message = string_field(body, "message");
        if (auto latest = body.find("latest_version"); latest != body.end() && latest->is_object()) {
            info.latest = parse_version_info(*latest);
        }
        return info;
    } catch (const VpkgException& e) {
        log_error(string_format("error.check_updates_failed", e.what()));
        return std::nullopt;
    }
}

std::vector<VersionInfo> PackageFetcher::list_available_versions(const std::string& server_url, const std::string& channel) const {
    const std::string url = strip_trailing_slash(server_url) + "/api/v1/versions?channel=" + url_encode(channel);

    std::vector<VersionInfo> versions;
    try {
        HttpResponse response = http_get(url, config_.request_timeout_seconds);
        if (!response.ok()) {
            throw VpkgException(ErrorKind::Network, string_format("error.http_status", url, response.status));
        }
        const json body = parse_body(response, url);
        auto list = body.find("versions");
        if (list == body.end() || !list->is_array()) {
            return versions;
        }

        const auto installed = store_.installed_versions();
        const auto current = store_.current_version();
        for (const auto& entry : *list) {
            if (!entry.is_object()) continue;
            VersionInfo info = parse_version_info(entry);
            info.is_installed = std::find(installed.begin(), installed.end(), info.version) != installed.end();
            info.is_current = current == info.version;
            versions.push_back(std::move(info));
        }
    } catch (const VpkgException& e) {
        log_error(string_format("error.list_versions_failed", e.what()));
        versions.clear();
    }
    return versions;
}

std::optional<std::string> PackageFetcher::get_changelog(const std::string& version, const std::string& server_url) const {
    const std::string url = strip_trailing_slash(server_url) + "/api/v1/changelog/" + url_encode(version);
    try {
        HttpResponse response = http_get(url, config_.request_timeout_seconds);
        if (!response.ok()) {
            throw VpkgException(ErrorKind::Network, string_format("error.http_status", url, response.status));
        }
        return response.body;
    } catch (const VpkgException& e) {
        log_error(string_format("error.changelog_failed", version, e.what()));
        return std::nullopt;
    }
}
