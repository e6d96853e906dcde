#include "version_store.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <system_error>

namespace fs = std::filesystem;

bool is_valid_version_name(const std::string& version) {
    if (version.empty() || version == "." || version == ".." || version == "current") return false;
    if (version.front() == '.') return false;
    return version.find('/') == std::string::npos && version.find('\0') == std::string::npos;
}

VersionStore::VersionStore(Layout layout, PointerMode pointer_mode, VersionOrder order)
    : layout_(std::move(layout)), pointer_mode_(pointer_mode), order_(order) {}

std::optional<std::string> VersionStore::current_version() const {
    std::error_code ec;
    std::string name;

    if (fs::is_symlink(fs::symlink_status(layout_.current_link, ec))) {
        const fs::path target = fs::read_symlink(layout_.current_link, ec);
        if (ec) return std::nullopt;
        name = target.lexically_normal().filename().string();
        if (name.empty()) {
            name = target.lexically_normal().parent_path().filename().string();
        }
    } else if (pointer_mode_ == PointerMode::File && fs::is_regular_file(layout_.current_link, ec)) {
        try {
            name = trim(read_text_file(layout_.current_link));
        } catch (const VpkgException& e) {
            log_warning(string_format("warning.pointer_unreadable", layout_.current_link.string(), e.what()));
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    if (!is_valid_version_name(name) || !is_installed(name)) {
        return std::nullopt;
    }
    return name;
}

std::vector<std::string> VersionStore::installed_versions() const {
    std::vector<std::string> versions;
    std::error_code ec;
    if (!fs::is_directory(layout_.packages_dir, ec)) {
        return versions;
    }

    for (fs::directory_iterator it(layout_.packages_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) || !entry.is_directory(entry_ec)) continue;
        const std::string name = entry.path().filename().string();
        if (!is_valid_version_name(name)) continue;
        versions.push_back(name);
    }
    if (ec) {
        log_warning(string_format("warning.list_versions_failed", layout_.packages_dir.string(), ec.message()));
    }

    sort_versions_descending(versions, order_);
    return versions;
}

bool VersionStore::is_installed(const std::string& version) const {
    if (!is_valid_version_name(version)) return false;
    std::error_code ec;
    const fs::path dir = layout_.version_dir(version);
    return !fs::is_symlink(fs::symlink_status(dir, ec)) && fs::is_directory(dir, ec);
}
