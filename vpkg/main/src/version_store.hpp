#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Read-only view of the installed versions and the CurrentPointer.
class VersionStore {
public:
    VersionStore(Layout layout, PointerMode pointer_mode, VersionOrder order);

    // Version named by CurrentPointer, or nullopt if the pointer is absent,
    // unreadable or names something that is not an installed version.
    std::optional<std::string> current_version() const;

    // Installed version names, newest first. A missing packages/ yields an empty list.
    std::vector<std::string> installed_versions() const;

    bool is_installed(const std::string& version) const;
    std::filesystem::path version_dir(const std::string& version) const { return layout_.version_dir(version); }

    const Layout& layout() const { return layout_; }
    PointerMode pointer_mode() const { return pointer_mode_; }
    VersionOrder order() const { return order_; }

private:
    Layout layout_;
    PointerMode pointer_mode_;
    VersionOrder order_;
};

// A version name is usable as a directory name under packages/.
bool is_valid_version_name(const std::string& version);
