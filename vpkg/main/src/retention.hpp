#pragma once

#include "version_store.hpp"

#include <string>
#include <vector>

// Prunes installed versions beyond the retention count. The current version is never removed.
class RetentionManager {
public:
    explicit RetentionManager(const VersionStore& store, std::string product = "app");

    // Keeps the keep_count newest non-current versions and removes the rest, together with
    // their staged downloads. A failed removal is logged and skipped. Returns the removed versions.
    std::vector<std::string> cleanup(int keep_count);

private:
    void remove_staged_package(const std::string& version);

    const VersionStore& store_;
    std::string product_;
};
