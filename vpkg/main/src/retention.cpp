#include "retention.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>

namespace fs = std::filesystem;

RetentionManager::RetentionManager(const VersionStore& store, std::string product)
    : store_(store), product_(std::move(product)) {}

std::vector<std::string> RetentionManager::cleanup(int keep_count) {
    std::vector<std::string> removed;
    if (keep_count < 0) keep_count = 0;

    try {
        InstallLock lock(store_.layout().lock_file);

        std::vector<std::string> candidates = store_.installed_versions();
        if (const auto current = store_.current_version()) {
            std::erase(candidates, *current);
        }

        if (candidates.size() <= static_cast<size_t>(keep_count)) {
            log_info(string_format("info.nothing_to_clean", candidates.size(), keep_count));
            return removed;
        }

        for (auto it = candidates.begin() + keep_count; it != candidates.end(); ++it) {
            const fs::path version_dir = store_.version_dir(*it);
            log_info(string_format("info.removing_old_version", *it));
            std::error_code ec;
            fs::remove_all(version_dir, ec);
            if (ec) {
                log_warning(string_format("warning.remove_version_failed", *it, ec.message()));
                continue;
            }
            remove_staged_package(*it);
            removed.push_back(*it);
        }
    } catch (const VpkgException& e) {
        log_error(string_format("error.cleanup_failed", e.what()));
    }
    return removed;
}

void RetentionManager::remove_staged_package(const std::string& version) {
    const fs::path staged = store_.layout().staged_package(product_, version);
    std::error_code ec;
    if (fs::remove(staged, ec)) {
        log_info(string_format("info.removed_staged_package", staged.string()));
    } else if (ec) {
        log_warning(string_format("warning.remove_file_failed", staged.string(), ec.message()));
    }
}
