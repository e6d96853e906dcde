#include "activation.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

const char* activation_state_name(ActivationState state) {
    switch (state) {
        case ActivationState::Idle: return "idle";
        case ActivationState::Activating: return "activating";
        case ActivationState::Active: return "active";
        case ActivationState::RollingBack: return "rolling-back";
        case ActivationState::RolledBack: return "rolled-back";
        case ActivationState::Failed: return "failed";
    }
    return "unknown";
}

ActivationController::ActivationController(const VersionStore& store, const HookRunner& hooks, HealthProbe& probe, std::chrono::milliseconds grace_period)
    : store_(store), hooks_(hooks), probe_(probe), grace_period_(grace_period) {}

bool ActivationController::activate(const std::string& version) {
    // An unknown version must not create packages/ or the lock file
    if (!store_.is_installed(version)) {
        log_error(string_format("error.not_installed", version));
        state_ = ActivationState::Failed;
        return false;
    }
    try {
        InstallLock lock(store_.layout().lock_file);
        return activate_locked(version, true);
    } catch (const VpkgException& e) {
        log_error(string_format("error.activation_failed", version, error_kind_name(e.kind()), e.what()));
    }
    state_ = ActivationState::Failed;
    return false;
}

bool ActivationController::rollback_to(const std::string& version) {
    if (!store_.is_installed(version)) {
        log_error(string_format("error.not_installed", version));
        state_ = ActivationState::Failed;
        return false;
    }
    try {
        InstallLock lock(store_.layout().lock_file);
        return rollback_locked(version, true);
    } catch (const VpkgException& e) {
        log_error(string_format("error.rollback_failed", version, e.what()));
    }
    state_ = ActivationState::Failed;
    return false;
}

bool ActivationController::rollback_previous() {
    try {
        InstallLock lock(store_.layout().lock_file);
        const auto current = store_.current_version();
        for (const auto& version : store_.installed_versions()) {
            if (version == current) continue;
            log_info(string_format("info.rolling_back_from_to", current.value_or(get_string("info.none")), version));
            return rollback_locked(version, true);
        }
        log_error(get_string("error.no_previous_version"));
    } catch (const VpkgException& e) {
        log_error(string_format("error.rollback_failed", get_string("info.previous_version"), e.what()));
    }
    state_ = ActivationState::Failed;
    return false;
}

bool ActivationController::rollback_locked(const std::string& version, bool allow_rollback) {
    log_warning(string_format("warning.rolling_back", version));
    if (!store_.is_installed(version)) {
        log_error(string_format("error.not_installed", version));
        state_ = ActivationState::Failed;
        return false;
    }

    try {
        hooks_.run_checked(store_.version_dir(version), Hook::Rollback);
    } catch (const VpkgException& e) {
        log_error(string_format("error.rollback_failed", version, e.what()));
        state_ = ActivationState::Failed;
        return false;
    }
    return activate_locked(version, allow_rollback);
}

bool ActivationController::activate_locked(const std::string& version, bool allow_rollback) {
    if (!store_.is_installed(version)) {
        log_error(string_format("error.not_installed", version));
        state_ = ActivationState::Failed;
        return false;
    }

    const fs::path version_dir = store_.version_dir(version);
    std::optional<std::string> rollback_target = store_.current_version();
    if (rollback_target == version) {
        rollback_target.reset();
    }

    state_ = ActivationState::Activating;
    log_info(string_format("info.activating_version", version));

    try {
        hooks_.run_checked(version_dir, Hook::PreUpgrade);
        swap_pointer(version);
    } catch (const VpkgException& e) {
        // CurrentPointer is unchanged at this point
        log_error(string_format("error.activation_failed", version, error_kind_name(e.kind()), e.what()));
        state_ = ActivationState::Failed;
        return false;
    }
    log_info(string_format("info.pointer_switched", version));

    bool healthy = false;
    try {
        run_migrations(version_dir);
        hooks_.run_checked(version_dir, Hook::PostUpgrade);

        log_info(string_format("info.waiting_for_service", grace_period_.count()));
        std::this_thread::sleep_for(grace_period_);
        healthy = probe_.healthy();
    } catch (const VpkgException& e) {
        log_error(string_format("error.activation_failed", version, error_kind_name(e.kind()), e.what()));
    } catch (const std::exception& e) {
        log_error(string_format("error.activation_failed", version, error_kind_name(ErrorKind::Io), e.what()));
    }

    if (healthy) {
        log_info(string_format("info.version_active", version));
        state_ = ActivationState::Active;
        return true;
    }

    log_error(string_format("error.health_check_failed", version));
    if (!allow_rollback || !rollback_target) {
        if (!rollback_target) {
            log_warning(string_format("warning.no_rollback_target", version));
        }
        state_ = ActivationState::Failed;
        return false;
    }

    state_ = ActivationState::RollingBack;
    const bool restored = rollback_locked(*rollback_target, false);
    state_ = restored ? ActivationState::RolledBack : ActivationState::Failed;
    if (!restored) {
        log_error(string_format("error.rollback_degraded", *rollback_target, store_.current_version().value_or(get_string("info.none"))));
    }
    return false;
}

void ActivationController::swap_pointer(const std::string& version) {
    const Layout& layout = store_.layout();

    if (store_.pointer_mode() == PointerMode::File) {
        write_file_atomic(layout.current_link, version + "\n");
    } else {
        const fs::path tmp_link = layout.packages_dir / ("current." + version + ".tmp");
        std::error_code ec;
        fs::remove(tmp_link, ec);
        // Target is relative to packages/
        if (symlink(version.c_str(), tmp_link.c_str()) != 0) {
            throw VpkgException(ErrorKind::Io, string_format("error.symlink_failed", tmp_link.string(), strerror(errno)));
        }
        if (rename(tmp_link.c_str(), layout.current_link.c_str()) != 0) {
            int err = errno;
            fs::remove(tmp_link, ec);
            throw VpkgException(ErrorKind::Io, string_format("error.rename_failed", tmp_link.string(), layout.current_link.string()) + ": " + strerror(err));
        }
    }

    int dir_fd = open(layout.packages_dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        fsync(dir_fd);
        close(dir_fd);
    }
}

void ActivationController::run_migrations(const fs::path& version_dir) {
    const fs::path migrations_dir = version_dir / "migrations";
    std::error_code ec;
    if (!fs::is_directory(migrations_dir, ec)) {
        return;
    }
    if (fs::is_regular_file(migrations_dir / "up.sql", ec)) {
        // No migration executor is wired in; the presence of up.sql is reported only
        log_info(string_format("info.migration_found", (migrations_dir / "up.sql").string()));
    }
}
