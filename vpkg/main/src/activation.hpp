#pragma once

#include "health.hpp"
#include "hook.hpp"
#include "version_store.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>

enum class ActivationState {
    Idle,
    Activating,
    Active,
    RollingBack,
    RolledBack,
    Failed
};

const char* activation_state_name(ActivationState state);

// Switches CurrentPointer between installed versions, verifies the service afterwards
// and falls back to the previously current version when the health probe fails.
class ActivationController {
public:
    ActivationController(const VersionStore& store, const HookRunner& hooks, HealthProbe& probe, std::chrono::milliseconds grace_period);

    // Makes version current. Returns true only if the health probe passed afterwards.
    bool activate(const std::string& version);

    // Runs the rollback hook of version, then activates it through the same pipeline.
    bool rollback_to(const std::string& version);

    // Rolls back to the newest installed version that is not current.
    bool rollback_previous();

    // State reached by the most recent attempt.
    ActivationState state() const { return state_.load(); }

private:
    bool activate_locked(const std::string& version, bool allow_rollback);
    bool rollback_locked(const std::string& version, bool allow_rollback);
    void swap_pointer(const std::string& version);
    void run_migrations(const std::filesystem::path& version_dir);

    const VersionStore& store_;
    const HookRunner& hooks_;
    HealthProbe& probe_;
    std::chrono::milliseconds grace_period_;
    std::atomic<ActivationState> state_{ActivationState::Idle};
};
