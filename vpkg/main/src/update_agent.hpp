#pragma once

#include "activation.hpp"
#include "config.hpp"
#include "fetcher.hpp"
#include "health.hpp"
#include "hook.hpp"
#include "installer.hpp"
#include "retention.hpp"
#include "task.hpp"
#include "version_store.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Snapshot reported by the status command. With auto_update enabled the
// server is asked whether a newer version exists.
struct AgentStatus {
    std::optional<std::string> current_version;
    std::size_t installed_count = 0;
    ActivationState state = ActivationState::Idle;
    bool auto_update = false;
    int check_interval_hours = 0;
    bool update_checked = false;
    std::optional<UpdateInfo> update;
};

// Wires the version management components for one installation root.
class UpdateAgent {
public:
    // A null probe selects the HTTP probe on config.health_url.
    UpdateAgent(const Layout& layout, AgentConfig config, std::unique_ptr<HealthProbe> probe = nullptr);

    // Download (unless already installed), install, activate, then apply the retention policy.
    bool update_to(const std::string& version);

    // Same pipeline as update_to, run as a background task.
    std::uint64_t start_update(const std::string& version);
    // Rollback to the newest non-current version as a background task.
    std::uint64_t start_rollback();

    AgentStatus status() const;

    const AgentConfig& config() const { return config_; }
    const VersionStore& store() const { return store_; }
    const PackageFetcher& fetcher() const { return fetcher_; }
    PackageInstaller& installer() { return installer_; }
    ActivationController& activation() { return activation_; }
    RetentionManager& retention() { return retention_; }
    TaskRunner& tasks() { return tasks_; }

private:
    AgentConfig config_;
    VersionStore store_;
    HookRunner hooks_;
    std::unique_ptr<HealthProbe> probe_;
    PackageFetcher fetcher_;
    PackageInstaller installer_;
    ActivationController activation_;
    RetentionManager retention_;
    TaskRunner tasks_;
};
