#include "update_agent.hpp"
#include "localization.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::unique_ptr<HealthProbe> default_probe(std::unique_ptr<HealthProbe> probe, const AgentConfig& config) {
    if (probe) return probe;
    return std::make_unique<HttpHealthProbe>(config.health_url, config.health_timeout_seconds);
}

} // anonymous namespace

UpdateAgent::UpdateAgent(const Layout& layout, AgentConfig config, std::unique_ptr<HealthProbe> probe)
    : config_(std::move(config)),
      store_(layout, config_.pointer_mode, config_.version_order),
      hooks_(config_.required_hooks),
      probe_(default_probe(std::move(probe), config_)),
      fetcher_(store_, config_),
      installer_(store_, hooks_, config_.python),
      activation_(store_, hooks_, *probe_, config_.health_grace),
      retention_(store_, config_.product) {}

bool UpdateAgent::update_to(const std::string& version) {
    log_info(string_format("info.update_started", version));

    if (!store_.is_installed(version)) {
        log_info(string_format("info.downloading_version", version));
        const auto package_path = fetcher_.download(version, config_.update_server);
        if (!package_path) {
            log_error(string_format("error.update_download_failed", version));
            return false;
        }

        if (!installer_.install(*package_path, version)) {
            log_error(string_format("error.update_install_failed", version));
            return false;
        }
    }

    if (!activation_.activate(version)) {
        log_error(string_format("error.update_activate_failed", version));
        return false;
    }

    log_info(string_format("info.update_complete", version));
    retention_.cleanup(config_.keep_previous_versions);
    return true;
}

AgentStatus UpdateAgent::status() const {
    AgentStatus status;
    status.current_version = store_.current_version();
    status.installed_count = store_.installed_versions().size();
    status.state = activation_.state();
    status.auto_update = config_.auto_update;
    status.check_interval_hours = config_.check_interval_hours;
    if (config_.auto_update) {
        status.update_checked = true;
        status.update = fetcher_.check_for_updates(config_.update_server, config_.channel);
    }
    return status;
}

std::uint64_t UpdateAgent::start_update(const std::string& version) {
    return tasks_.start(string_format("info.task_update", version), [this, version]() {
        return update_to(version);
    });
}

std::uint64_t UpdateAgent::start_rollback() {
    return tasks_.start(get_string("info.task_rollback"), [this]() {
        return activation_.rollback_previous();
    });
}
