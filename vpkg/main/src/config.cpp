#include "config.hpp"

#include "exception.hpp"
#include "hook.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

Layout Layout::from_base(const fs::path& base_dir) {
    Layout layout;
    layout.base_dir = base_dir.lexically_normal();
    layout.packages_dir = layout.base_dir / "packages";
    layout.downloads_dir = layout.base_dir / "downloads";
    layout.current_link = layout.packages_dir / "current";
    layout.lock_file = layout.packages_dir / ".vpkg.lock";
    return layout;
}

void init_filesystem(const Layout& layout) {
    ensure_dir_exists(layout.packages_dir);
    ensure_dir_exists(layout.downloads_dir);
}

namespace {

template<typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw VpkgException(ErrorKind::Config, string_format("error.config_bad_value", key) + ": " + e.what());
    }
}

} // anonymous namespace

AgentConfig parse_agent_config(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw VpkgException(ErrorKind::Config, string_format("error.config_parse_failed", e.what()));
    }
    if (!j.is_object()) {
        throw VpkgException(ErrorKind::Config, string_format("error.config_parse_failed", "top level is not an object"));
    }

    AgentConfig config;
    read_key(j, "update_server", config.update_server);
    read_key(j, "channel", config.channel);
    read_key(j, "keep_previous_versions", config.keep_previous_versions);
    read_key(j, "auto_update", config.auto_update);
    read_key(j, "check_interval_hours", config.check_interval_hours);
    read_key(j, "health_url", config.health_url);
    read_key(j, "health_timeout_seconds", config.health_timeout_seconds);
    read_key(j, "request_timeout_seconds", config.request_timeout_seconds);
    read_key(j, "download_timeout_seconds", config.download_timeout_seconds);
    read_key(j, "python", config.python);
    read_key(j, "product", config.product);

    double grace_seconds = -1;
    read_key(j, "health_grace_seconds", grace_seconds);
    if (grace_seconds >= 0) {
        config.health_grace = std::chrono::milliseconds(static_cast<long long>(grace_seconds * 1000));
    }

    if (config.keep_previous_versions < 0) {
        throw VpkgException(ErrorKind::Config, string_format("error.config_bad_value", "keep_previous_versions"));
    }

    std::string pointer_mode;
    read_key(j, "pointer_mode", pointer_mode);
    if (pointer_mode == "file") {
        config.pointer_mode = PointerMode::File;
    } else if (!pointer_mode.empty() && pointer_mode != "symlink") {
        throw VpkgException(ErrorKind::Config, string_format("error.config_bad_value", "pointer_mode") + ": " + pointer_mode);
    }

    std::string version_order;
    read_key(j, "version_order", version_order);
    if (version_order == "semantic") {
        config.version_order = VersionOrder::Semantic;
    } else if (!version_order.empty() && version_order != "lexicographic") {
        throw VpkgException(ErrorKind::Config, string_format("error.config_bad_value", "version_order") + ": " + version_order);
    }

    std::vector<std::string> required_hooks;
    read_key(j, "required_hooks", required_hooks);
    for (const auto& name : required_hooks) {
        if (!hook_from_name(name)) {
            throw VpkgException(ErrorKind::Config, string_format("error.config_bad_value", "required_hooks") + ": " + name);
        }
        config.required_hooks.insert(name);
    }

    return config;
}

AgentConfig load_agent_config(const fs::path& path) {
    std::string text;
    try {
        text = read_text_file(path);
    } catch (const VpkgException& e) {
        throw VpkgException(ErrorKind::Config, e.what());
    }
    return parse_agent_config(text);
}
