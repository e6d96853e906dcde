#pragma once

#include <chrono>
#include <filesystem>
#include <set>
#include <string>

// On-disk layout of one installation root.
struct Layout {
    std::filesystem::path base_dir;
    std::filesystem::path packages_dir;
    std::filesystem::path downloads_dir;
    std::filesystem::path current_link;
    std::filesystem::path lock_file;

    static Layout from_base(const std::filesystem::path& base_dir);

    std::filesystem::path version_dir(const std::string& version) const { return packages_dir / version; }
    std::filesystem::path staged_package(const std::string& product, const std::string& version) const {
        return downloads_dir / (product + "-" + version + ".pbpkg");
    }
};

// Creates packages/ and downloads/ if missing.
void init_filesystem(const Layout& layout);

enum class PointerMode {
    Symlink,
    File
};

enum class VersionOrder {
    Lexicographic,
    Semantic
};

struct AgentConfig {
    std::string update_server = "https://updates.cloudprintd.local";
    std::string channel = "stable";
    int keep_previous_versions = 2;
    bool auto_update = false;
    int check_interval_hours = 24;

    std::string health_url = "http://localhost:8000/api/v1/health";
    std::chrono::milliseconds health_grace{std::chrono::seconds(5)};
    long health_timeout_seconds = 5;
    long request_timeout_seconds = 10;
    long download_timeout_seconds = 300;

    std::string python = "python3";
    std::string product = "app";

    PointerMode pointer_mode = PointerMode::Symlink;
    VersionOrder version_order = VersionOrder::Lexicographic;
    std::set<std::string> required_hooks;
};

// Reads a flat JSON object; missing keys keep their defaults.
AgentConfig load_agent_config(const std::filesystem::path& path);
AgentConfig parse_agent_config(const std::string& json_text);
