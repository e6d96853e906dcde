#pragma once

#include "hook.hpp"
#include "version_store.hpp"

#include <filesystem>
#include <string>

// Turns a staged package archive into an installed (not yet current) version directory.
class PackageInstaller {
public:
    PackageInstaller(const VersionStore& store, const HookRunner& hooks, std::string python = "python3");

    // Extracts, validates and provisions package_path as packages/<version>. An existing
    // directory for version is replaced. On any failure the version directory is removed
    // and false is returned.
    bool install(const std::filesystem::path& package_path, const std::string& version);

private:
    void run_steps(const std::filesystem::path& package_path, const std::string& version, const std::filesystem::path& version_dir);
    void extract_and_validate(const std::filesystem::path& package_path, const std::filesystem::path& version_dir);
    void provision_runtime(const std::filesystem::path& version_dir);
    void remove_version_dir(const std::filesystem::path& version_dir);

    const VersionStore& store_;
    const HookRunner& hooks_;
    std::string python_;
};
