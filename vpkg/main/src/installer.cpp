#include "installer.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "manifest.hpp"
#include "process.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

PackageInstaller::PackageInstaller(const VersionStore& store, const HookRunner& hooks, std::string python)
    : store_(store), hooks_(hooks), python_(std::move(python)) {}

bool PackageInstaller::install(const fs::path& package_path, const std::string& version) {
    if (!is_valid_version_name(version)) {
        log_error(string_format("error.invalid_version_name", version));
        return false;
    }

    const fs::path version_dir = store_.version_dir(version);
    try {
        InstallLock lock(store_.layout().lock_file);

        if (store_.current_version() == version) {
            throw VpkgException(ErrorKind::Activation, string_format("error.reinstall_active", version));
        }

        log_info(string_format("info.installing_version", version, package_path.string()));
        try {
            run_steps(package_path, version, version_dir);
        } catch (const std::exception&) {
            remove_version_dir(version_dir);
            throw;
        }
    } catch (const VpkgException& e) {
        log_error(string_format("error.install_failed", version, error_kind_name(e.kind()), e.what()));
        return false;
    } catch (const std::exception& e) {
        log_error(string_format("error.install_failed", version, "unexpected", e.what()));
        return false;
    }

    log_info(string_format("info.version_installed", version));
    return true;
}

void PackageInstaller::run_steps(const fs::path& package_path, const std::string& version, const fs::path& version_dir) {
    std::error_code ec;
    if (!fs::is_regular_file(package_path, ec)) {
        throw VpkgException(ErrorKind::Structural, string_format("error.package_not_found", package_path.string()));
    }

    if (fs::exists(fs::symlink_status(version_dir, ec))) {
        log_warning(string_format("warning.replacing_installed_version", version));
        fs::remove_all(version_dir);
    }
    ensure_dir_exists(version_dir);

    extract_and_validate(package_path, version_dir);

    hooks_.run_checked(version_dir, Hook::PreInstall);
    provision_runtime(version_dir);
    hooks_.run_checked(version_dir, Hook::PostInstall);
}

void PackageInstaller::extract_and_validate(const fs::path& package_path, const fs::path& version_dir) {
    log_info(string_format("info.extracting_to", version_dir.string()));
    extract_archive(package_path, version_dir);

    const Manifest manifest = load_manifest(version_dir / MANIFEST_FILE);
    verify_manifest(manifest, version_dir);
}

void PackageInstaller::provision_runtime(const fs::path& version_dir) {
    fs::path requirements;
    for (const char* candidate : {"app/requirements.txt", "app/requirements"}) {
        if (fs::is_regular_file(version_dir / candidate)) {
            requirements = version_dir / candidate;
            break;
        }
    }
    if (requirements.empty()) {
        log_info(get_string("info.no_requirements"));
        return;
    }

    const fs::path venv_dir = version_dir / "venv";
    log_info(string_format("info.creating_environment", venv_dir.string()));

    ProcessResult venv;
    try {
        venv = run_process({python_, "-m", "venv", venv_dir.string()}, version_dir);
    } catch (const VpkgException& e) {
        throw VpkgException(ErrorKind::Provisioning, e.what());
    }
    log_output("venv", venv.output);
    if (!venv.succeeded()) {
        throw VpkgException(ErrorKind::Provisioning, string_format("error.environment_failed", venv.exit_code));
    }

    const fs::path pip = venv_dir / "bin" / "pip";
    log_info(string_format("info.installing_requirements", requirements.string()));

    ProcessResult deps;
    try {
        deps = run_process({pip.string(), "install", "-r", requirements.string()}, version_dir);
    } catch (const VpkgException& e) {
        throw VpkgException(ErrorKind::Provisioning, e.what());
    }
    log_output("pip", deps.output);
    if (!deps.succeeded()) {
        throw VpkgException(ErrorKind::Provisioning, string_format("error.requirements_failed", deps.exit_code));
    }
    log_info(get_string("info.environment_ready"));
}

void PackageInstaller::remove_version_dir(const fs::path& version_dir) {
    std::error_code ec;
    fs::remove_all(version_dir, ec);
    if (ec) {
        log_warning(string_format("warning.remove_dir_failed", version_dir.string(), ec.message()));
    }
}
