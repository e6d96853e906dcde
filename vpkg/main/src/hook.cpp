#include "hook.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <array>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::pair<Hook, const char*>, 5> hook_names = {{
    {Hook::PreInstall, "pre-install"},
    {Hook::PostInstall, "post-install"},
    {Hook::PreUpgrade, "pre-upgrade"},
    {Hook::PostUpgrade, "post-upgrade"},
    {Hook::Rollback, "rollback"},
}};

} // anonymous namespace

std::string hook_name(Hook hook) {
    for (const auto& [value, name] : hook_names) {
        if (value == hook) return name;
    }
    return "unknown";
}

std::optional<Hook> hook_from_name(const std::string& name) {
    for (const auto& [value, hook_str] : hook_names) {
        if (name == hook_str) return value;
    }
    return std::nullopt;
}

HookRunner::HookRunner(std::set<std::string> required_hooks)
    : required_hooks_(std::move(required_hooks)) {}

HookResult HookRunner::run(const fs::path& version_dir, Hook hook) const {
    const std::string name = hook_name(hook);
    const fs::path hook_path = version_dir / "hooks" / (name + ".sh");

    HookResult result;
    std::error_code ec;
    if (!fs::exists(hook_path, ec) || !fs::is_regular_file(hook_path, ec)) {
        return result;
    }

    log_info(string_format("info.running_hook", name, version_dir.filename().string()));
    result.ran = true;

    fs::permissions(hook_path, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec, fs::perm_options::add, ec);
    if (ec) {
        log_warning(string_format("warning.hook_chmod_failed", name, ec.message()));
    }

    try {
        ProcessResult proc = run_process({hook_path.string()}, version_dir);
        result.exit_code = proc.exit_code;
        result.output = std::move(proc.output);
    } catch (const VpkgException& e) {
        result.exit_code = -1;
        result.output = e.what();
    }

    log_output(name, result.output);
    if (result.succeeded()) {
        log_info(string_format("info.hook_succeeded", name));
    } else {
        log_warning(string_format("warning.hook_failed_exec", name, result.exit_code));
    }
    return result;
}

HookResult HookRunner::run_checked(const fs::path& version_dir, Hook hook) const {
    HookResult result = run(version_dir, hook);
    if (!result.succeeded() && is_required(hook)) {
        throw VpkgException(ErrorKind::Hook, string_format("error.required_hook_failed", hook_name(hook), result.exit_code));
    }
    return result;
}
