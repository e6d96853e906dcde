#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

enum class Hook {
    PreInstall,
    PostInstall,
    PreUpgrade,
    PostUpgrade,
    Rollback
};

// "pre-install", "post-upgrade", ...
std::string hook_name(Hook hook);
std::optional<Hook> hook_from_name(const std::string& name);

struct HookResult {
    bool ran = false;
    int exit_code = 0;
    std::string output;

    bool succeeded() const { return exit_code == 0; }
};

// Executes the optional lifecycle scripts under <version>/hooks/<name>.sh.
class HookRunner {
public:
    explicit HookRunner(std::set<std::string> required_hooks = {});

    // A missing script is a successful no-op. Present scripts are made executable and run
    // with the version directory as working directory; output is captured and logged.
    HookResult run(const std::filesystem::path& version_dir, Hook hook) const;

    // Runs the hook, then throws VpkgException(Hook) if it failed and is required;
    // a failing best-effort hook is only logged.
    HookResult run_checked(const std::filesystem::path& version_dir, Hook hook) const;

    bool is_required(Hook hook) const { return required_hooks_.contains(hook_name(hook)); }

private:
    std::set<std::string> required_hooks_;
};
