#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "packer.hpp"
#include "update_agent.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.status_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
    std::cerr << get_string("info.available_desc") << std::endl;
    std::cerr << get_string("info.check_desc") << std::endl;
    std::cerr << get_string("info.changelog_desc") << std::endl;
    std::cerr << get_string("info.fetch_desc") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.activate_desc") << std::endl;
    std::cerr << get_string("info.rollback_desc") << std::endl;
    std::cerr << get_string("info.update_desc") << std::endl;
    std::cerr << get_string("info.cleanup_desc") << std::endl;
    std::cerr << get_string("info.pack_desc") << std::endl;
}

std::vector<std::string> positional_args(const cxxopts::ParseResult& result) {
    if (!result.count("args")) return {};
    return result["args"].as<std::vector<std::string>>();
}

void check_arg_count(const std::vector<std::string>& args, std::function<void()> print_usage_func, size_t min, std::optional<size_t> max = std::nullopt) {
    if (args.size() < min || (max.has_value() && args.size() > max.value())) {
        print_usage_func();
        throw VpkgException(ErrorKind::Config, get_string("error.invalid_arg_count"));
    }
}

AgentConfig resolve_config(const cxxopts::ParseResult& result) {
    const fs::path config_path = result["config"].as<std::string>();
    AgentConfig config;
    if (fs::exists(config_path)) {
        config = load_agent_config(config_path);
    } else if (result.count("config")) {
        throw VpkgException(ErrorKind::Config, string_format("error.config_not_found", config_path.string()));
    }

    if (result.count("server")) config.update_server = result["server"].as<std::string>();
    if (result.count("channel")) config.channel = result["channel"].as<std::string>();
    if (result.count("keep")) {
        config.keep_previous_versions = result["keep"].as<int>();
        if (config.keep_previous_versions < 0) {
            throw VpkgException(ErrorKind::Config, string_format("error.config_bad_value", "keep_previous_versions"));
        }
    }
    return config;
}

void print_status(const UpdateAgent& agent) {
    const AgentStatus status = agent.status();

    std::cout << string_format("info.status_current", status.current_version.value_or(get_string("info.none"))) << std::endl;
    std::cout << string_format("info.status_installed_count", status.installed_count) << std::endl;
    std::cout << string_format("info.status_server", agent.config().update_server) << std::endl;
    std::cout << string_format("info.status_channel", agent.config().channel) << std::endl;
    std::cout << string_format("info.status_state", activation_state_name(status.state)) << std::endl;
    std::cout << string_format("info.status_auto_update", status.auto_update ? get_string("info.yes") : get_string("info.no")) << std::endl;
    if (!status.update_checked) {
        return;
    }
    std::cout << string_format("info.status_check_interval", status.check_interval_hours) << std::endl;
    if (!status.update) {
        std::cout << get_string("error.update_check_failed") << std::endl;
    } else if (status.update->update_available && status.update->latest) {
        std::cout << string_format("info.update_available", status.update->latest->version) << std::endl;
    } else {
        std::cout << get_string("info.up_to_date") << std::endl;
    }
}

void print_installed(UpdateAgent& agent) {
    const auto current = agent.store().current_version();
    for (const auto& version : agent.store().installed_versions()) {
        const bool is_current = current && *current == version;
        std::cout << (is_current ? "* " : "  ") << version << std::endl;
    }
}

void print_available(UpdateAgent& agent) {
    const auto versions = agent.fetcher().list_available_versions(agent.config().update_server, agent.config().channel);
    if (versions.empty()) {
        log_info(get_string("info.no_versions_available"));
        return;
    }
    for (const auto& v : versions) {
        std::string flags;
        if (v.is_current) flags = get_string("info.flag_current");
        else if (v.is_installed) flags = get_string("info.flag_installed");
        std::cout << v.version << "\t" << v.channel << "\t" << v.release_date << "\t" << flags << std::endl;
    }
}

bool print_update_check(UpdateAgent& agent) {
    const auto info = agent.fetcher().check_for_updates(agent.config().update_server, agent.config().channel);
    if (!info) {
        log_error(get_string("error.update_check_failed"));
        return false;
    }
    if (info->update_available && info->latest) {
        std::cout << string_format("info.update_available", info->latest->version) << std::endl;
    } else {
        std::cout << get_string("info.up_to_date") << std::endl;
    }
    if (!info->message.empty()) {
        std::cout << info->message << std::endl;
    }
    return true;
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("base", get_string("help.base_dir"), cxxopts::value<std::string>()->default_value(VPKG_DATA_DIR))
            ("config", get_string("help.config_file"), cxxopts::value<std::string>()->default_value(VPKG_CONF_FILE))
            ("server", get_string("help.server"), cxxopts::value<std::string>())
            ("channel", get_string("help.channel"), cxxopts::value<std::string>())
            ("keep", get_string("help.keep"), cxxopts::value<int>())
            ("o,output", get_string("help.output_file"), cxxopts::value<std::string>())
            ("source", get_string("help.pack_source"), cxxopts::value<std::string>())
            ("version", get_string("help.pack_version"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("args", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "args"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        const auto args = positional_args(result);
        auto usage_printer = [&]() { print_usage(options); };

        if (command == "pack") {
            check_arg_count(args, usage_printer, 0, 0);
            if (!result.count("output")) {
                throw VpkgException(ErrorKind::Config, get_string("error.pack_no_output"));
            }
            if (!result.count("source") || !result.count("version")) {
                throw VpkgException(ErrorKind::Config, get_string("error.pack_missing_args"));
            }
            PackOptions pack_options;
            pack_options.version = result["version"].as<std::string>();
            if (result.count("channel")) pack_options.channel = result["channel"].as<std::string>();
            const auto packed = pack_package(result["source"].as<std::string>(), result["output"].as<std::string>(), pack_options);
            std::cout << string_format("info.pack_result", packed.sha256, packed.size_bytes, packed.file_count) << std::endl;
            return 0;
        }

        const Layout layout = Layout::from_base(result["base"].as<std::string>());
        init_filesystem(layout);
        UpdateAgent agent(layout, resolve_config(result));

        bool ok = true;
        if (command == "status") {
            check_arg_count(args, usage_printer, 0, 0);
            print_status(agent);
        } else if (command == "list") {
            check_arg_count(args, usage_printer, 0, 0);
            print_installed(agent);
        } else if (command == "available") {
            check_arg_count(args, usage_printer, 0, 0);
            print_available(agent);
        } else if (command == "check") {
            check_arg_count(args, usage_printer, 0, 0);
            ok = print_update_check(agent);
        } else if (command == "changelog") {
            check_arg_count(args, usage_printer, 1, 1);
            const auto changelog = agent.fetcher().get_changelog(args[0], agent.config().update_server);
            if (changelog) {
                std::cout << *changelog << std::endl;
            } else {
                log_error(string_format("error.changelog_unavailable", args[0]));
                ok = false;
            }
        } else if (command == "fetch") {
            check_arg_count(args, usage_printer, 1, 1);
            const auto staged = agent.fetcher().download(args[0], agent.config().update_server);
            if (staged) {
                std::cout << staged->string() << std::endl;
            } else {
                ok = false;
            }
        } else if (command == "install") {
            check_arg_count(args, usage_printer, 2, 2);
            ok = agent.installer().install(args[0], args[1]);
        } else if (command == "activate") {
            check_arg_count(args, usage_printer, 1, 1);
            ok = agent.activation().activate(args[0]);
        } else if (command == "rollback") {
            check_arg_count(args, usage_printer, 0, 1);
            ok = args.empty() ? agent.activation().rollback_previous() : agent.activation().rollback_to(args[0]);
        } else if (command == "update") {
            check_arg_count(args, usage_printer, 1, 1);
            ok = agent.update_to(args[0]);
        } else if (command == "cleanup") {
            check_arg_count(args, usage_printer, 0, 0);
            const auto removed = agent.retention().cleanup(agent.config().keep_previous_versions);
            log_info(string_format("info.cleanup_complete", removed.size()));
        } else {
            usage_printer();
            return 1;
        }

        return ok ? 0 : 1;

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const VpkgException& e) {
        log_error(string_format("error.vpkg_error", error_kind_name(e.kind()), e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }
}
