#include <gtest/gtest.h>
#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include "test_helpers.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_localization();
    }
};

TEST_F(ConfigTest, EmptyObjectKeepsDefaults) {
    AgentConfig config = parse_agent_config("{}");
    EXPECT_EQ(config.channel, "stable");
    EXPECT_EQ(config.keep_previous_versions, 2);
    EXPECT_FALSE(config.auto_update);
    EXPECT_EQ(config.check_interval_hours, 24);
    EXPECT_EQ(config.health_grace, std::chrono::seconds(5));
    EXPECT_EQ(config.python, "python3");
    EXPECT_EQ(config.product, "app");
    EXPECT_EQ(config.pointer_mode, PointerMode::Symlink);
    EXPECT_EQ(config.version_order, VersionOrder::Lexicographic);
    EXPECT_TRUE(config.required_hooks.empty());
}

TEST_F(ConfigTest, ReadsAllKeys) {
    AgentConfig config = parse_agent_config(R"({
        "update_server": "https://updates.example.com",
        "channel": "beta",
        "keep_previous_versions": 3,
        "auto_update": true,
        "check_interval_hours": 6,
        "health_url": "http://127.0.0.1:9000/health",
        "health_grace_seconds": 0.5,
        "health_timeout_seconds": 2,
        "request_timeout_seconds": 4,
        "download_timeout_seconds": 60,
        "python": "/usr/bin/python3.11",
        "product": "cloudprintd",
        "pointer_mode": "file",
        "version_order": "semantic",
        "required_hooks": ["pre-install", "rollback"]
    })");

    EXPECT_EQ(config.update_server, "https://updates.example.com");
    EXPECT_EQ(config.channel, "beta");
    EXPECT_EQ(config.keep_previous_versions, 3);
    EXPECT_TRUE(config.auto_update);
    EXPECT_EQ(config.check_interval_hours, 6);
    EXPECT_EQ(config.health_url, "http://127.0.0.1:9000/health");
    EXPECT_EQ(config.health_grace, std::chrono::milliseconds(500));
    EXPECT_EQ(config.health_timeout_seconds, 2);
    EXPECT_EQ(config.request_timeout_seconds, 4);
    EXPECT_EQ(config.download_timeout_seconds, 60);
    EXPECT_EQ(config.python, "/usr/bin/python3.11");
    EXPECT_EQ(config.product, "cloudprintd");
    EXPECT_EQ(config.pointer_mode, PointerMode::File);
    EXPECT_EQ(config.version_order, VersionOrder::Semantic);
    EXPECT_EQ(config.required_hooks, (std::set<std::string>{"pre-install", "rollback"}));
}

TEST_F(ConfigTest, InvalidValuesAreConfigErrors) {
    auto expect_config_error = [](const std::string& text) {
        try {
            parse_agent_config(text);
            ADD_FAILURE() << "accepted: " << text;
        } catch (const VpkgException& e) {
            EXPECT_EQ(e.kind(), ErrorKind::Config) << text;
        }
    };

    expect_config_error("not json");
    expect_config_error("[1, 2]");
    expect_config_error(R"({"keep_previous_versions": -1})");
    expect_config_error(R"({"keep_previous_versions": "two"})");
    expect_config_error(R"({"pointer_mode": "hardlink"})");
    expect_config_error(R"({"version_order": "random"})");
    expect_config_error(R"({"required_hooks": ["pre-deploy"]})");
}

TEST_F(ConfigTest, LoadFromFile) {
    fs::path root = make_test_root("config");
    write_file(root / "update.json", R"({"channel": "nightly", "keep_previous_versions": 0})");

    AgentConfig config = load_agent_config(root / "update.json");
    EXPECT_EQ(config.channel, "nightly");
    EXPECT_EQ(config.keep_previous_versions, 0);

    try {
        load_agent_config(root / "missing.json");
        FAIL() << "missing file accepted";
    } catch (const VpkgException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Config);
    }
    fs::remove_all(root);
}

TEST_F(ConfigTest, LayoutPaths) {
    Layout layout = Layout::from_base("/opt/cloudprintd/");
    EXPECT_EQ(layout.packages_dir, fs::path("/opt/cloudprintd/packages"));
    EXPECT_EQ(layout.downloads_dir, fs::path("/opt/cloudprintd/downloads"));
    EXPECT_EQ(layout.current_link, fs::path("/opt/cloudprintd/packages/current"));
    EXPECT_EQ(layout.version_dir("1.2.0"), fs::path("/opt/cloudprintd/packages/1.2.0"));
    EXPECT_EQ(layout.staged_package("app", "1.2.0"), fs::path("/opt/cloudprintd/downloads/app-1.2.0.pbpkg"));
}
