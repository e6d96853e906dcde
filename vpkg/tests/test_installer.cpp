#include <gtest/gtest.h>
#include "../main/src/hook.hpp"
#include "../main/src/installer.hpp"
#include "../main/src/version_store.hpp"
#include "test_helpers.hpp"

class InstallerTest : public ::testing::Test {
protected:
    fs::path test_root;
    fs::path work_dir;
    Layout layout;

    void SetUp() override {
        init_test_localization();
        test_root = make_test_root("installer");
        work_dir = test_root / "work";
        layout = Layout::from_base(test_root / "base");
        init_filesystem(layout);
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }

    bool install(const fs::path& package, const std::string& version, std::set<std::string> required = {}, const std::string& python = "python3") {
        VersionStore store(layout, PointerMode::Symlink, VersionOrder::Lexicographic);
        HookRunner hooks(std::move(required));
        PackageInstaller installer(store, hooks, python);
        return installer.install(package, version);
    }
};

TEST_F(InstallerTest, InstallsWithoutChangingCurrent) {
    make_installed(layout, "0.9.0");
    point_current_at(layout, "0.9.0");
    const fs::path package = make_package(work_dir, "1.0.0", {{"app/main.py", "print('v1')\n"}});

    EXPECT_TRUE(install(package, "1.0.0"));

    EXPECT_EQ(read_file(layout.version_dir("1.0.0") / "app/main.py"), "print('v1')\n");
    EXPECT_TRUE(fs::exists(layout.version_dir("1.0.0") / "manifest.json"));
    EXPECT_EQ(fs::read_symlink(layout.current_link), fs::path("0.9.0"));
    // The staged archive is left to the caller
    EXPECT_TRUE(fs::exists(package));
}

TEST_F(InstallerTest, ReinstallReplacesDirectory) {
    const fs::path first = make_package(work_dir, "1.0.0", {{"app/main.py", "a"}, {"app/old.py", "old"}});
    ASSERT_TRUE(install(first, "1.0.0"));

    const fs::path second = make_package(work_dir, "1.0.0", {{"app/main.py", "b"}});
    EXPECT_TRUE(install(second, "1.0.0"));

    EXPECT_EQ(read_file(layout.version_dir("1.0.0") / "app/main.py"), "b");
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0") / "app/old.py"));
}

TEST_F(InstallerTest, InstallingTwiceIsIdempotent) {
    const fs::path package = make_package(work_dir, "1.0.0", {{"app/main.py", "same"}});
    ASSERT_TRUE(install(package, "1.0.0"));
    ASSERT_TRUE(install(package, "1.0.0"));

    VersionStore store(layout, PointerMode::Symlink, VersionOrder::Lexicographic);
    EXPECT_EQ(store.installed_versions(), std::vector<std::string>{"1.0.0"});
    EXPECT_EQ(read_file(layout.version_dir("1.0.0") / "app/main.py"), "same");
}

TEST_F(InstallerTest, MissingManifestLeavesNoDirectory) {
    const fs::path package = make_package(work_dir, "1.0.0", {{"app/main.py", "x"}}, false);

    EXPECT_FALSE(install(package, "1.0.0"));
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0")));
}

TEST_F(InstallerTest, ManifestChecksumMismatchLeavesNoDirectory) {
    const fs::path package = make_package(work_dir, "1.0.0", {
        {"app/main.py", "tampered"},
        {"manifest.json", R"({"version": "1.0.0", "checksums": {"app/main.py": "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"}})"},
    }, false);

    EXPECT_FALSE(install(package, "1.0.0"));
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0")));
}

TEST_F(InstallerTest, CorruptArchiveLeavesNoDirectory) {
    write_file(work_dir / "broken.tar.gz", "garbage");

    EXPECT_FALSE(install(work_dir / "broken.tar.gz", "1.0.0"));
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0")));
}

TEST_F(InstallerTest, MissingArchiveFails) {
    EXPECT_FALSE(install(work_dir / "absent.tar.gz", "1.0.0"));
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0")));
}

TEST_F(InstallerTest, InvalidVersionNameIsRejected) {
    const fs::path package = make_package(work_dir, "1.0.0", {{"app/main.py", "x"}});
    EXPECT_FALSE(install(package, "../escape"));
    EXPECT_FALSE(install(package, "current"));
    EXPECT_FALSE(fs::exists(layout.base_dir / "escape"));
}

TEST_F(InstallerTest, ActiveVersionIsNotReinstalled) {
    make_installed(layout, "1.0.0", {{"app/main.py", "running"}});
    point_current_at(layout, "1.0.0");
    const fs::path package = make_package(work_dir, "1.0.0", {{"app/main.py", "new"}});

    EXPECT_FALSE(install(package, "1.0.0"));
    EXPECT_EQ(read_file(layout.version_dir("1.0.0") / "app/main.py"), "running");
}

TEST_F(InstallerTest, HooksRunInOrder) {
    const fs::path package = make_package(work_dir, "1.0.0", {
        {"app/main.py", "x"},
        {"hooks/pre-install.sh", "#!/bin/sh\necho pre >> ../hook-log\n"},
        {"hooks/post-install.sh", "#!/bin/sh\necho post >> ../hook-log\n"},
    });

    EXPECT_TRUE(install(package, "1.0.0"));
    EXPECT_EQ(read_file(layout.packages_dir / "hook-log"), "pre\npost\n");
}

TEST_F(InstallerTest, FailingBestEffortHookStillInstalls) {
    const fs::path package = make_package(work_dir, "1.0.0", {
        {"app/main.py", "x"},
        {"hooks/post-install.sh", "#!/bin/sh\nexit 1\n"},
    });

    EXPECT_TRUE(install(package, "1.0.0"));
    EXPECT_TRUE(fs::exists(layout.version_dir("1.0.0")));
}

TEST_F(InstallerTest, FailingRequiredHookAbortsInstall) {
    const fs::path package = make_package(work_dir, "1.0.0", {
        {"app/main.py", "x"},
        {"hooks/pre-install.sh", "#!/bin/sh\nexit 1\n"},
    });

    EXPECT_FALSE(install(package, "1.0.0", {"pre-install"}));
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0")));
}

TEST_F(InstallerTest, ProvisioningFailureLeavesNoDirectory) {
    const fs::path package = make_package(work_dir, "1.0.0", {
        {"app/main.py", "x"},
        {"app/requirements.txt", "requests\n"},
    });

    EXPECT_FALSE(install(package, "1.0.0", {}, "/bin/false"));
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0")));
}

TEST_F(InstallerTest, MissingInterpreterIsProvisioningFailure) {
    const fs::path package = make_package(work_dir, "1.0.0", {
        {"app/main.py", "x"},
        {"app/requirements", "requests\n"},
    });

    EXPECT_FALSE(install(package, "1.0.0", {}, "/nonexistent/python3"));
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0")));
}

TEST_F(InstallerTest, NoRequirementsSkipsProvisioning) {
    const fs::path package = make_package(work_dir, "1.0.0", {{"app/main.py", "x"}});

    // The interpreter is never invoked without a requirements file
    EXPECT_TRUE(install(package, "1.0.0", {}, "/bin/false"));
    EXPECT_FALSE(fs::exists(layout.version_dir("1.0.0") / "venv"));
}
