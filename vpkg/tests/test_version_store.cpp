#include <gtest/gtest.h>
#include "../main/src/version_store.hpp"
#include "test_helpers.hpp"

class VersionStoreTest : public ::testing::Test {
protected:
    fs::path test_root;
    Layout layout;

    void SetUp() override {
        init_test_localization();
        test_root = make_test_root("version_store");
        layout = Layout::from_base(test_root);
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }
};

TEST_F(VersionStoreTest, MissingPackagesDirIsEmpty) {
    VersionStore store(layout, PointerMode::Symlink, VersionOrder::Lexicographic);
    EXPECT_TRUE(store.installed_versions().empty());
    EXPECT_FALSE(store.current_version().has_value());
}

TEST_F(VersionStoreTest, ListsVersionsNewestFirst) {
    init_filesystem(layout);
    make_installed(layout, "1.0.0");
    make_installed(layout, "1.2.0");
    make_installed(layout, "1.1.0");
    point_current_at(layout, "1.2.0");
    // Not versions: a plain file, a hidden directory, a temporary pointer and the lock file
    write_file(layout.packages_dir / "notes.txt", "x");
    fs::create_directories(layout.packages_dir / ".staging");
    fs::create_directory_symlink("1.0.0", layout.packages_dir / "current.1.0.0.tmp");
    write_file(layout.lock_file, "");

    VersionStore store(layout, PointerMode::Symlink, VersionOrder::Lexicographic);
    EXPECT_EQ(store.installed_versions(), (std::vector<std::string>{"1.2.0", "1.1.0", "1.0.0"}));
    EXPECT_TRUE(store.is_installed("1.1.0"));
    EXPECT_FALSE(store.is_installed("current"));
    EXPECT_FALSE(store.is_installed("9.9.9"));
}

TEST_F(VersionStoreTest, CurrentFollowsSymlink) {
    init_filesystem(layout);
    make_installed(layout, "1.0.0");
    make_installed(layout, "1.1.0");
    point_current_at(layout, "1.1.0");

    VersionStore store(layout, PointerMode::Symlink, VersionOrder::Lexicographic);
    ASSERT_TRUE(store.current_version().has_value());
    EXPECT_EQ(*store.current_version(), "1.1.0");
}

TEST_F(VersionStoreTest, AbsoluteSymlinkTargetIsAccepted) {
    init_filesystem(layout);
    make_installed(layout, "1.0.0");
    fs::create_directory_symlink(layout.version_dir("1.0.0"), layout.current_link);

    VersionStore store(layout, PointerMode::Symlink, VersionOrder::Lexicographic);
    EXPECT_EQ(store.current_version().value_or(""), "1.0.0");
}

TEST_F(VersionStoreTest, DanglingPointerIsNoCurrent) {
    init_filesystem(layout);
    make_installed(layout, "1.0.0");
    point_current_at(layout, "2.0.0");

    VersionStore store(layout, PointerMode::Symlink, VersionOrder::Lexicographic);
    EXPECT_FALSE(store.current_version().has_value());
}

TEST_F(VersionStoreTest, FilePointerMode) {
    init_filesystem(layout);
    make_installed(layout, "1.0.0");
    write_file(layout.current_link, "1.0.0\n");

    VersionStore file_store(layout, PointerMode::File, VersionOrder::Lexicographic);
    EXPECT_EQ(file_store.current_version().value_or(""), "1.0.0");

    // A regular file is not a pointer in symlink mode
    VersionStore link_store(layout, PointerMode::Symlink, VersionOrder::Lexicographic);
    EXPECT_FALSE(link_store.current_version().has_value());
}

TEST_F(VersionStoreTest, SemanticOrdering) {
    init_filesystem(layout);
    make_installed(layout, "1.9.0");
    make_installed(layout, "1.10.0");

    VersionStore store(layout, PointerMode::Symlink, VersionOrder::Semantic);
    EXPECT_EQ(store.installed_versions(), (std::vector<std::string>{"1.10.0", "1.9.0"}));
}
