#include <gtest/gtest.h>
#include "../main/src/exception.hpp"
#include "../main/src/hash.hpp"
#include "test_helpers.hpp"

class HashTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        init_test_localization();
        test_root = make_test_root("hash");
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }
};

TEST_F(HashTest, KnownDigests) {
    write_file(test_root / "hello.txt", "hello");
    write_file(test_root / "empty.txt", "");

    EXPECT_EQ(calculate_sha256(test_root / "hello.txt"), "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    EXPECT_EQ(calculate_sha256(test_root / "empty.txt"), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashTest, LargeFileSpansChunks) {
    std::string content(100000, 'a');
    write_file(test_root / "big.bin", content);
    write_file(test_root / "big_copy.bin", content);
    write_file(test_root / "big_changed.bin", content.substr(0, 99999) + "b");

    EXPECT_EQ(calculate_sha256(test_root / "big.bin"), calculate_sha256(test_root / "big_copy.bin"));
    EXPECT_NE(calculate_sha256(test_root / "big.bin"), calculate_sha256(test_root / "big_changed.bin"));
}

TEST_F(HashTest, MissingFileThrows) {
    EXPECT_THROW(calculate_sha256(test_root / "nope"), VpkgException);
}

TEST_F(HashTest, ChecksumMatching) {
    const std::string digest = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
    EXPECT_TRUE(checksum_matches(digest, digest));
    EXPECT_FALSE(checksum_matches(digest, "2CF24DBA5FB0A30E26E83B2AC5B9E29E1B161E5C1FA7425E73043362938B9824"));
    EXPECT_FALSE(checksum_matches(digest, " " + digest + "\n"));
    EXPECT_FALSE(checksum_matches(digest, ""));
    EXPECT_FALSE(checksum_matches(digest, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}
