#include <gtest/gtest.h>
#include "test_helpers.hpp"

#include <regex>
#include <set>

class L10nIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_localization();
    }

    std::set<std::string> extract_keys_from_source(const fs::path& src_dir) {
        std::set<std::string> keys;
        // Literal keys passed to the catalogue lookups, plus fallback keys handed to archive errors
        std::regex key_regex("(?:get_string|string_format)\\s*\\(\\s*\"([a-z_]+\\.[a-z_.]+)\"");
        std::regex fallback_regex("fail\\([^\"]*\"([a-z_]+\\.[a-z_.]+)\"\\)");

        for (const auto& dir_entry : fs::recursive_directory_iterator(src_dir)) {
            const auto ext = dir_entry.path().extension();
            if (!dir_entry.is_regular_file() || (ext != ".cpp" && ext != ".hpp")) continue;
            const std::string content = read_file(dir_entry.path());
            for (const auto* re : {&key_regex, &fallback_regex}) {
                for (auto it = std::sregex_iterator(content.begin(), content.end(), *re); it != std::sregex_iterator(); ++it) {
                    keys.insert((*it)[1].str());
                }
            }
        }
        return keys;
    }
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInCatalogue) {
    auto source_keys = extract_keys_from_source(VPKG_TEST_SRC_DIR);
    ASSERT_FALSE(source_keys.empty());

    std::vector<std::string> missing_keys;
    for (const auto& key : source_keys) {
        if (get_string(key).find("[MISSING_STRING:") != std::string::npos) {
            missing_keys.push_back(key);
        }
    }

    std::string error_msg = "The following keys are missing in the message catalogue: ";
    for (const auto& k : missing_keys) error_msg += k + ", ";

    EXPECT_TRUE(missing_keys.empty()) << error_msg;
}

TEST_F(L10nIntegrityTest, MissingKeyHasPlaceholder) {
    EXPECT_EQ(get_string("no.such.key"), "[MISSING_STRING: no.such.key]");
    EXPECT_EQ(string_format("info.version_installed", "1.2.0"), "Version 1.2.0 installed");
}
