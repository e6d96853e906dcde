#pragma once

#include <filesystem>
#include <format>
#include <string>
#include <string_view>

// Loads the message catalogue for $LANG from catalogue_dir, falling back to English.
void init_localization(const std::filesystem::path& catalogue_dir = VPKG_L10N_DIR);
const std::string& get_string(const std::string& key);

template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "vpkg formatting error [key: " + key + "]: " + e.what();
    }
}
