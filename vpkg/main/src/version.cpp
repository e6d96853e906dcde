#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace {

std::vector<std::string> split(std::string_view s, std::string_view delims) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = s.find_first_of(delims, start);
        parts.emplace_back(s.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return parts;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Numeric parts compare by value; a non-numeric part compares after any numeric one.
int compare_part(const std::string& p1, const std::string& p2) {
    const bool num1 = is_number(p1);
    const bool num2 = is_number(p2);
    if (num1 && num2) {
        const std::string a = p1.substr(std::min(p1.find_first_not_of('0'), p1.size() - 1));
        const std::string b = p2.substr(std::min(p2.find_first_not_of('0'), p2.size() - 1));
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        return a.compare(b);
    }
    if (num1 != num2) return num1 ? -1 : 1;
    return p1.compare(p2);
}

} // anonymous namespace

bool version_compare(const std::string& v1_str, const std::string& v2_str) {
    // Build metadata does not take part in ordering
    const std::string v1 = v1_str.substr(0, v1_str.find('+'));
    const std::string v2 = v2_str.substr(0, v2_str.find('+'));

    // Split into main version and pre-release part
    const size_t v1_hyphen = v1.find('-');
    const size_t v2_hyphen = v2.find('-');
    const std::string v1_main = v1.substr(0, v1_hyphen);
    const std::string v2_main = v2.substr(0, v2_hyphen);
    const std::string v1_pre = v1_hyphen == std::string::npos ? "" : v1.substr(v1_hyphen + 1);
    const std::string v2_pre = v2_hyphen == std::string::npos ? "" : v2.substr(v2_hyphen + 1);

    const auto p1_main = split(v1_main, ".");
    const auto p2_main = split(v2_main, ".");
    const size_t main_len = std::max(p1_main.size(), p2_main.size());
    for (size_t i = 0; i < main_len; ++i) {
        const std::string n1 = (i < p1_main.size() && !p1_main[i].empty()) ? p1_main[i] : "0";
        const std::string n2 = (i < p2_main.size() && !p2_main[i].empty()) ? p2_main[i] : "0";
        const int c = compare_part(n1, n2);
        if (c != 0) return c < 0;
    }

    // Main versions are equal, compare pre-release
    if (v1_pre.empty() && !v2_pre.empty()) return false; // 1.0.0 > 1.0.0-alpha
    if (!v1_pre.empty() && v2_pre.empty()) return true;  // 1.0.0-alpha < 1.0.0
    if (v1_pre.empty() && v2_pre.empty()) return v1_str < v2_str;

    const auto p1_pre = split(v1_pre, ".-");
    const auto p2_pre = split(v2_pre, ".-");
    const size_t pre_len = std::max(p1_pre.size(), p2_pre.size());
    for (size_t i = 0; i < pre_len; ++i) {
        if (i >= p1_pre.size()) return true; // 1.0.0-alpha < 1.0.0-alpha.1
        if (i >= p2_pre.size()) return false;
        const int c = compare_part(p1_pre[i], p2_pre[i]);
        if (c != 0) return c < 0;
    }

    // Equal precedence; fall back to the raw strings so the order is total
    return v1_str < v2_str;
}

bool version_less(const std::string& v1, const std::string& v2, VersionOrder order) {
    if (order == VersionOrder::Semantic) {
        return version_compare(v1, v2);
    }
    return v1 < v2;
}

void sort_versions_descending(std::vector<std::string>& versions, VersionOrder order) {
    std::sort(versions.begin(), versions.end(), [order](const std::string& a, const std::string& b) {
        return version_less(b, a, order);
    });
}
