#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <algorithm>
#include <cctype>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(const std::string& str);

    // ASCII case-insensitive comparisons
    static bool iequals(const std::string& a, const std::string& b);
    static bool icontains(const std::string& haystack, const std::string& needle);
    static bool istarts_with(const std::string& str, const std::string& prefix);
    static bool iends_with(const std::string& str, const std::string& suffix);

    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    static std::string base64_encode(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> base64_decode(const std::string& encoded);
};

// Ordering for maps keyed by case-insensitive names
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};
