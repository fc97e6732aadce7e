#include "VerifyMatcher.hpp"
#include "StringUtils.hpp"
#include <regex>
#include <stdexcept>

namespace VerifyMatcher {

const std::vector<std::string>& modes() {
    static const std::vector<std::string> names = {
        "equals", "contains", "not_equals", "regex", "starts_with"
    };
    return names;
}

std::optional<bool> match(const std::string& actual, const std::string& expected, const std::string& mode) {
    const std::string m = StringUtils::to_lower(mode);

    if (m == "equals") return StringUtils::iequals(actual, expected);
    if (m == "contains") return StringUtils::icontains(actual, expected);
    if (m == "not_equals") return !StringUtils::iequals(actual, expected);
    if (m == "starts_with") return StringUtils::istarts_with(actual, expected);
    if (m == "regex") {
        try {
            std::regex pattern(expected, std::regex::ECMAScript | std::regex::icase);
            return std::regex_search(actual, pattern);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("Invalid regex pattern '" + expected + "': " + e.what());
        }
    }
    return std::nullopt;
}

std::string describe(const std::string& mode) {
    const std::string m = StringUtils::to_lower(mode);
    if (m == "equals") return "=";
    if (m == "contains") return "to contain";
    if (m == "not_equals") return "!=";
    if (m == "regex") return "to match pattern";
    if (m == "starts_with") return "to start with";
    return m;
}

}
