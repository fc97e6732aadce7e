#pragma once

#include <optional>
#include <string>
#include <vector>

namespace VerifyMatcher {

// equals, contains, not_equals, regex, starts_with
const std::vector<std::string>& modes();

// Empty when the mode is not recognised. Comparisons ignore case.
// Throws std::invalid_argument for a malformed regex pattern.
std::optional<bool> match(const std::string& actual, const std::string& expected, const std::string& mode);

// Phrase used in failure messages, e.g. "to contain"
std::string describe(const std::string& mode);

}
