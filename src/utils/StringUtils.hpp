// gas - String Utilities
// String manipulation helpers

#pragma once

#include <string>
#include <vector>

namespace gas::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // Splitting
    static std::vector<std::string> split(const std::string& str, char delimiter);

    // Search and replace
    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);
    static bool startsWith(const std::string& str, const std::string& prefix);
};

} // namespace gas::utils
