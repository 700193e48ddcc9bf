// Downpour - String Utilities
// String manipulation and formatting

#pragma once

#include <cstdint>
#include <string>

namespace downpour::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatSpeed(double bytesPerSecond);
    static std::string formatPercentage(double percent, int precision = 0);

    // URLs and file names
    static std::string urlFileName(const std::string& url);
    static std::string sanitizeFileName(const std::string& name);

    // Parsing
    static int parseInt(const std::string& str, int defaultValue = 0);
    static int64_t parseLong(const std::string& str, int64_t defaultValue = 0);
};

} // namespace downpour::utils
