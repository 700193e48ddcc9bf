/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace downpour::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Search --

bool StringUtils::contains(const std::string& str, const std::string& substr) {
    return str.find(substr) != std::string::npos;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatSpeed(double bytesPerSecond) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;

    if (!std::isfinite(bytesPerSecond) || bytesPerSecond < 0.0) {
        bytesPerSecond = 0.0;
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (bytesPerSecond < KB) {
        oss << std::setprecision(0) << std::floor(bytesPerSecond) << " B/s";
    } else if (bytesPerSecond < MB) {
        oss << std::setprecision(1) << (bytesPerSecond / KB) << " KB/s";
    } else {
        oss << std::setprecision(1) << (bytesPerSecond / MB) << " MB/s";
    }
    return oss.str();
}

std::string StringUtils::formatPercentage(double percent, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << percent << "%";
    return oss.str();
}

// -- URLs and file names --

std::string StringUtils::urlFileName(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));

    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        // Authority only ("http://host") has no path segment
        auto pathStart = path.find('/', scheme + 3);
        if (pathStart == std::string::npos) {
            return "";
        }
        path = path.substr(pathStart);
    }

    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string StringUtils::sanitizeFileName(const std::string& name) {
    std::string result;
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') result += c;
        else result += '_';
    }
    if (result == "." || result == "..") {
        result = "_";
    }
    return result;
}

// -- Parsing --

int StringUtils::parseInt(const std::string& str, int defaultValue) {
    try { return std::stoi(str); }
    catch (const std::invalid_argument&) { return defaultValue; }
    catch (const std::out_of_range&) { return defaultValue; }
}

int64_t StringUtils::parseLong(const std::string& str, int64_t defaultValue) {
    try { return std::stoll(str); }
    catch (const std::invalid_argument&) { return defaultValue; }
    catch (const std::out_of_range&) { return defaultValue; }
}

} // namespace downpour::utils
