#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

namespace downpour::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* xdg = std::getenv("XDG_DATA_HOME");
        if (xdg && *xdg) {
            return fs::path(xdg);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getDataPath() {
        return getAppDataPath() / "Downpour";
    }

    static fs::path getConfigPath() {
        return getDataPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getDataPath() / "logs";
    }

    // Default target for downloads when the config leaves it empty
    static fs::path getDownloadsPath() {
        const char* home = std::getenv("HOME");
#ifdef _WIN32
        if (!home) {
            home = std::getenv("USERPROFILE");
        }
#endif
        return home ? fs::path(home) / "Downloads" : fs::current_path();
    }
};

} // namespace downpour::utils
