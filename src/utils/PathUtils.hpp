#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace gas::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    // $GAS_CONFIG_DIR wins so tests and portable installs can relocate everything.
    static fs::path getConfigDir() {
        if (const char* dir = std::getenv("GAS_CONFIG_DIR"); dir && *dir) {
            return fs::path(dir);
        }
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) / "gas" : fs::current_path() / "gas";
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" / "gas" : fs::current_path() / "gas";
#else
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
            return fs::path(xdg) / "gas";
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".config" / "gas" : fs::current_path() / "gas";
#endif
    }

    static fs::path getLogsPath() {
        return getConfigDir() / "logs";
    }
};

} // namespace gas::utils
