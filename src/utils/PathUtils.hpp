#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace botarr::utils {

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
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getBotarrPath() {
        return getAppDataPath() / "Botarr";
    }

    static fs::path getConfigPath() {
        return getBotarrPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getBotarrPath() / "logs";
    }

    // Relative download directories resolve against the working directory
    static fs::path resolveDownloadPath(const std::string& directory) {
        fs::path path(directory.empty() ? "downloads" : directory);
        return path.is_absolute() ? path : fs::current_path() / path;
    }
};

} // namespace botarr::utils
