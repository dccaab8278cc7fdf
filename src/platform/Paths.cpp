#include "Paths.h"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace Platform {

std::string GetUserDataDir() {
#ifdef __APPLE__
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Application Support/Kiseki/";
    }
#elif defined(_WIN32)
    const char* appdata = getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\Kiseki\\";
    }
#else
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/.local/share/kiseki/";
    }
#endif
    return "./userdata/";
}

std::string GetDefaultExportDir() {
#if defined(_WIN32)
    const char* userprofile = getenv("USERPROFILE");
    if (userprofile) {
        return std::string(userprofile) + "\\Pictures\\Kiseki\\";
    }
#else
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/Pictures/Kiseki/";
    }
#endif
    return "./exports/";
}

bool EnsureDirectoryExists(const std::string& path) {
    // Normalize path to handle trailing slashes and relative paths
    fs::path normalized = fs::path(path).lexically_normal();

    // Create directory (idempotent - safe if already exists)
    std::error_code ec;
    fs::create_directories(normalized, ec);
    if (ec) {
        return false;
    }

    return fs::is_directory(normalized, ec);
}

} // namespace Platform
