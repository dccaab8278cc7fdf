#pragma once

#include <string>

namespace Platform {

/**
 * Get the user data directory for persistent storage.
 * macOS: ~/Library/Application Support/Kiseki/
 * Windows: %APPDATA%\Kiseki\
 * Linux: ~/.local/share/kiseki/
 * @return Path to user data directory
 */
std::string GetUserDataDir();

/**
 * Get the directory exported images are written to.
 * macOS/Linux: ~/Pictures/Kiseki/
 * Windows: %USERPROFILE%\Pictures\Kiseki\
 * @return Path to export directory
 */
std::string GetDefaultExportDir();

/**
 * Ensure a directory exists, creating it if necessary.
 * @param path Directory path
 * @return true if directory exists or was created successfully
 */
bool EnsureDirectoryExists(const std::string& path);

} // namespace Platform
