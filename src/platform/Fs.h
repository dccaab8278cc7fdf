#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Platform {

/**
 * Read entire file into memory.
 * @param path File path
 * @param maxSize Files larger than this are rejected (0 = no limit)
 * @return File contents, or nullopt on error or if the file is too large
 */
std::optional<std::vector<uint8_t>> ReadFile(
    const std::string& path,
    size_t maxSize = 0
);

/**
 * Write data to file, replacing it.
 * @return true on success
 */
bool WriteFile(const std::string& path, const std::vector<uint8_t>& data);

/**
 * Read text file.
 * @return File contents as string, or nullopt on error
 */
std::optional<std::string> ReadTextFile(const std::string& path);

/**
 * Write text file.
 * @return true on success
 */
bool WriteTextFile(const std::string& path, const std::string& text);

// True if path names an existing regular file
bool FileExists(const std::string& path);

// Join a directory and a file name with the platform separator
std::string JoinPath(const std::string& dir, const std::string& name);

} // namespace Platform
