#include "Fs.h"
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace Platform {

std::optional<std::vector<uint8_t>> ReadFile(
    const std::string& path,
    size_t maxSize
) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    if (maxSize > 0 && static_cast<size_t>(size) > maxSize) {
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 &&
        !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return std::nullopt;
    }

    return buffer;
}

bool WriteFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    return file.good();
}

std::optional<std::string> ReadTextFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string content(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
    return content;
}

bool WriteTextFile(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << text;
    return file.good();
}

bool FileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string JoinPath(const std::string& dir, const std::string& name) {
    return (fs::path(dir) / name).string();
}

} // namespace Platform
