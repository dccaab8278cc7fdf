#include "Preferences.h"
#include "Color.h"
#include "Limits.h"
#include "Theme/Themes.h"
#include "platform/Fs.h"
#include "platform/Paths.h"
#include <nlohmann/json.hpp>
#include <SDL3/SDL.h>
#include <algorithm>

namespace Kiseki {

static const char* kDefaultColor = "#38bdf8";

// Initialize static members with defaults
std::string Preferences::themeName = "Dark";
int Preferences::brushSize = Limits::MIN_BRUSH_SIZE;
std::string Preferences::lastColor = kDefaultColor;
std::unordered_map<std::string, std::string> Preferences::keymap =
    Preferences::GetDefaultKeymap();
bool Preferences::loaded = false;

std::unordered_map<std::string, std::string> Preferences::GetDefaultKeymap() {
    return {
        {"toolPencil", "P"},
        {"toolEraser", "E"},
        {"toolFill", "B"},
        {"toolEyedropper", "I"},
        {"toolHand", "H"},
        {"centerView", "C"},
        {"undo", "Ctrl+Z"},
        {"redo", "Ctrl+Y"}
    };
}

void Preferences::ResetToDefaults() {
    themeName = GetDefaultThemeName();
    brushSize = Limits::MIN_BRUSH_SIZE;
    lastColor = kDefaultColor;
    keymap = GetDefaultKeymap();
}

std::string Preferences::GetPreferencesPath() {
    return Platform::GetUserDataDir() + "preferences.json";
}

bool Preferences::LoadFromString(const std::string& text, std::string* outError) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        if (outError) *outError = e.what();
        return false;
    }

    if (!j.is_object()) {
        if (outError) *outError = "Preferences must be a JSON object";
        return false;
    }

    // Theme preferences
    if (j.contains("themeName") && j["themeName"].is_string()) {
        std::string name = j["themeName"].get<std::string>();
        if (IsValidTheme(name)) {
            themeName = name;
        }
    }

    // Tool preferences
    if (j.contains("brushSize") && j["brushSize"].is_number_integer()) {
        brushSize = std::clamp(j["brushSize"].get<int>(),
                               Limits::MIN_BRUSH_SIZE,
                               Limits::MAX_BRUSH_SIZE);
    }
    if (j.contains("lastColor") && j["lastColor"].is_string()) {
        auto color = Color::ParseHex(j["lastColor"].get<std::string>());
        if (color) {
            lastColor = color->ToHex(!color->IsOpaque());
        }
    }

    // Keymap overrides (unknown actions are ignored)
    if (j.contains("keymap") && j["keymap"].is_object()) {
        for (const auto& [action, binding] : j["keymap"].items()) {
            if (keymap.count(action) && binding.is_string()) {
                keymap[action] = binding.get<std::string>();
            }
        }
    }

    return true;
}

std::string Preferences::SaveToString() {
    nlohmann::json j;

    j["themeName"] = themeName;
    j["brushSize"] = brushSize;
    j["lastColor"] = lastColor;

    nlohmann::json bindings = nlohmann::json::object();
    for (const auto& [action, binding] : keymap) {
        bindings[action] = binding;
    }
    j["keymap"] = bindings;

    return j.dump(2);
}

void Preferences::Load() {
    loaded = true;

    auto text = Platform::ReadTextFile(GetPreferencesPath());
    if (!text) {
        return;  // No preferences file yet - use defaults
    }

    std::string error;
    if (!LoadFromString(*text, &error)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Ignoring unreadable preferences: %s", error.c_str());
    }
}

bool Preferences::Save() {
    if (!loaded) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Preferences were never loaded; not saving");
        return false;
    }

    // Ensure directory exists
    std::string dir = Platform::GetUserDataDir();
    if (!Platform::EnsureDirectoryExists(dir)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Could not create %s", dir.c_str());
        return false;
    }

    if (!Platform::WriteTextFile(GetPreferencesPath(), SaveToString())) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Could not write preferences");
        return false;
    }
    return true;
}

} // namespace Kiseki
