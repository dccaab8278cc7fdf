#include "Keymap.h"
#include <imgui.h>
#include <SDL3/SDL.h>
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>

namespace Kiseki {

static std::string Trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.length();

    while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
        start++;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }

    return str.substr(start, end - start);
}

static std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Map key name to ImGuiKey (returns int)
static int KeyNameToImGuiKey(const std::string& keyName) {
    std::string lower = ToLower(keyName);

    // Single characters (A-Z, 0-9)
    if (lower.length() == 1) {
        char c = lower[0];
        if (c >= 'a' && c <= 'z') {
            return (int)ImGuiKey_A + (c - 'a');
        }
        if (c >= '0' && c <= '9') {
            return (int)ImGuiKey_0 + (c - '0');
        }
    }

    if (lower == "space") return (int)ImGuiKey_Space;
    if (lower == "escape" || lower == "esc") return (int)ImGuiKey_Escape;
    if (lower == "delete" || lower == "del") return (int)ImGuiKey_Delete;
    if (lower == "=" || lower == "equal") return (int)ImGuiKey_Equal;
    if (lower == "-" || lower == "minus") return (int)ImGuiKey_Minus;
    if (lower == "[") return (int)ImGuiKey_LeftBracket;
    if (lower == "]") return (int)ImGuiKey_RightBracket;

    return -1;  // ImGuiKey_None
}

static std::string ImGuiKeyToDisplayName(int key) {
    if (key >= (int)ImGuiKey_A && key <= (int)ImGuiKey_Z) {
        return std::string(1, 'A' + (key - (int)ImGuiKey_A));
    }
    if (key >= (int)ImGuiKey_0 && key <= (int)ImGuiKey_9) {
        return std::string(1, '0' + (key - (int)ImGuiKey_0));
    }

    if (key == (int)ImGuiKey_Space) return "Space";
    if (key == (int)ImGuiKey_Escape) return "Esc";
    if (key == (int)ImGuiKey_Delete) return "Delete";
    if (key == (int)ImGuiKey_Equal) return "=";
    if (key == (int)ImGuiKey_Minus) return "-";
    if (key == (int)ImGuiKey_LeftBracket) return "[";
    if (key == (int)ImGuiKey_RightBracket) return "]";

    return "?";
}

KeymapManager::KeymapManager() {
}

void KeymapManager::SetBinding(const std::string& action,
                               const std::string& binding) {
    m_bindings[action] = binding;
    m_parsedCache.erase(binding);
}

std::string KeymapManager::GetBinding(const std::string& action) const {
    auto it = m_bindings.find(action);
    return (it != m_bindings.end()) ? it->second : "";
}

std::optional<ParsedBinding> KeymapManager::ParseBinding(
    const std::string& binding
) const {
    if (binding.empty()) {
        return std::nullopt;
    }

    auto cacheIt = m_parsedCache.find(binding);
    if (cacheIt != m_parsedCache.end()) {
        return cacheIt->second;
    }

    ParsedBinding parsed;

    // Split by '+'
    std::vector<std::string> parts;
    std::stringstream ss(binding);
    std::string part;
    while (std::getline(ss, part, '+')) {
        parts.push_back(Trim(part));
    }

    for (const auto& p : parts) {
        std::string lower = ToLower(p);

        if (lower == "ctrl" || lower == "control" ||
            lower == "cmd" || lower == "command") {
            parsed.ctrl = true;
        } else if (lower == "alt" || lower == "option") {
            parsed.alt = true;
        } else if (lower == "shift") {
            parsed.shift = true;
        } else {
            int key = KeyNameToImGuiKey(p);
            if (key == -1 || parsed.key != -1) {
                return std::nullopt;  // Unknown key or two keys
            }
            parsed.key = key;
        }
    }

    if (!parsed.IsValid()) {
        return std::nullopt;
    }

    m_parsedCache[binding] = parsed;
    return parsed;
}

bool KeymapManager::IsBindingPressed(const ParsedBinding& parsed) const {
    ImGuiIO& io = ImGui::GetIO();

    // Ctrl matches Cmd too, so Ctrl+Z undoes on every platform
    bool ctrlDown = io.KeyCtrl || io.KeySuper;
    if (parsed.ctrl != ctrlDown) return false;
    if (parsed.alt != io.KeyAlt) return false;
    if (parsed.shift != io.KeyShift) return false;

    return ImGui::IsKeyPressed((ImGuiKey)parsed.key, false);
}

bool KeymapManager::IsActionTriggered(const std::string& action) const {
    std::string binding = GetBinding(action);
    if (binding.empty()) {
        return false;
    }

    auto parsed = ParseBinding(binding);
    if (!parsed) {
        return false;
    }

    return IsBindingPressed(*parsed);
}

void KeymapManager::LoadBindings(
    const std::unordered_map<std::string, std::string>& bindings
) {
    m_bindings.clear();
    m_parsedCache.clear();

    for (const auto& [action, binding] : bindings) {
        if (!binding.empty() && !ParseBinding(binding)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Ignoring invalid binding '%s' for %s",
                        binding.c_str(), action.c_str());
            continue;
        }
        m_bindings[action] = binding;
    }
}

std::string KeymapManager::GetBindingDisplayName(
    const std::string& binding
) const {
    if (binding.empty()) {
        return "(Not bound)";
    }

    auto parsed = ParseBinding(binding);
    if (!parsed) {
        return binding;  // Return as-is if can't parse
    }

    std::string result;
    if (parsed->ctrl) {
#ifdef __APPLE__
        result += "Cmd+";
#else
        result += "Ctrl+";
#endif
    }
    if (parsed->alt) {
        result += "Alt+";
    }
    if (parsed->shift) {
        result += "Shift+";
    }
    result += ImGuiKeyToDisplayName(parsed->key);

    return result;
}

} // namespace Kiseki
