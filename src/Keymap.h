#pragma once

#include <string>
#include <unordered_map>
#include <optional>

namespace Kiseki {

/**
 * Parsed representation of a key binding.
 * Uses int for key to avoid ImGui header dependency.
 * -1 = no key, otherwise ImGuiKey value.
 */
struct ParsedBinding {
    bool ctrl = false;
    bool alt = false;
    bool shift = false;
    int key = -1;  // ImGuiKey value, or -1 if none

    bool IsValid() const { return key != -1; }
};

/**
 * Keymap manager.
 * Maps action names (e.g. "toolPencil", "undo") to binding strings
 * (e.g. "P", "Ctrl+Z") and matches them against ImGui keyboard input.
 */
class KeymapManager {
public:
    KeymapManager();

    /**
     * Set a key binding.
     * @param action Action name
     * @param binding Key binding string (e.g., "Ctrl+Y")
     */
    void SetBinding(const std::string& action, const std::string& binding);

    // Binding string, or empty if not bound
    std::string GetBinding(const std::string& action) const;

    /**
     * Check if an action's binding was pressed this frame.
     * Modifiers must match exactly.
     */
    bool IsActionTriggered(const std::string& action) const;

    /**
     * Replace all bindings. Invalid binding strings are skipped.
     * @param bindings Map of action -> binding
     */
    void LoadBindings(const std::unordered_map<std::string, std::string>& bindings);

    const std::unordered_map<std::string, std::string>& GetAllBindings() const {
        return m_bindings;
    }

    /**
     * Parse a binding string into a ParsedBinding.
     * @param binding Binding string (e.g., "Ctrl+Z")
     * @return Parsed binding, or std::nullopt if invalid
     */
    std::optional<ParsedBinding> ParseBinding(const std::string& binding) const;

    // Formatted for tooltips, e.g. "Ctrl+Z"
    std::string GetBindingDisplayName(const std::string& binding) const;

private:
    bool IsBindingPressed(const ParsedBinding& parsed) const;

    std::unordered_map<std::string, std::string> m_bindings;

    // Cache parsed bindings
    mutable std::unordered_map<std::string, ParsedBinding> m_parsedCache;
};

} // namespace Kiseki
