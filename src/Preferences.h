#pragma once

#include <string>
#include <unordered_map>

namespace Kiseki {

/**
 * Global application preferences (persisted to user data directory).
 * Stored as preferences.json; missing or invalid values keep defaults.
 */
class Preferences {
public:
    /**
     * Load preferences from disk.
     * Called once at app startup. A missing file leaves defaults in place.
     */
    static void Load();

    /**
     * Save preferences to disk.
     * Refused until Load() has run, so a start-up failure never replaces
     * the user's file with defaults.
     * @return true if the file was written
     */
    static bool Save();

    /**
     * Apply preferences from JSON text over the current values.
     * Fields that are missing or of the wrong type are skipped.
     * @param outError Receives the parse error message (may be null)
     * @return false if the text is not a JSON object
     */
    static bool LoadFromString(const std::string& text, std::string* outError);

    // Serialize current values as indented JSON
    static std::string SaveToString();

    // Restore every value to its default
    static void ResetToDefaults();

    // Full path of preferences.json
    static std::string GetPreferencesPath();

    // Action -> binding string for every bindable action
    static std::unordered_map<std::string, std::string> GetDefaultKeymap();

    // Preference values
    static std::string themeName;  // Active theme name
    static int brushSize;          // Brush size restored at startup
    static std::string lastColor;  // Hex color restored at startup
    static std::unordered_map<std::string, std::string> keymap;

    // Set by Load(); Save() is a no-op while false
    static bool loaded;
};

} // namespace Kiseki
