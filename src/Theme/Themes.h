#pragma once

#include <string>
#include <vector>

#include "../Color.h"

namespace Kiseki {

// ============================================================================
// Theme structure
// ============================================================================

/**
 * Checkerboard pair drawn behind transparent cells.
 * Cell (x, y) uses even when (x + y) is even, odd otherwise.
 */
struct CheckerColors {
    Color even;
    Color odd;
};

/**
 * Defines the visual appearance of the application.
 * Contains colors for the canvas viewport and UI components.
 */
struct Theme {
    std::string name;

    // Canvas colors
    Color viewportBackground;  // Area around the pixel grid
    CheckerColors checker;     // Transparency pattern
    Color brushOutline;        // Brush cursor outline
    Color surfaceBorder;       // Frame around the pixel grid

    // UI accents
    Color accent;
    Color textColor;
    Color toastError;
    Color toastInfo;

    bool isLight = false;  // Selects the ImGui base style
};

// ============================================================================
// Theme registry
// ============================================================================

/**
 * Returns list of all available theme names.
 * @return Vector of theme name strings.
 */
std::vector<std::string> GetAvailableThemes();

/**
 * Initializes theme with predefined colors by name.
 * Unknown names fall back to the default theme.
 * @param theme Theme struct to initialize.
 * @param name Theme name (Dark, Light).
 */
void InitTheme(Theme& theme, const std::string& name);

// Checkerboard pair of a theme
CheckerColors GetCheckerColors(const Theme& theme);

bool IsValidTheme(const std::string& name);

/**
 * Returns the default theme name.
 * @return "Dark"
 */
const std::string& GetDefaultThemeName();

} // namespace Kiseki
