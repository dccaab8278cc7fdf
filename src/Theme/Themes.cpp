#include "Themes.h"

namespace Kiseki {

// ============================================================================
// Theme registry
// ============================================================================

static const std::string kDefaultTheme = "Dark";

static const std::vector<std::string> kThemeNames = {
    "Dark",
    "Light"
};

std::vector<std::string> GetAvailableThemes() {
    return kThemeNames;
}

bool IsValidTheme(const std::string& name) {
    for (const auto& t : kThemeNames) {
        if (t == name) return true;
    }
    return false;
}

const std::string& GetDefaultThemeName() {
    return kDefaultTheme;
}

CheckerColors GetCheckerColors(const Theme& theme) {
    return theme.checker;
}

// ============================================================================
// Theme definitions
// ============================================================================

/**
 * Initializes the Dark theme.
 * Slate tones with a sky-blue accent.
 */
static void InitDarkTheme(Theme& theme) {
    theme.viewportBackground = Color::FromHex("#0f172a");
    theme.checker.even = Color::FromHex("#1e293b");
    theme.checker.odd = Color::FromHex("#475569");
    theme.brushOutline = Color(255, 255, 255, 200);
    theme.surfaceBorder = Color::FromHex("#334155");

    theme.accent = Color::FromHex("#38bdf8");
    theme.textColor = Color::FromHex("#f1f5f9");
    theme.toastError = Color::FromHex("#f87171");
    theme.toastInfo = Color::FromHex("#38bdf8");
    theme.isLight = false;
}

/**
 * Initializes the Light theme.
 */
static void InitLightTheme(Theme& theme) {
    theme.viewportBackground = Color::FromHex("#e2e8f0");
    theme.checker.even = Color::FromHex("#ffffff");
    theme.checker.odd = Color::FromHex("#94a3b8");
    theme.brushOutline = Color(15, 23, 42, 200);
    theme.surfaceBorder = Color::FromHex("#cbd5e1");

    theme.accent = Color::FromHex("#0284c7");
    theme.textColor = Color::FromHex("#0f172a");
    theme.toastError = Color::FromHex("#dc2626");
    theme.toastInfo = Color::FromHex("#0284c7");
    theme.isLight = true;
}

void InitTheme(Theme& theme, const std::string& name) {
    if (name == "Light") {
        theme.name = "Light";
        InitLightTheme(theme);
    } else {
        theme.name = kDefaultTheme;
        InitDarkTheme(theme);
    }
}

} // namespace Kiseki
