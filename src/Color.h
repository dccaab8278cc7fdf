#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace Kiseki {

// ============================================================================
// Color utilities
// ============================================================================

/**
 * RGBA color with 8-bit channels.
 * Supports hex string parsing and conversion.
 */
struct Color {
    uint8_t r, g, b, a;

    Color() : r(0), g(0), b(0), a(255) {}
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : r(r), g(g), b(b), a(a) {}

    static Color Transparent() { return Color(0, 0, 0, 0); }

    // Parse from hex string "#RRGGBB" or "#RRGGBBAA" (black on failure)
    static Color FromHex(const std::string& hex);

    /**
     * Strictly validate user-entered hex text.
     * Accepts 6 or 8 hex digits with an optional leading '#'.
     * @return Parsed color, or std::nullopt if the text is not valid
     */
    static std::optional<Color> ParseHex(const std::string& text);

    // Convert to lowercase hex string
    std::string ToHex(bool includeAlpha = true) const;

    Color WithAlpha(uint8_t alpha) const { return Color(r, g, b, alpha); }

    bool IsOpaque() const { return a == 255; }

    // Packed for ImGui draw lists (IM_COL32 layout)
    uint32_t ToU32() const {
        return (static_cast<uint32_t>(a) << 24) |
               (static_cast<uint32_t>(b) << 16) |
               (static_cast<uint32_t>(g) << 8) |
               static_cast<uint32_t>(r);
    }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }
};

} // namespace Kiseki
