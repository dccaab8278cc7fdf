#include "Color.h"
#include <cctype>
#include <cstdio>

namespace Kiseki {

static bool IsHexDigits(const std::string& str) {
    for (char c : str) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

static Color FromHexDigits(const std::string& str) {
    uint32_t val = 0;
    sscanf(str.c_str(), "%x", &val);

    if (str.length() == 6) {
        // RRGGBB
        return Color(
            static_cast<uint8_t>((val >> 16) & 0xFF),
            static_cast<uint8_t>((val >> 8) & 0xFF),
            static_cast<uint8_t>(val & 0xFF),
            255
        );
    }

    // RRGGBBAA
    return Color(
        static_cast<uint8_t>((val >> 24) & 0xFF),
        static_cast<uint8_t>((val >> 16) & 0xFF),
        static_cast<uint8_t>((val >> 8) & 0xFF),
        static_cast<uint8_t>(val & 0xFF)
    );
}

Color Color::FromHex(const std::string& hex) {
    if (hex.empty() || hex[0] != '#') {
        return Color(0, 0, 0, 255);
    }

    std::string str = hex.substr(1);
    if ((str.length() != 6 && str.length() != 8) || !IsHexDigits(str)) {
        return Color(0, 0, 0, 255);
    }

    return FromHexDigits(str);
}

std::optional<Color> Color::ParseHex(const std::string& text) {
    // Trim surrounding whitespace
    size_t start = 0;
    size_t end = text.length();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        start++;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }

    std::string str = text.substr(start, end - start);
    if (!str.empty() && str[0] == '#') {
        str = str.substr(1);
    }

    if ((str.length() != 6 && str.length() != 8) || !IsHexDigits(str)) {
        return std::nullopt;
    }

    return FromHexDigits(str);
}

std::string Color::ToHex(bool includeAlpha) const {
    char buf[16];
    if (includeAlpha) {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", r, g, b, a);
    } else {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    }
    return buf;
}

} // namespace Kiseki
