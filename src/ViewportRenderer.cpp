#include "ViewportRenderer.h"
#include "Coordinates.h"
#include "EditorState.h"
#include "Limits.h"
#include "RasterBuffer.h"
#include <algorithm>
#include <cmath>

namespace Kiseki {

// Source-over onto an opaque destination; the result stays opaque
static Color BlendOver(const Color& dst, const Color& src) {
    if (src.a == 255) return src;
    if (src.a == 0) return dst;

    float a = src.a / 255.0f;
    auto mix = [a](uint8_t s, uint8_t d) {
        return static_cast<uint8_t>(std::lround(s * a + d * (1.0f - a)));
    };
    return Color(mix(src.r, dst.r), mix(src.g, dst.g), mix(src.b, dst.b), 255);
}

ViewportRenderer::ViewportRenderer()
    : m_surfaceWidth(0)
    , m_surfaceHeight(0)
    , m_scale(1)
    , m_maxSurfaceSize(Limits::MAX_SURFACE_DIMENSION)
    , m_revision(0)
{
    Theme theme;
    InitTheme(theme, GetDefaultThemeName());
    m_checker = Kiseki::GetCheckerColors(theme);
}

void ViewportRenderer::SetCheckerColors(const CheckerColors& colors) {
    m_checker = colors;
}

void ViewportRenderer::SetMaxSurfaceSize(int maxSize) {
    m_maxSurfaceSize = std::clamp(maxSize, 1, Limits::MAX_SURFACE_DIMENSION);
}

int ViewportRenderer::SurfaceScale(
    int gridWidth, int gridHeight,
    int displayScale, int maxSize
) {
    int largest = std::max(1, std::max(gridWidth, gridHeight));
    int limit = std::max(1, maxSize / largest);
    return std::max(1, std::min(displayScale, limit));
}

void ViewportRenderer::GetDisplaySize(
    const EditorState& state,
    int* outW, int* outH
) {
    int scale = Coordinates::DisplayScale(state.GetZoom());
    *outW = state.GetWidth() * scale;
    *outH = state.GetHeight() * scale;
}

bool ViewportRenderer::SyncDisplaySize(const EditorState& state) {
    int scale = SurfaceScale(
        state.GetWidth(), state.GetHeight(),
        Coordinates::DisplayScale(state.GetZoom()), m_maxSurfaceSize
    );
    int targetW = state.GetWidth() * scale;
    int targetH = state.GetHeight() * scale;
    m_scale = scale;

    if (targetW == m_surfaceWidth && targetH == m_surfaceHeight) {
        return false;
    }

    m_surfaceWidth = targetW;
    m_surfaceHeight = targetH;
    m_surface.assign(static_cast<size_t>(targetW) * targetH * 4, 0);
    return true;
}

void ViewportRenderer::Render(
    const EditorState& state,
    const RasterBuffer& buffer
) {
    SyncDisplaySize(state);

    const int width = state.GetWidth();
    const int height = state.GetHeight();
    const int s = m_scale;

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const Color& base = ((x + y) % 2 == 0) ? m_checker.even
                                                   : m_checker.odd;
            // GetPixel is transparent outside the buffer
            Color cell = BlendOver(base, buffer.GetPixel(x, y));

            // Solid s x s block per cell
            for (int py = 0; py < s; ++py) {
                size_t row = (static_cast<size_t>(y * s + py) * m_surfaceWidth +
                              static_cast<size_t>(x) * s) * 4;
                for (int px = 0; px < s; ++px) {
                    size_t idx = row + static_cast<size_t>(px) * 4;
                    m_surface[idx + 0] = cell.r;
                    m_surface[idx + 1] = cell.g;
                    m_surface[idx + 2] = cell.b;
                    m_surface[idx + 3] = cell.a;
                }
            }
        }
    }

    m_revision++;
}

void ViewportRenderer::GetTranslation(
    const EditorState& state,
    int* outX, int* outY
) {
    *outX = static_cast<int>(std::floor(state.GetPanX()));
    *outY = static_cast<int>(std::floor(state.GetPanY()));
}

} // namespace Kiseki
