#pragma once

#include "Theme/Themes.h"
#include <cstdint>
#include <vector>

namespace Kiseki {

class EditorState;
class RasterBuffer;

/**
 * Produces the on-screen presentation of the raster buffer.
 * The display surface is width*s x height*s RGBA8 pixels: a checkerboard
 * with the buffer composited on top, nearest-neighbor only. s is
 * DisplayScale(zoom), reduced when needed so neither side exceeds the
 * maximum surface size; the surface is then drawn at its display size
 * (GetDisplaySize) and magnified by the GPU. A GPU texture mirrors it via
 * GetRevision().
 */
class ViewportRenderer {
public:
    ViewportRenderer();

    /**
     * Cap the surface side length, normally to GL_MAX_TEXTURE_SIZE.
     * Values above Limits::MAX_SURFACE_DIMENSION are lowered to it.
     */
    void SetMaxSurfaceSize(int maxSize);
    int GetMaxSurfaceSize() const { return m_maxSurfaceSize; }

    // Checkerboard pair from the active theme
    void SetCheckerColors(const CheckerColors& colors);
    const CheckerColors& GetCheckerColors() const { return m_checker; }

    /**
     * Resize the display surface to match the state's grid and zoom.
     * Storage is reallocated only when the pixel size changes.
     * @return true if the surface size changed
     */
    bool SyncDisplaySize(const EditorState& state);

    /**
     * Redraw the display surface.
     * Only the state's width x height region of the buffer is shown;
     * cells outside the buffer render as bare checkerboard.
     */
    void Render(const EditorState& state, const RasterBuffer& buffer);

    /**
     * Per-cell scale of the surface for a grid and display scale,
     * limited so that neither side exceeds maxSize (never below 1).
     */
    static int SurfaceScale(int gridWidth, int gridHeight,
                            int displayScale, int maxSize);

    /**
     * On-screen size of the grid: width and height times
     * DisplayScale(zoom). Independent of the surface cap.
     */
    static void GetDisplaySize(const EditorState& state, int* outW, int* outH);

    /**
     * Integer translation of the display surface inside the viewport.
     */
    static void GetTranslation(const EditorState& state, int* outX, int* outY);

    int GetSurfaceWidth() const { return m_surfaceWidth; }
    int GetSurfaceHeight() const { return m_surfaceHeight; }
    // Surface pixels per cell (may be below the display scale)
    int GetScale() const { return m_scale; }
    const std::vector<uint8_t>& GetSurfacePixels() const { return m_surface; }

    // Incremented by every Render()
    uint64_t GetRevision() const { return m_revision; }

private:
    std::vector<uint8_t> m_surface;
    int m_surfaceWidth;
    int m_surfaceHeight;
    int m_scale;
    int m_maxSurfaceSize;
    CheckerColors m_checker;
    uint64_t m_revision;
};

} // namespace Kiseki
