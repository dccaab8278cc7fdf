#pragma once

#include "Limits.h"

namespace Kiseki {

/**
 * On-screen rectangle of the rendered display surface.
 */
struct SurfaceRect {
    float x = 0.0f;  // Left edge in screen coordinates
    float y = 0.0f;  // Top edge in screen coordinates
    float w = 0.0f;  // Rendered width
    float h = 0.0f;  // Rendered height
};

/**
 * Integer grid cell. May lie outside the grid; callers bounds-check.
 */
struct CellCoord {
    int x;
    int y;
};

/**
 * Zoom (pixels per cell) and the grid origin offset inside the viewport.
 */
struct ViewTransform {
    float zoom;
    float panX;
    float panY;
};

/**
 * Pure screen/grid transforms. No function here touches editor state.
 */
namespace Coordinates {

/**
 * Map a screen position to the grid cell under it.
 * Cell size is the surface's rendered size divided by the grid size,
 * so the mapping stays exact at any zoom.
 * @param sx, sy Screen position
 * @param surface Rendered surface rectangle
 * @param gridWidth, gridHeight Grid dimensions in cells
 * @return Cell coordinates, (-1, -1) for a degenerate surface
 */
CellCoord ScreenToCell(
    float sx, float sy,
    const SurfaceRect& surface,
    int gridWidth, int gridHeight
);

/**
 * Compute the largest integer zoom that fits the grid inside the viewport
 * (minus padding), and the pan that centers it.
 */
ViewTransform CalculateFit(
    float viewportW, float viewportH,
    int gridWidth, int gridHeight,
    float padding = Limits::DEFAULT_FIT_PADDING
);

/**
 * Pan that centers a surface of the given size, zoom unchanged.
 */
void CenterPan(
    float viewportW, float viewportH,
    int surfaceW, int surfaceH,
    float* panX, float* panY
);

// Integer pixels per cell actually used for the display surface
int DisplayScale(float zoom);

float ClampZoom(float zoom);

/**
 * Zoom by a factor keeping the point under the pointer fixed.
 * @param view Current view
 * @param localX, localY Pointer position relative to the surface origin
 * @param factor Multiplier (1.1 wheel up, 0.9 wheel down)
 */
ViewTransform ZoomAtPoint(
    const ViewTransform& view,
    float localX, float localY,
    float factor
);

} // namespace Coordinates
} // namespace Kiseki
