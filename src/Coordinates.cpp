#include "Coordinates.h"
#include <algorithm>
#include <cmath>

namespace Kiseki {
namespace Coordinates {

CellCoord ScreenToCell(
    float sx, float sy,
    const SurfaceRect& surface,
    int gridWidth, int gridHeight
) {
    if (surface.w <= 0.0f || surface.h <= 0.0f ||
        gridWidth <= 0 || gridHeight <= 0) {
        return {-1, -1};
    }

    float cellWidth = surface.w / gridWidth;
    float cellHeight = surface.h / gridHeight;

    CellCoord cell;
    cell.x = static_cast<int>(std::floor((sx - surface.x) / cellWidth));
    cell.y = static_cast<int>(std::floor((sy - surface.y) / cellHeight));
    return cell;
}

ViewTransform CalculateFit(
    float viewportW, float viewportH,
    int gridWidth, int gridHeight,
    float padding
) {
    float availableW = std::max(Limits::MIN_FIT_AVAILABLE, viewportW - padding);
    float availableH = std::max(Limits::MIN_FIT_AVAILABLE, viewportH - padding);

    float scaleW = availableW / gridWidth;
    float scaleH = availableH / gridHeight;
    float zoom = ClampZoom(std::floor(std::min(scaleW, scaleH)));

    ViewTransform view;
    view.zoom = zoom;
    view.panX = (viewportW - gridWidth * zoom) / 2.0f;
    view.panY = (viewportH - gridHeight * zoom) / 2.0f;
    return view;
}

void CenterPan(
    float viewportW, float viewportH,
    int surfaceW, int surfaceH,
    float* panX, float* panY
) {
    *panX = (viewportW - surfaceW) / 2.0f;
    *panY = (viewportH - surfaceH) / 2.0f;
}

int DisplayScale(float zoom) {
    return std::max(1, static_cast<int>(std::floor(zoom)));
}

float ClampZoom(float zoom) {
    return std::clamp(zoom, Limits::MIN_ZOOM, Limits::MAX_ZOOM);
}

ViewTransform ZoomAtPoint(
    const ViewTransform& view,
    float localX, float localY,
    float factor
) {
    float newZoom = ClampZoom(view.zoom * factor);
    float ratio = newZoom / view.zoom;

    ViewTransform result;
    result.zoom = newZoom;
    result.panX = view.panX - (localX * ratio - localX);
    result.panY = view.panY - (localY * ratio - localY);
    return result;
}

} // namespace Coordinates
} // namespace Kiseki
