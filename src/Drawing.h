#pragma once

#include "Color.h"
#include <functional>
#include <optional>

namespace Kiseki {

class RasterBuffer;

/**
 * What a brush stamp writes into the buffer.
 */
enum class StampMode {
    Paint,  // Overwrite with the brush color
    Erase   // Clear to fully transparent
};

/**
 * Rectangle in cell coordinates.
 */
struct StampRect {
    int x, y, w, h;

    bool IsEmpty() const { return w <= 0 || h <= 0; }
};

/**
 * Stateless raster algorithms operating on a RasterBuffer.
 */
namespace Drawing {

/**
 * Footprint of a size x size brush centered on (cx, cy) on a
 * bufferWidth x bufferHeight grid. Even sizes are biased to the top-left
 * (offset = floor(size / 2)).
 * The origin is clamped to (0, 0) and the extent to
 * min(size, bufferWidth - x), so a brush pressed against the top or left
 * edge keeps its full size. A footprint lying wholly outside the grid
 * is empty.
 */
StampRect ComputeStampRect(
    int cx, int cy, int size,
    int bufferWidth, int bufferHeight
);

/**
 * Stamp a square brush.
 * @return true if any cell was written (false for a zero-area clip)
 */
bool Stamp(
    RasterBuffer& buffer,
    int cx, int cy, int size,
    StampMode mode, const Color& color
);

/**
 * Walk the Bresenham line from (x0, y0) to (x1, y1), both inclusive.
 * Consecutive visited cells are 8-connected.
 * @param visit Called once per cell, in order from start to end
 */
void RasterizeLine(
    int x0, int y0, int x1, int y1,
    const std::function<void(int, int)>& visit
);

// Stamp the brush on every cell of the line
void StrokeLine(
    RasterBuffer& buffer,
    int x0, int y0, int x1, int y1,
    int size, StampMode mode, const Color& color
);

/**
 * 4-connected flood fill of the region sharing the seed's exact RGBA.
 * Works on a copy of the buffer and writes it back in one step.
 * Breadth-first with an explicit queue; never recurses.
 * @return Number of cells filled (0 if the seed is out of bounds or
 *         already has newColor)
 */
size_t FloodFill(
    RasterBuffer& buffer,
    int seedX, int seedY,
    const Color& newColor
);

/**
 * Eyedropper sample.
 * @return Opaque version of the pixel color, or std::nullopt for
 *         transparent or out-of-bounds pixels
 */
std::optional<Color> SampleColor(const RasterBuffer& buffer, int x, int y);

} // namespace Drawing
} // namespace Kiseki
