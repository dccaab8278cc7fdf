#include "Drawing.h"
#include "RasterBuffer.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <queue>
#include <vector>

namespace Kiseki {
namespace Drawing {

StampRect ComputeStampRect(
    int cx, int cy, int size,
    int bufferWidth, int bufferHeight
) {
    size = std::max(1, size);
    int half = size / 2;
    int px = cx - half;
    int py = cy - half;

    // A footprint that misses the grid entirely stamps nothing
    if (px + size <= 0 || py + size <= 0) {
        return StampRect{0, 0, 0, 0};
    }

    // Clamp the origin into the grid, then trim only at the far edge
    StampRect rect;
    rect.x = std::max(0, px);
    rect.y = std::max(0, py);
    rect.w = std::max(0, std::min(size, bufferWidth - rect.x));
    rect.h = std::max(0, std::min(size, bufferHeight - rect.y));
    return rect;
}

bool Stamp(
    RasterBuffer& buffer,
    int cx, int cy, int size,
    StampMode mode, const Color& color
) {
    StampRect rect = ComputeStampRect(
        cx, cy, size, buffer.GetWidth(), buffer.GetHeight()
    );
    if (rect.IsEmpty()) {
        return false;
    }

    if (mode == StampMode::Erase) {
        buffer.ClearRect(rect.x, rect.y, rect.w, rect.h);
    } else {
        buffer.FillRect(rect.x, rect.y, rect.w, rect.h, color);
    }
    return true;
}

void RasterizeLine(
    int x0, int y0, int x1, int y1,
    const std::function<void(int, int)>& visit
) {
    const int dx = std::abs(x1 - x0);
    const int dy = std::abs(y1 - y0);
    const int sx = (x0 < x1) ? 1 : -1;
    const int sy = (y0 < y1) ? 1 : -1;
    int err = dx - dy;

    while (true) {
        visit(x0, y0);
        if (x0 == x1 && y0 == y1) break;

        int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x0 += sx;
        }
        if (e2 < dx) {
            err += dx;
            y0 += sy;
        }
    }
}

void StrokeLine(
    RasterBuffer& buffer,
    int x0, int y0, int x1, int y1,
    int size, StampMode mode, const Color& color
) {
    RasterizeLine(x0, y0, x1, y1, [&](int x, int y) {
        Stamp(buffer, x, y, size, mode, color);
    });
}

static bool PixelMatches(const std::vector<uint8_t>& pixels, size_t idx,
                         const Color& color) {
    return pixels[idx + 0] == color.r && pixels[idx + 1] == color.g &&
           pixels[idx + 2] == color.b && pixels[idx + 3] == color.a;
}

static void WritePixel(std::vector<uint8_t>& pixels, size_t idx,
                       const Color& color) {
    pixels[idx + 0] = color.r;
    pixels[idx + 1] = color.g;
    pixels[idx + 2] = color.b;
    pixels[idx + 3] = color.a;
}

size_t FloodFill(
    RasterBuffer& buffer,
    int seedX, int seedY,
    const Color& newColor
) {
    if (!buffer.Contains(seedX, seedY)) {
        return 0;
    }

    const int width = buffer.GetWidth();
    const int height = buffer.GetHeight();

    Color target = buffer.GetPixel(seedX, seedY);
    if (target == newColor) {
        return 0;  // Already that color, nothing to do
    }

    std::vector<uint8_t> pixels = buffer.GetPixels();
    size_t filled = 0;

    // Cells are recolored when queued, so each is queued at most once
    std::queue<int> queue;
    int seed = seedY * width + seedX;
    WritePixel(pixels, static_cast<size_t>(seed) * 4, newColor);
    queue.push(seed);

    while (!queue.empty()) {
        int cell = queue.front();
        queue.pop();
        filled++;

        int x = cell % width;
        int y = cell / width;

        auto tryPush = [&](int nx, int ny) {
            if (nx < 0 || nx >= width || ny < 0 || ny >= height) return;
            int next = ny * width + nx;
            size_t idx = static_cast<size_t>(next) * 4;
            if (PixelMatches(pixels, idx, target)) {
                WritePixel(pixels, idx, newColor);
                queue.push(next);
            }
        };
        tryPush(x - 1, y);
        tryPush(x + 1, y);
        tryPush(x, y - 1);
        tryPush(x, y + 1);
    }

    if (!buffer.ReplacePixels(std::move(pixels))) {
        return 0;
    }
    return filled;
}

std::optional<Color> SampleColor(const RasterBuffer& buffer, int x, int y) {
    if (!buffer.Contains(x, y)) {
        return std::nullopt;
    }

    Color pixel = buffer.GetPixel(x, y);
    if (pixel.a == 0) {
        return std::nullopt;  // Transparent background is not a color
    }
    return pixel.WithAlpha(255);
}

} // namespace Drawing
} // namespace Kiseki
