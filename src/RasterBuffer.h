#pragma once

#include "Color.h"
#include <vector>
#include <cstdint>

namespace Kiseki {

/**
 * RasterBuffer is the canonical RGBA8 drawing surface.
 * Pixels are tightly packed rows, 4 bytes per cell, top-left origin.
 * All writes are bounds-checked; out-of-range cells are ignored.
 */
class RasterBuffer {
public:
    RasterBuffer();
    RasterBuffer(int width, int height);

    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }

    bool Contains(int x, int y) const {
        return x >= 0 && x < m_width && y >= 0 && y < m_height;
    }

    // Returns transparent for cells outside the buffer
    Color GetPixel(int x, int y) const;

    // Overwrites the cell (no blending)
    void SetPixel(int x, int y, const Color& color);

    // Fill rectangle, clipped to the buffer
    void FillRect(int x, int y, int w, int h, const Color& color);

    // Clear rectangle to fully transparent, clipped to the buffer
    void ClearRect(int x, int y, int w, int h);

    void Clear();

    /**
     * Change dimensions, keeping the overlapping top-left region.
     * Newly exposed cells are fully transparent. No scaling.
     */
    void Resize(int width, int height);

    /**
     * Replace dimensions and contents at once.
     * @return false (buffer unchanged) if pixels is not width*height*4 bytes
     */
    bool Assign(int width, int height, std::vector<uint8_t> pixels);

    /**
     * Replace contents with a same-sized pixel array.
     * Used to write back whole-buffer edits in one step.
     * @return false (buffer unchanged) on size mismatch
     */
    bool ReplacePixels(std::vector<uint8_t> pixels);

    /**
     * Copy the top-left width x height region.
     * Cells beyond the buffer come back transparent.
     */
    std::vector<uint8_t> CopyRegion(int width, int height) const;

    const std::vector<uint8_t>& GetPixels() const { return m_pixels; }

private:
    size_t IndexOf(int x, int y) const {
        return (static_cast<size_t>(y) * m_width + x) * 4;
    }

    int m_width;
    int m_height;
    std::vector<uint8_t> m_pixels;
};

} // namespace Kiseki
