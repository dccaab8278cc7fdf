#include "RasterBuffer.h"
#include "Limits.h"
#include <algorithm>
#include <cstring>

namespace Kiseki {

RasterBuffer::RasterBuffer()
    : RasterBuffer(Limits::DEFAULT_GRID_DIMENSION,
                   Limits::DEFAULT_GRID_DIMENSION)
{
}

RasterBuffer::RasterBuffer(int width, int height)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height))
{
    m_pixels.assign(static_cast<size_t>(m_width) * m_height * 4, 0);
}

Color RasterBuffer::GetPixel(int x, int y) const {
    if (!Contains(x, y)) {
        return Color::Transparent();
    }

    size_t idx = IndexOf(x, y);
    return Color(
        m_pixels[idx + 0],
        m_pixels[idx + 1],
        m_pixels[idx + 2],
        m_pixels[idx + 3]
    );
}

void RasterBuffer::SetPixel(int x, int y, const Color& color) {
    if (!Contains(x, y)) return;

    size_t idx = IndexOf(x, y);
    m_pixels[idx + 0] = color.r;
    m_pixels[idx + 1] = color.g;
    m_pixels[idx + 2] = color.b;
    m_pixels[idx + 3] = color.a;
}

void RasterBuffer::FillRect(int x, int y, int w, int h, const Color& color) {
    int startX = std::max(0, x);
    int startY = std::max(0, y);
    int endX = std::min(m_width, x + w);
    int endY = std::min(m_height, y + h);

    for (int py = startY; py < endY; ++py) {
        for (int px = startX; px < endX; ++px) {
            SetPixel(px, py, color);
        }
    }
}

void RasterBuffer::ClearRect(int x, int y, int w, int h) {
    FillRect(x, y, w, h, Color::Transparent());
}

void RasterBuffer::Clear() {
    std::fill(m_pixels.begin(), m_pixels.end(), 0);
}

void RasterBuffer::Resize(int width, int height) {
    width = std::max(0, width);
    height = std::max(0, height);
    if (width == m_width && height == m_height) {
        return;
    }

    std::vector<uint8_t> resized = CopyRegion(width, height);
    m_width = width;
    m_height = height;
    m_pixels = std::move(resized);
}

bool RasterBuffer::Assign(int width, int height, std::vector<uint8_t> pixels) {
    if (width < 0 || height < 0 ||
        pixels.size() != static_cast<size_t>(width) * height * 4) {
        return false;
    }

    m_width = width;
    m_height = height;
    m_pixels = std::move(pixels);
    return true;
}

bool RasterBuffer::ReplacePixels(std::vector<uint8_t> pixels) {
    if (pixels.size() != m_pixels.size()) {
        return false;
    }
    m_pixels = std::move(pixels);
    return true;
}

std::vector<uint8_t> RasterBuffer::CopyRegion(int width, int height) const {
    width = std::max(0, width);
    height = std::max(0, height);
    std::vector<uint8_t> region(static_cast<size_t>(width) * height * 4, 0);

    // Copy the overlapping rows
    int copyW = std::min(width, m_width);
    int copyH = std::min(height, m_height);
    for (int y = 0; y < copyH; ++y) {
        memcpy(
            region.data() + static_cast<size_t>(y) * width * 4,
            m_pixels.data() + IndexOf(0, y),
            static_cast<size_t>(copyW) * 4
        );
    }

    return region;
}

} // namespace Kiseki
