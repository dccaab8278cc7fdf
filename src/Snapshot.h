#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace Kiseki {

class RasterBuffer;

/**
 * Immutable copy of a RasterBuffer's dimensions and pixels.
 * Copies share the same pixel storage; nothing can modify it after
 * construction.
 */
class Snapshot {
public:
    Snapshot();
    Snapshot(int width, int height, std::vector<uint8_t> pixels);

    /**
     * Capture the full contents of a buffer.
     */
    static Snapshot Capture(const RasterBuffer& buffer);

    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }
    const std::vector<uint8_t>& GetPixels() const { return *m_pixels; }

    // True if the pixel array matches the stored dimensions
    bool IsValid() const;

    /**
     * Write this snapshot into a buffer, replacing its size and contents.
     * @return false if the snapshot is not valid (buffer unchanged)
     */
    bool RestoreInto(RasterBuffer& buffer) const;

    bool operator==(const Snapshot& other) const;
    bool operator!=(const Snapshot& other) const { return !(*this == other); }

private:
    int m_width;
    int m_height;
    std::shared_ptr<const std::vector<uint8_t>> m_pixels;
};

} // namespace Kiseki
