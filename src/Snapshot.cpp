#include "Snapshot.h"
#include "RasterBuffer.h"

namespace Kiseki {

Snapshot::Snapshot()
    : m_width(0)
    , m_height(0)
    , m_pixels(std::make_shared<const std::vector<uint8_t>>())
{
}

Snapshot::Snapshot(int width, int height, std::vector<uint8_t> pixels)
    : m_width(width)
    , m_height(height)
    , m_pixels(std::make_shared<const std::vector<uint8_t>>(std::move(pixels)))
{
}

Snapshot Snapshot::Capture(const RasterBuffer& buffer) {
    return Snapshot(buffer.GetWidth(), buffer.GetHeight(), buffer.GetPixels());
}

bool Snapshot::IsValid() const {
    return m_width > 0 && m_height > 0 &&
           m_pixels->size() == static_cast<size_t>(m_width) * m_height * 4;
}

bool Snapshot::RestoreInto(RasterBuffer& buffer) const {
    if (!IsValid()) {
        return false;
    }
    return buffer.Assign(m_width, m_height, *m_pixels);
}

bool Snapshot::operator==(const Snapshot& other) const {
    if (m_width != other.m_width || m_height != other.m_height) {
        return false;
    }
    return m_pixels == other.m_pixels || *m_pixels == *other.m_pixels;
}

} // namespace Kiseki
