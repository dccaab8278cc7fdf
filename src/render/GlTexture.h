#pragma once

#include <imgui.h>
#include <cstdint>

namespace Kiseki {

/**
 * OpenGL texture mirroring the viewport display surface.
 * Sampled with GL_NEAREST so scaled cells keep hard edges.
 * Owns the GL name; must be destroyed while the GL context is current.
 */
class GlTexture {
public:
    GlTexture();
    ~GlTexture();

    GlTexture(const GlTexture&) = delete;
    GlTexture& operator=(const GlTexture&) = delete;

    /**
     * Upload RGBA8 pixels, reallocating storage if the size changed.
     * @param revision Source revision; uploads are skipped when it
     *                 matches the last uploaded revision and size
     */
    void Upload(const uint8_t* pixels, int width, int height,
                uint64_t revision);

    // Delete the GL texture
    void Release();

    bool IsValid() const { return m_texture != 0; }
    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }

    ImTextureID GetImTextureID() const {
        return (ImTextureID)(intptr_t)m_texture;
    }

private:
    unsigned int m_texture;
    int m_width;
    int m_height;
    uint64_t m_revision;
    bool m_hasRevision;
};

} // namespace Kiseki
