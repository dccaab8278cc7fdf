#include "GlTexture.h"

#ifdef __APPLE__
#include <OpenGL/gl3.h>
#else
#include <GL/gl.h>
#endif

namespace Kiseki {

GlTexture::GlTexture()
    : m_texture(0)
    , m_width(0)
    , m_height(0)
    , m_revision(0)
    , m_hasRevision(false)
{
}

GlTexture::~GlTexture() {
    Release();
}

void GlTexture::Upload(const uint8_t* pixels, int width, int height,
                       uint64_t revision) {
    if (!pixels || width <= 0 || height <= 0) {
        return;
    }

    bool sizeChanged = width != m_width || height != m_height;
    if (!sizeChanged && m_hasRevision && revision == m_revision &&
        m_texture != 0) {
        return;
    }

    if (m_texture == 0) {
        GLuint texId;
        glGenTextures(1, &texId);
        m_texture = texId;
        sizeChanged = true;

        glBindTexture(GL_TEXTURE_2D, m_texture);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    } else {
        glBindTexture(GL_TEXTURE_2D, m_texture);
    }

    // Rows are tightly packed
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

    if (sizeChanged) {
        glTexImage2D(
            GL_TEXTURE_2D, 0, GL_RGBA,
            width, height, 0,
            GL_RGBA, GL_UNSIGNED_BYTE, pixels
        );
    } else {
        glTexSubImage2D(
            GL_TEXTURE_2D, 0, 0, 0,
            width, height,
            GL_RGBA, GL_UNSIGNED_BYTE, pixels
        );
    }
    glBindTexture(GL_TEXTURE_2D, 0);

    m_width = width;
    m_height = height;
    m_revision = revision;
    m_hasRevision = true;
}

void GlTexture::Release() {
    if (m_texture != 0) {
        GLuint texId = m_texture;
        glDeleteTextures(1, &texId);
        m_texture = 0;
    }
    m_width = 0;
    m_height = 0;
    m_hasRevision = false;
}

} // namespace Kiseki
