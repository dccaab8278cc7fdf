#include "Time.h"
#include <SDL3/SDL.h>
#include <algorithm>

namespace Platform {

FrameClock::FrameClock(float maxDelta)
    : m_maxDelta(std::max(0.0f, maxDelta))
    , m_lastTicksNs(0)
    , m_started(false)
{
}

float FrameClock::Tick() {
    uint64_t now = SDL_GetTicksNS();
    if (!m_started) {
        m_started = true;
        m_lastTicksNs = now;
        return 0.0f;
    }

    float delta = static_cast<float>(now - m_lastTicksNs) / 1e9f;
    m_lastTicksNs = now;
    return std::min(delta, m_maxDelta);
}

void FrameClock::Reset() {
    m_started = false;
}

} // namespace Platform
