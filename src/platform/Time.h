#pragma once

#include <cstdint>

namespace Platform {

/**
 * Measures the time between frames on SDL's monotonic clock.
 * The first Tick() after construction or Reset() returns 0, and long
 * stalls (window drags, breakpoints) are reported as at most
 * maxDelta seconds so timed UI such as toasts does not skip ahead.
 */
class FrameClock {
public:
    explicit FrameClock(float maxDelta = 0.25f);

    // Seconds since the previous Tick()
    float Tick();

    // Forget the previous frame
    void Reset();

    float GetMaxDelta() const { return m_maxDelta; }

private:
    float m_maxDelta;
    uint64_t m_lastTicksNs;
    bool m_started;
};

} // namespace Platform
