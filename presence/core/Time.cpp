#include "presence/core/Time.hpp"

#include <algorithm>
#include <chrono>

namespace presence::core
{
Time::Time(double maxDeltaSeconds)
    : m_maxDeltaSeconds(maxDeltaSeconds)
    , m_deltaSeconds(0.0)
    , m_rawDeltaSeconds(0.0)
    , m_totalSeconds(0.0)
    , m_lastFrameSeconds(0.0)
    , m_frameIndex(0)
    , m_firstFrame(true)
{
    SetMaxDeltaSeconds(maxDeltaSeconds);
}

void Time::SetMaxDeltaSeconds(double maxDeltaSeconds)
{
    m_maxDeltaSeconds = std::clamp(maxDeltaSeconds, 1.0 / 240.0, 0.25);
}

void Time::BeginFrame(double nowSeconds)
{
    if (m_firstFrame)
    {
        m_lastFrameSeconds = nowSeconds;
        m_firstFrame = false;
    }

    m_rawDeltaSeconds = nowSeconds - m_lastFrameSeconds;
    m_deltaSeconds = ClampDelta(m_rawDeltaSeconds, m_maxDeltaSeconds);
    m_lastFrameSeconds = nowSeconds;
    m_totalSeconds += m_deltaSeconds;
    ++m_frameIndex;
}

void Time::Reset()
{
    m_deltaSeconds = 0.0;
    m_rawDeltaSeconds = 0.0;
    m_totalSeconds = 0.0;
    m_lastFrameSeconds = 0.0;
    m_frameIndex = 0;
    m_firstFrame = true;
}

double Time::ClampDelta(double rawDeltaSeconds, double maxDeltaSeconds)
{
    return std::clamp(rawDeltaSeconds, 0.0, maxDeltaSeconds);
}

double Time::MonotonicSeconds()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}
} // namespace presence::core
