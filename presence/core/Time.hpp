#pragma once

namespace presence::core
{
class Time
{
public:
    static constexpr double kDefaultMaxDeltaSeconds = 0.05;

    explicit Time(double maxDeltaSeconds = kDefaultMaxDeltaSeconds);

    void SetMaxDeltaSeconds(double maxDeltaSeconds);

    void BeginFrame(double nowSeconds);
    void Reset();

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double RawDeltaSeconds() const { return m_rawDeltaSeconds; }
    [[nodiscard]] double MaxDeltaSeconds() const { return m_maxDeltaSeconds; }
    [[nodiscard]] double TotalSeconds() const { return m_totalSeconds; }
    [[nodiscard]] double LastFrameSeconds() const { return m_lastFrameSeconds; }
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }

    // Clamp an elapsed interval to [0, maxDeltaSeconds].
    [[nodiscard]] static double ClampDelta(double rawDeltaSeconds, double maxDeltaSeconds);

    // Monotonic seconds since an unspecified epoch.
    [[nodiscard]] static double MonotonicSeconds();

private:
    double m_maxDeltaSeconds;
    double m_deltaSeconds;
    double m_rawDeltaSeconds;
    double m_totalSeconds;
    double m_lastFrameSeconds;
    unsigned long long m_frameIndex;
    bool m_firstFrame;
};
} // namespace presence::core
