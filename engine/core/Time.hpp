#pragma once

#include <cstdint>

namespace trisolar::core
{
/// Fixed-step accumulator for the server tick. Wall-clock deltas are clamped
/// so a stalled process runs at most a few catch-up ticks.
class Time
{
public:
    explicit Time(double fixedDeltaSeconds = 1.0 / 20.0);

    void SetFixedDeltaSeconds(double fixedDeltaSeconds);
    void SetTickRate(int ticksPerSecond);

    void BeginFrame(double nowSeconds);
    bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] std::int64_t FixedDeltaMilliseconds() const;
    /// Wall-clock time dropped by the catch-up clamp since construction.
    [[nodiscard]] double DroppedSeconds() const { return m_droppedSeconds; }
    [[nodiscard]] unsigned long long TickIndex() const { return m_tickIndex; }

private:
    double m_fixedDeltaSeconds;
    double m_deltaSeconds;
    double m_droppedSeconds;
    double m_lastFrameSeconds;
    double m_accumulator;
    unsigned long long m_tickIndex;
    bool m_firstFrame;
};
} // namespace trisolar::core
