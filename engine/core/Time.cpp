#include "engine/core/Time.hpp"

#include <algorithm>
#include <cmath>

namespace trisolar::core
{
namespace
{
constexpr double kMinFixedDelta = 1.0 / 240.0;
constexpr double kMaxFixedDelta = 1.0 / 10.0;
constexpr int kMaxCatchUpTicks = 5;
} // namespace

Time::Time(double fixedDeltaSeconds)
    : m_fixedDeltaSeconds(std::clamp(fixedDeltaSeconds, kMinFixedDelta, kMaxFixedDelta))
    , m_deltaSeconds(0.0)
    , m_droppedSeconds(0.0)
    , m_lastFrameSeconds(0.0)
    , m_accumulator(0.0)
    , m_tickIndex(0)
    , m_firstFrame(true)
{
}

void Time::SetFixedDeltaSeconds(double fixedDeltaSeconds)
{
    m_fixedDeltaSeconds = std::clamp(fixedDeltaSeconds, kMinFixedDelta, kMaxFixedDelta);
    m_accumulator = std::min(m_accumulator, m_fixedDeltaSeconds * 2.0);
}

void Time::SetTickRate(int ticksPerSecond)
{
    SetFixedDeltaSeconds(1.0 / static_cast<double>(std::max(1, ticksPerSecond)));
}

void Time::BeginFrame(double nowSeconds)
{
    if (m_firstFrame)
    {
        m_lastFrameSeconds = nowSeconds;
        m_firstFrame = false;
    }

    const double rawDelta = nowSeconds - m_lastFrameSeconds;
    m_deltaSeconds = std::clamp(rawDelta, 0.0, m_fixedDeltaSeconds * kMaxCatchUpTicks);
    if (rawDelta > m_deltaSeconds)
    {
        m_droppedSeconds += rawDelta - m_deltaSeconds;
    }
    m_lastFrameSeconds = nowSeconds;
    m_accumulator += m_deltaSeconds;
}

bool Time::ShouldRunFixedStep() const
{
    return m_accumulator >= m_fixedDeltaSeconds;
}

void Time::ConsumeFixedStep()
{
    m_accumulator -= m_fixedDeltaSeconds;
    if (m_accumulator < 0.0)
    {
        m_accumulator = 0.0;
    }
    ++m_tickIndex;
}

std::int64_t Time::FixedDeltaMilliseconds() const
{
    return static_cast<std::int64_t>(std::llround(m_fixedDeltaSeconds * 1000.0));
}
} // namespace trisolar::core
