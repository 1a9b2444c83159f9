#pragma once

#include <array>
#include <cstdint>

#include <glm/vec3.hpp>

namespace trisolar::cosmos
{
constexpr int kFireSpotCount = 12;
constexpr std::int64_t kFireSpotSeed = 42;
constexpr float kFireDamageRadius = 2.5F;

/// Park-Miller LCG (multiplier 16807) mapped to [0, 1). Clients use the same
/// generator to draw the fires, so the sequence must not change.
class ParkMillerRandom
{
public:
    explicit ParkMillerRandom(std::int64_t seed)
        : m_state(seed)
    {
    }

    double Next()
    {
        m_state = (m_state * 16807) % 2147483647;
        return static_cast<double>(m_state - 1) / 2147483646.0;
    }

private:
    std::int64_t m_state;
};

/// The 12 inferno fire spots, spread over +-40 around the map centre.
[[nodiscard]] const std::array<glm::vec3, kFireSpotCount>& FirePositions();

/// True when (x, z) lies within the damage radius of any fire spot.
[[nodiscard]] bool IsNearFire(float x, float z, float radius = kFireDamageRadius);
} // namespace trisolar::cosmos
