#include "game/cosmos/FirePositions.hpp"

namespace trisolar::cosmos
{
const std::array<glm::vec3, kFireSpotCount>& FirePositions()
{
    static const std::array<glm::vec3, kFireSpotCount> kPositions = [] {
        std::array<glm::vec3, kFireSpotCount> positions{};
        ParkMillerRandom rng(kFireSpotSeed);
        for (glm::vec3& position : positions)
        {
            const double x = (rng.Next() - 0.5) * 80.0;
            const double z = (rng.Next() - 0.5) * 80.0;
            position = glm::vec3{static_cast<float>(x), 0.1F, static_cast<float>(z)};
        }
        return positions;
    }();
    return kPositions;
}

bool IsNearFire(float x, float z, float radius)
{
    const float radiusSq = radius * radius;
    for (const glm::vec3& fire : FirePositions())
    {
        const float dx = x - fire.x;
        const float dz = z - fire.z;
        if (dx * dx + dz * dz < radiusSq)
        {
            return true;
        }
    }
    return false;
}
} // namespace trisolar::cosmos
