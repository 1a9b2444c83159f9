#include "engine/physics/RayOcclusion.hpp"

#include <cmath>

namespace trisolar::physics
{
namespace
{
constexpr float kParallelEpsilon = 1e-8F;
} // namespace

bool RayIntersectsSegment(const glm::vec2& origin, const glm::vec2& direction, const Segment& segment)
{
    const glm::vec2 segmentDelta = segment.end - segment.start;
    const float denom = direction.x * segmentDelta.y - direction.y * segmentDelta.x;
    if (std::abs(denom) < kParallelEpsilon)
    {
        return false;
    }

    const glm::vec2 toStart = segment.start - origin;
    const float t = (toStart.x * segmentDelta.y - toStart.y * segmentDelta.x) / denom;
    const float u = (toStart.x * direction.y - toStart.y * direction.x) / denom;
    return t > kRayMinDistance && u >= 0.0F && u <= 1.0F;
}

bool IsRayBlocked(const glm::vec2& origin, const glm::vec2& direction, const std::vector<Segment>& segments)
{
    for (const Segment& segment : segments)
    {
        if (RayIntersectsSegment(origin, direction, segment))
        {
            return true;
        }
    }
    return false;
}
} // namespace trisolar::physics
