#pragma once

#include <vector>

#include <glm/vec2.hpp>

#include "engine/physics/Collision.hpp"

namespace trisolar::physics
{
/// Hits closer than this along the ray are ignored.
constexpr float kRayMinDistance = 0.1F;

/// Parametric ray (origin + t * direction) against segment (A + u * (B - A)).
/// True when t > kRayMinDistance and u lies in [0, 1]. Parallel rays never hit.
[[nodiscard]] bool RayIntersectsSegment(const glm::vec2& origin, const glm::vec2& direction, const Segment& segment);

/// True as soon as any segment blocks the ray.
[[nodiscard]] bool IsRayBlocked(const glm::vec2& origin, const glm::vec2& direction, const std::vector<Segment>& segments);
} // namespace trisolar::physics
