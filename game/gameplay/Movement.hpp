#pragma once

#include <cstdint>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "engine/physics/Collision.hpp"
#include "game/maze/MazeState.hpp"
#include "game/maze/MazeTypes.hpp"

namespace trisolar::gameplay
{
constexpr float kDefaultPlayerSpeed = 5.0F;

/// One client input sample. Forward is -Z at yaw 0; yaw grows clockwise seen from above.
struct PlayerInput
{
    std::uint32_t seq = 0;
    bool forward = false;
    bool backward = false;
    bool left = false;
    bool right = false;
    float yaw = 0.0F;
    float pitch = 0.0F;
};

/// Solid geometry for one match: the maze walls, the live barrier walls and
/// the pipe tunnel walls. Wall solidity follows MazeState and must be
/// refreshed after any door, wall or barrier change.
class CollisionWorld
{
public:
    void Build(const maze::MazeLayout& layout);
    void Refresh(const maze::MazeLayout& layout, const maze::MazeState& state);

    [[nodiscard]] glm::vec2 Resolve(const glm::vec2& position, float radius, bool underground) const;

    /// Every currently solid surface segment including barriers.
    [[nodiscard]] const std::vector<physics::Segment>& SolidSurfaceSegments() const { return m_solidSurface; }
    [[nodiscard]] const std::vector<physics::Segment>& BarrierSegments() const { return m_barriers; }
    [[nodiscard]] bool IsBuilt() const { return m_built; }

private:
    physics::SegmentGrid m_surface;
    physics::SegmentGrid m_pipes;
    std::vector<std::uint8_t> m_wallSolid;
    std::vector<physics::Segment> m_barriers;
    std::vector<physics::Segment> m_solidSurface;
    bool m_built = false;
};

struct MovementContext
{
    const CollisionWorld* world = nullptr;
    bool underground = false;
    float radius = physics::kPlayerRadius;
};

/// Moves a player by one input sample. The result is clamped to the map and,
/// when a collision world is given, walked in substeps of at most half the
/// radius with a push-out after each. A non-finite yaw leaves the player put.
[[nodiscard]] glm::vec3 ApplyMovement(
    const glm::vec3& position,
    const PlayerInput& input,
    float dtSeconds,
    float speedMultiplier = 1.0F,
    const MovementContext* context = nullptr,
    float baseSpeed = kDefaultPlayerSpeed
);

/// Y-axis rotation facing (sin yaw, 0, -cos yaw).
[[nodiscard]] glm::quat YawToQuaternion(float yaw);

/// Tick-only speed factor under strong gravity: 1 / sqrt(g) when g > 1.
[[nodiscard]] float GravitySlowdown(float gravity);
} // namespace trisolar::gameplay
