#include "game/gameplay/Movement.hpp"

#include <algorithm>
#include <cmath>

#include <glm/common.hpp>

namespace trisolar::gameplay
{
namespace
{
constexpr float kMinSubstepLength = 0.05F;
constexpr int kMaxMoveSubsteps = 64;
} // namespace

void CollisionWorld::Build(const maze::MazeLayout& layout)
{
    std::vector<physics::Segment> surface;
    surface.reserve(layout.walls.size());
    for (const maze::WallSegment& wall : layout.walls)
    {
        surface.push_back(physics::Segment{wall.start, wall.end});
    }
    m_surface = physics::SegmentGrid(layout.gridSize, layout.cellSize);
    m_surface.Build(std::move(surface));

    std::vector<physics::Segment> pipes;
    pipes.reserve(layout.pipeWalls.size());
    for (const maze::PipeWall& wall : layout.pipeWalls)
    {
        pipes.push_back(physics::Segment{wall.start, wall.end});
    }
    m_pipes = physics::SegmentGrid(layout.gridSize, layout.cellSize);
    m_pipes.Build(std::move(pipes));

    m_wallSolid.assign(layout.walls.size(), 1U);
    m_barriers.clear();
    m_solidSurface.clear();
    m_built = true;
}

void CollisionWorld::Refresh(const maze::MazeLayout& layout, const maze::MazeState& state)
{
    m_wallSolid.resize(layout.walls.size());
    m_solidSurface.clear();
    for (std::size_t i = 0; i < layout.walls.size(); ++i)
    {
        const bool solid = state.IsWallSolid(layout.walls[i]);
        m_wallSolid[i] = solid ? 1U : 0U;
        if (solid)
        {
            m_solidSurface.push_back(physics::Segment{layout.walls[i].start, layout.walls[i].end});
        }
    }

    m_barriers.clear();
    for (const maze::BarrierWall& barrier : state.barrierWalls)
    {
        m_barriers.push_back(physics::Segment{barrier.start, barrier.end});
    }
    m_solidSurface.insert(m_solidSurface.end(), m_barriers.begin(), m_barriers.end());
}

glm::vec2 CollisionWorld::Resolve(const glm::vec2& position, float radius, bool underground) const
{
    if (underground)
    {
        return m_pipes.ResolveCircleFast(position, radius, nullptr, {}).position;
    }

    const auto isSolid = [this](std::size_t index) {
        return index < m_wallSolid.size() && m_wallSolid[index] != 0U;
    };
    return m_surface.ResolveCircleFast(position, radius, isSolid, m_barriers).position;
}

glm::vec3 ApplyMovement(
    const glm::vec3& position,
    const PlayerInput& input,
    float dtSeconds,
    float speedMultiplier,
    const MovementContext* context,
    float baseSpeed
)
{
    if (!std::isfinite(input.yaw) || !std::isfinite(dtSeconds) || !std::isfinite(speedMultiplier))
    {
        return position;
    }

    const float sinYaw = std::sin(input.yaw);
    const float cosYaw = std::cos(input.yaw);

    glm::vec2 move{0.0F};
    if (input.forward)
    {
        move += glm::vec2{sinYaw, -cosYaw};
    }
    if (input.backward)
    {
        move -= glm::vec2{sinYaw, -cosYaw};
    }
    if (input.left)
    {
        move -= glm::vec2{cosYaw, sinYaw};
    }
    if (input.right)
    {
        move += glm::vec2{cosYaw, sinYaw};
    }

    const float length = std::sqrt(move.x * move.x + move.y * move.y);
    if (length > 0.0F)
    {
        move /= length;
    }

    const float speed = baseSpeed * speedMultiplier;
    const glm::vec2 step = move * speed * dtSeconds;
    const float extent = maze::kMapHalfExtent;
    const auto clampToMap = [extent](const glm::vec2& point) {
        return glm::vec2{glm::clamp(point.x, -extent, extent), glm::clamp(point.y, -extent, extent)};
    };

    const bool collides = context != nullptr && context->world != nullptr && context->world->IsBuilt();
    if (!collides)
    {
        const glm::vec2 moved = clampToMap(glm::vec2{position.x, position.z} + step);
        return glm::vec3{moved.x, position.y, moved.y};
    }

    // Every substep is at most half a radius, so the centre never crosses a
    // segment between two push-outs.
    const float stepLength = std::sqrt(step.x * step.x + step.y * step.y);
    const float maxSubstep = std::max(context->radius * 0.5F, kMinSubstepLength);
    const int substeps = std::clamp(static_cast<int>(std::ceil(stepLength / maxSubstep)), 1, kMaxMoveSubsteps);
    const glm::vec2 substep = step / static_cast<float>(substeps);

    glm::vec2 current{position.x, position.z};
    for (int i = 0; i < substeps; ++i)
    {
        current = clampToMap(current + substep);
        current = clampToMap(context->world->Resolve(current, context->radius, context->underground));
    }
    return glm::vec3{current.x, position.y, current.y};
}

glm::quat YawToQuaternion(float yaw)
{
    const float half = -yaw * 0.5F;
    return glm::quat{std::cos(half), 0.0F, std::sin(half), 0.0F};
}

float GravitySlowdown(float gravity)
{
    if (gravity <= 1.0F)
    {
        return 1.0F;
    }
    return 1.0F / std::sqrt(gravity);
}
} // namespace trisolar::gameplay
