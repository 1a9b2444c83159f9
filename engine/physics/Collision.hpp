#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

#include <glm/vec2.hpp>

namespace trisolar::physics
{
constexpr float kPlayerRadius = 0.4F;
constexpr int kCollisionIterations = 3;

/// Line segment in the XZ plane (x, z).
struct Segment
{
    glm::vec2 start{0.0F};
    glm::vec2 end{0.0F};
};

struct ResolveResult
{
    glm::vec2 position{0.0F};
    bool collided = false;
    int iterations = 0;
};

struct ClosestPoint
{
    glm::vec2 point{0.0F};
    float distanceSq = 0.0F;
};

[[nodiscard]] ClosestPoint ClosestPointOnSegment(const glm::vec2& point, const Segment& segment);

/// Iterative circle push-out against every segment. Stops early once an
/// iteration moves nothing. A centre lying on a segment is pushed along its
/// left-hand normal by the full radius.
[[nodiscard]] ResolveResult ResolveCircle(
    const glm::vec2& position,
    float radius,
    const std::vector<Segment>& segments,
    int maxIterations = kCollisionIterations
);

/// Uniform-grid bucket index over a fixed segment list. Segments never move;
/// callers pass a filter to skip segments that are currently passable.
class SegmentGrid
{
public:
    using Filter = std::function<bool(std::size_t segmentIndex)>;

    SegmentGrid() = default;
    SegmentGrid(int gridSize, float cellSize);

    void Build(std::vector<Segment> segments);
    void Clear();

    [[nodiscard]] const std::vector<Segment>& Segments() const { return m_segments; }
    [[nodiscard]] int GridSize() const { return m_gridSize; }
    [[nodiscard]] float CellSize() const { return m_cellSize; }

    /// Indices of segments bucketed in the 3x3 cells around the position,
    /// each reported once.
    void QueryNeighbourhood(const glm::vec2& position, std::vector<std::size_t>& outIndices) const;

    /// Appends the neighbourhood segments accepted by the filter.
    void AppendNearby(const glm::vec2& position, const Filter& filter, std::vector<Segment>& outSegments) const;

    /// Fast path of ResolveCircle that only tests the neighbourhood segments.
    [[nodiscard]] ResolveResult ResolveCircleFast(
        const glm::vec2& position,
        float radius,
        const Filter& filter,
        const std::vector<Segment>& extraSegments
    ) const;

private:
    [[nodiscard]] int CellIndexOf(float coordinate) const;
    [[nodiscard]] int ColumnOf(float x) const;
    [[nodiscard]] int RowOf(float z) const;

    int m_gridSize = 0;
    float m_cellSize = 1.0F;
    float m_halfExtent = 0.0F;
    std::vector<Segment> m_segments;
    std::unordered_map<int, std::vector<std::size_t>> m_cells;

    mutable std::vector<std::size_t> m_scratchIndices;
    mutable std::vector<Segment> m_scratchSegments;
    mutable std::vector<std::uint32_t> m_visitStamp;
    mutable std::uint32_t m_currentStamp = 1;
};
} // namespace trisolar::physics
