#include "engine/physics/Collision.hpp"

#include <algorithm>
#include <cmath>

namespace trisolar::physics
{
namespace
{
constexpr float kDegenerateDistanceSq = 0.0001F;
} // namespace

ClosestPoint ClosestPointOnSegment(const glm::vec2& point, const Segment& segment)
{
    const glm::vec2 delta = segment.end - segment.start;
    const float lengthSq = delta.x * delta.x + delta.y * delta.y;

    ClosestPoint result;
    if (lengthSq == 0.0F)
    {
        result.point = segment.start;
    }
    else
    {
        float t = ((point.x - segment.start.x) * delta.x + (point.y - segment.start.y) * delta.y) / lengthSq;
        t = std::clamp(t, 0.0F, 1.0F);
        result.point = segment.start + delta * t;
    }

    const glm::vec2 offset = point - result.point;
    result.distanceSq = offset.x * offset.x + offset.y * offset.y;
    return result;
}

ResolveResult ResolveCircle(const glm::vec2& position, float radius, const std::vector<Segment>& segments, int maxIterations)
{
    ResolveResult result;
    result.position = position;
    const float radiusSq = radius * radius;

    for (int iteration = 0; iteration < maxIterations; ++iteration)
    {
        bool pushed = false;
        ++result.iterations;

        for (const Segment& segment : segments)
        {
            const ClosestPoint closest = ClosestPointOnSegment(result.position, segment);
            if (closest.distanceSq < radiusSq && closest.distanceSq > kDegenerateDistanceSq)
            {
                const float distance = std::sqrt(closest.distanceSq);
                const glm::vec2 normal = (result.position - closest.point) / distance;
                result.position += normal * (radius - distance);
                pushed = true;
            }
            else if (closest.distanceSq <= kDegenerateDistanceSq)
            {
                const glm::vec2 delta = segment.end - segment.start;
                const float length = std::sqrt(delta.x * delta.x + delta.y * delta.y);
                if (length > 0.0F)
                {
                    result.position += glm::vec2{-delta.y / length, delta.x / length} * radius;
                    pushed = true;
                }
            }
        }

        if (!pushed)
        {
            break;
        }
        result.collided = true;
    }

    return result;
}

SegmentGrid::SegmentGrid(int gridSize, float cellSize)
    : m_gridSize(gridSize)
    , m_cellSize(cellSize)
    , m_halfExtent(static_cast<float>(gridSize) * cellSize * 0.5F)
{
}

void SegmentGrid::Clear()
{
    m_segments.clear();
    m_cells.clear();
    m_visitStamp.clear();
    m_currentStamp = 1;
}

int SegmentGrid::CellIndexOf(float coordinate) const
{
    // Off-grid coordinates land one cell outside the grid, non-finite ones
    // two cells out so their neighbourhood is empty.
    const float cell = std::floor((coordinate + m_halfExtent) / m_cellSize);
    if (!std::isfinite(cell))
    {
        return -2;
    }
    if (cell < 0.0F)
    {
        return -1;
    }
    if (cell >= static_cast<float>(m_gridSize))
    {
        return m_gridSize;
    }
    return static_cast<int>(cell);
}

int SegmentGrid::ColumnOf(float x) const
{
    return CellIndexOf(x);
}

int SegmentGrid::RowOf(float z) const
{
    return CellIndexOf(z);
}

void SegmentGrid::Build(std::vector<Segment> segments)
{
    Clear();
    m_segments = std::move(segments);
    m_visitStamp.assign(m_segments.size(), 0U);

    for (std::size_t i = 0; i < m_segments.size(); ++i)
    {
        const Segment& segment = m_segments[i];
        const int colMin = std::max(0, ColumnOf(std::min(segment.start.x, segment.end.x)));
        const int colMax = std::min(m_gridSize - 1, ColumnOf(std::max(segment.start.x, segment.end.x)));
        const int rowMin = std::max(0, RowOf(std::min(segment.start.y, segment.end.y)));
        const int rowMax = std::min(m_gridSize - 1, RowOf(std::max(segment.start.y, segment.end.y)));

        for (int row = rowMin; row <= rowMax; ++row)
        {
            for (int col = colMin; col <= colMax; ++col)
            {
                m_cells[row * m_gridSize + col].push_back(i);
            }
        }
    }
}

void SegmentGrid::QueryNeighbourhood(const glm::vec2& position, std::vector<std::size_t>& outIndices) const
{
    outIndices.clear();
    if (m_segments.empty())
    {
        return;
    }

    ++m_currentStamp;
    if (m_currentStamp == 0)
    {
        std::fill(m_visitStamp.begin(), m_visitStamp.end(), 0U);
        m_currentStamp = 1;
    }

    const int centerRow = RowOf(position.y);
    const int centerCol = ColumnOf(position.x);
    for (int dr = -1; dr <= 1; ++dr)
    {
        for (int dc = -1; dc <= 1; ++dc)
        {
            const int row = centerRow + dr;
            const int col = centerCol + dc;
            if (row < 0 || row >= m_gridSize || col < 0 || col >= m_gridSize)
            {
                continue;
            }

            const auto it = m_cells.find(row * m_gridSize + col);
            if (it == m_cells.end())
            {
                continue;
            }
            for (const std::size_t index : it->second)
            {
                if (m_visitStamp[index] == m_currentStamp)
                {
                    continue;
                }
                m_visitStamp[index] = m_currentStamp;
                outIndices.push_back(index);
            }
        }
    }
}

void SegmentGrid::AppendNearby(const glm::vec2& position, const Filter& filter, std::vector<Segment>& outSegments) const
{
    QueryNeighbourhood(position, m_scratchIndices);
    for (const std::size_t index : m_scratchIndices)
    {
        if (filter && !filter(index))
        {
            continue;
        }
        outSegments.push_back(m_segments[index]);
    }
}

ResolveResult SegmentGrid::ResolveCircleFast(
    const glm::vec2& position,
    float radius,
    const Filter& filter,
    const std::vector<Segment>& extraSegments
) const
{
    m_scratchSegments.clear();
    AppendNearby(position, filter, m_scratchSegments);
    m_scratchSegments.insert(m_scratchSegments.end(), extraSegments.begin(), extraSegments.end());
    return ResolveCircle(position, radius, m_scratchSegments);
}
} // namespace trisolar::physics
