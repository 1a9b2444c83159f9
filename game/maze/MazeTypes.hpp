#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace trisolar::maze
{
constexpr int kGridSize = 18;
constexpr float kCellSize = 10.0F;
constexpr float kMapHalfExtent = (static_cast<float>(kGridSize) * kCellSize) / 2.0F; // 90
constexpr float kUndergroundY = -10.0F;

/// Cell side. North = -Z, South = +Z, East = +X, West = -X.
enum class Side : std::uint8_t
{
    North,
    South,
    East,
    West
};

enum class WallAxis : std::uint8_t
{
    X,
    Z
};

[[nodiscard]] inline char SideToChar(Side side)
{
    switch (side)
    {
        case Side::North: return 'N';
        case Side::South: return 'S';
        case Side::East: return 'E';
        case Side::West: return 'W';
        default: return '?';
    }
}

struct CellBounds
{
    float minX = 0.0F;
    float maxX = 0.0F;
    float minZ = 0.0F;
    float maxZ = 0.0F;

    [[nodiscard]] glm::vec2 Center() const { return glm::vec2{(minX + maxX) * 0.5F, (minZ + maxZ) * 0.5F}; }
};

[[nodiscard]] inline CellBounds CellToWorld(int row, int col)
{
    CellBounds bounds;
    bounds.minX = static_cast<float>(col) * kCellSize - kMapHalfExtent;
    bounds.maxX = static_cast<float>(col + 1) * kCellSize - kMapHalfExtent;
    bounds.minZ = static_cast<float>(row) * kCellSize - kMapHalfExtent;
    bounds.maxZ = static_cast<float>(row + 1) * kCellSize - kMapHalfExtent;
    return bounds;
}

/// Grid cell containing a world XZ point, clamped to the grid.
[[nodiscard]] inline std::pair<int, int> WorldToCell(float x, float z)
{
    auto clampIndex = [](int value) {
        return value < 0 ? 0 : (value >= kGridSize ? kGridSize - 1 : value);
    };
    const int col = static_cast<int>(std::floor((x + kMapHalfExtent) / kCellSize));
    const int row = static_cast<int>(std::floor((z + kMapHalfExtent) / kCellSize));
    return {clampIndex(row), clampIndex(col)};
}

struct MazeCell
{
    int row = 0;
    int col = 0;
    bool wallNorth = true;
    bool wallSouth = true;
    bool wallEast = true;
    bool wallWest = true;

    [[nodiscard]] int WallCount() const
    {
        return (wallNorth ? 1 : 0) + (wallSouth ? 1 : 0) + (wallEast ? 1 : 0) + (wallWest ? 1 : 0);
    }

    [[nodiscard]] bool HasWall(Side side) const
    {
        switch (side)
        {
            case Side::North: return wallNorth;
            case Side::South: return wallSouth;
            case Side::East: return wallEast;
            case Side::West: return wallWest;
            default: return true;
        }
    }
};

struct WallSegment
{
    std::string id;
    glm::vec2 start{0.0F};
    glm::vec2 end{0.0F};
    bool isDynamic = false;
    bool hasDoor = false;
    std::string doorId;
    bool isBorder = false;
};

struct DoorInfo
{
    std::string id;
    int row = 0;
    int col = 0;
    Side side = Side::South;
    glm::vec3 position{0.0F};
    WallAxis axis = WallAxis::X;
    std::string wallId;
};

struct LightInfo
{
    std::string id;
    int row = 0;
    int col = 0;
    glm::vec3 position{0.0F};
};

struct RoomInfo
{
    std::string id;
    int row = 0;
    int col = 0;
    std::string name;
    glm::vec3 position{0.0F};
    std::optional<std::string> doorId;
};

enum class TaskDifficulty : std::uint8_t
{
    Easy,
    Medium,
    Hard
};

struct TaskStation
{
    std::string id;
    std::string roomId;
    int row = 0;
    int col = 0;
    std::string taskType;
    TaskDifficulty difficulty = TaskDifficulty::Easy;
    std::string displayName;
    glm::vec3 position{0.0F};
};

struct Decoration
{
    std::string id;
    std::string roomId;
    glm::vec3 position{0.0F};
    std::string decoType;
    float scale = 1.0F;
    float rotationY = 0.0F;
};

struct ShelterZone
{
    glm::vec3 position{0.0F};
    float radius = 4.5F;
    std::string roomId;
};

struct OxygenGenerator
{
    std::string id;
    std::string roomId;
    std::string roomName;
    glm::vec3 position{0.0F};
};

struct EmergencyButton
{
    std::string id = "emergency_button";
    glm::vec3 position{0.0F};
};

struct PipeNode
{
    std::string id;
    std::string roomId;
    std::string roomName;
    glm::vec3 surfacePosition{0.0F};
    glm::vec3 undergroundPosition{0.0F};
};

struct PipeConnection
{
    std::string nodeA;
    std::string nodeB;
};

struct PipeWall
{
    glm::vec2 start{0.0F};
    glm::vec2 end{0.0F};
};

/// Immutable result of GenerateMaze. Entities refer to each other by string id;
/// the lookup tables are rebuilt by BuildLookups() after generation.
struct MazeLayout
{
    std::uint32_t seed = 0;
    int gridSize = kGridSize;
    float cellSize = kCellSize;
    std::vector<MazeCell> cells;
    std::vector<WallSegment> walls;
    std::vector<DoorInfo> doors;
    std::vector<LightInfo> lights;
    std::vector<RoomInfo> rooms;
    std::vector<std::string> dynamicWallIds;
    std::vector<TaskStation> tasks;
    std::vector<Decoration> decorations;
    std::vector<ShelterZone> shelterZones;
    std::vector<OxygenGenerator> oxygenGenerators;
    EmergencyButton emergencyButton;
    std::vector<PipeNode> pipeNodes;
    std::vector<PipeConnection> pipeConnections;
    std::vector<PipeWall> pipeWalls;

    void BuildLookups();

    [[nodiscard]] const MazeCell& CellAt(int row, int col) const { return cells[static_cast<std::size_t>(row * gridSize + col)]; }
    [[nodiscard]] const WallSegment* FindWall(const std::string& id) const;
    [[nodiscard]] const DoorInfo* FindDoor(const std::string& id) const;
    [[nodiscard]] const LightInfo* FindLight(const std::string& id) const;
    [[nodiscard]] const RoomInfo* FindRoom(const std::string& id) const;
    [[nodiscard]] const RoomInfo* RoomAtCell(int row, int col) const;
    /// Doors on any edge of the cell, including doors owned by the neighbour.
    [[nodiscard]] std::vector<const DoorInfo*> DoorsTouchingCell(int row, int col) const;
    [[nodiscard]] const TaskStation* FindTask(const std::string& id) const;
    [[nodiscard]] const OxygenGenerator* FindGenerator(const std::string& id) const;
    [[nodiscard]] const PipeNode* FindPipeNode(const std::string& id) const;

private:
    std::unordered_map<std::string, std::size_t> m_wallIndex;
    std::unordered_map<std::string, std::size_t> m_doorIndex;
    std::unordered_map<std::string, std::size_t> m_lightIndex;
    std::unordered_map<std::string, std::size_t> m_roomIndex;
    std::unordered_map<int, std::size_t> m_roomCellIndex;
    std::unordered_map<int, std::vector<std::size_t>> m_cellDoors;
    std::unordered_map<std::string, std::size_t> m_taskIndex;
    std::unordered_map<std::string, std::size_t> m_generatorIndex;
    std::unordered_map<std::string, std::size_t> m_pipeIndex;
};
} // namespace trisolar::maze
