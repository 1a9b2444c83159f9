#include "game/maze/MazeTypes.hpp"

namespace trisolar::maze
{
namespace
{
template <typename T>
void IndexById(const std::vector<T>& items, std::unordered_map<std::string, std::size_t>& index)
{
    index.clear();
    index.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        index.emplace(items[i].id, i);
    }
}

template <typename T>
const T* Lookup(const std::vector<T>& items, const std::unordered_map<std::string, std::size_t>& index, const std::string& id)
{
    const auto it = index.find(id);
    if (it == index.end() || it->second >= items.size())
    {
        return nullptr;
    }
    return &items[it->second];
}
} // namespace

void MazeLayout::BuildLookups()
{
    IndexById(walls, m_wallIndex);
    IndexById(doors, m_doorIndex);
    IndexById(lights, m_lightIndex);
    IndexById(rooms, m_roomIndex);
    IndexById(tasks, m_taskIndex);
    IndexById(oxygenGenerators, m_generatorIndex);
    IndexById(pipeNodes, m_pipeIndex);

    m_roomCellIndex.clear();
    for (std::size_t i = 0; i < rooms.size(); ++i)
    {
        m_roomCellIndex.emplace(rooms[i].row * gridSize + rooms[i].col, i);
    }

    m_cellDoors.clear();
    for (std::size_t i = 0; i < doors.size(); ++i)
    {
        const DoorInfo& door = doors[i];
        m_cellDoors[door.row * gridSize + door.col].push_back(i);
        if (door.side == Side::South && door.row + 1 < gridSize)
        {
            m_cellDoors[(door.row + 1) * gridSize + door.col].push_back(i);
        }
        else if (door.side == Side::East && door.col + 1 < gridSize)
        {
            m_cellDoors[door.row * gridSize + door.col + 1].push_back(i);
        }
    }
}

const WallSegment* MazeLayout::FindWall(const std::string& id) const
{
    return Lookup(walls, m_wallIndex, id);
}

const DoorInfo* MazeLayout::FindDoor(const std::string& id) const
{
    return Lookup(doors, m_doorIndex, id);
}

const LightInfo* MazeLayout::FindLight(const std::string& id) const
{
    return Lookup(lights, m_lightIndex, id);
}

const RoomInfo* MazeLayout::FindRoom(const std::string& id) const
{
    return Lookup(rooms, m_roomIndex, id);
}

const RoomInfo* MazeLayout::RoomAtCell(int row, int col) const
{
    const auto it = m_roomCellIndex.find(row * gridSize + col);
    if (it == m_roomCellIndex.end())
    {
        return nullptr;
    }
    return &rooms[it->second];
}

std::vector<const DoorInfo*> MazeLayout::DoorsTouchingCell(int row, int col) const
{
    std::vector<const DoorInfo*> result;
    const auto it = m_cellDoors.find(row * gridSize + col);
    if (it == m_cellDoors.end())
    {
        return result;
    }
    result.reserve(it->second.size());
    for (const std::size_t index : it->second)
    {
        result.push_back(&doors[index]);
    }
    return result;
}

const TaskStation* MazeLayout::FindTask(const std::string& id) const
{
    return Lookup(tasks, m_taskIndex, id);
}

const OxygenGenerator* MazeLayout::FindGenerator(const std::string& id) const
{
    return Lookup(oxygenGenerators, m_generatorIndex, id);
}

const PipeNode* MazeLayout::FindPipeNode(const std::string& id) const
{
    return Lookup(pipeNodes, m_pipeIndex, id);
}
} // namespace trisolar::maze
