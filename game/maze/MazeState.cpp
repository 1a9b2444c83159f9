#include "game/maze/MazeState.hpp"

namespace trisolar::maze
{
const char* TaskCompletionToText(TaskCompletion completion)
{
    switch (completion)
    {
        case TaskCompletion::Pending: return "pending";
        case TaskCompletion::InProgress: return "in_progress";
        case TaskCompletion::Completed: return "completed";
        default: return "pending";
    }
}

bool MazeState::IsWallSolid(const WallSegment& wall) const
{
    if (wall.isBorder)
    {
        return true;
    }

    if (wall.isDynamic)
    {
        const auto it = dynamicWallStates.find(wall.id);
        return it == dynamicWallStates.end() || it->second;
    }

    if (wall.hasDoor && !wall.doorId.empty())
    {
        return !IsDoorPassable(wall.doorId);
    }

    return true;
}

bool MazeState::IsDoorPassable(const std::string& doorId) const
{
    const auto it = doorStates.find(doorId);
    return it != doorStates.end() && it->second.isOpen && !it->second.isLocked;
}

bool MazeState::IsRoomSealed(const MazeLayout& layout, const RoomInfo& room) const
{
    for (const DoorInfo* door : layout.DoorsTouchingCell(room.row, room.col))
    {
        if (IsDoorPassable(door->id))
        {
            return false;
        }
    }
    return true;
}

bool MazeState::IsGeneratorDisabled(const std::string& generatorId) const
{
    return disabledGenerators.count(generatorId) > 0;
}

bool MazeState::IsPipeLocked(const std::string& nodeId) const
{
    const auto it = pipeLocks.find(nodeId);
    return it != pipeLocks.end() && it->second.isLocked;
}

std::size_t MazeState::CompletedTaskCount() const
{
    std::size_t count = 0;
    for (const auto& [id, task] : taskStates)
    {
        if (task.completion == TaskCompletion::Completed)
        {
            ++count;
        }
    }
    return count;
}

MazeState CreateInitialMazeState(const MazeLayout& layout)
{
    MazeState state;
    for (const DoorInfo& door : layout.doors)
    {
        state.doorStates.emplace(door.id, DoorState{});
    }
    for (const LightInfo& light : layout.lights)
    {
        state.lightStates.emplace(light.id, true);
    }
    for (const std::string& wallId : layout.dynamicWallIds)
    {
        state.dynamicWallStates.emplace(wallId, true);
    }
    for (const TaskStation& task : layout.tasks)
    {
        state.taskStates.emplace(task.id, TaskState{});
    }
    for (const PipeNode& node : layout.pipeNodes)
    {
        state.pipeLocks.emplace(node.id, PipeLockState{});
    }
    state.shipOxygen = 100.0F;
    return state;
}
} // namespace trisolar::maze
