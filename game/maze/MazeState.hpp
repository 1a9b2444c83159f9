#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "game/maze/MazeTypes.hpp"

namespace trisolar::maze
{
struct DoorState
{
    bool isOpen = false;
    bool isLocked = false;
    std::string lockedBy;              ///< Player id of the locker, empty when unlocked
    std::int64_t lockedAtMs = 0;
    std::int64_t lockExpiresAtMs = 0;  ///< 0 = held until explicitly released
};

enum class TaskCompletion : std::uint8_t
{
    Pending,
    InProgress,
    Completed
};

[[nodiscard]] const char* TaskCompletionToText(TaskCompletion completion);

struct TaskState
{
    TaskCompletion completion = TaskCompletion::Pending;
    std::string activePlayerId;
    std::string completedByPlayerId;
};

struct PipeLockState
{
    bool isLocked = false;
    std::string lockedBy;
    std::int64_t lockExpiresAtMs = 0;
};

/// Temporary wall placed by the Barrier power. Always solid.
struct BarrierWall
{
    std::string wallId;
    std::string ownerId;
    glm::vec2 start{0.0F};
    glm::vec2 end{0.0F};
    std::int64_t expiresAtMs = 0;
};

/// Mutable overlay on top of a MazeLayout. Ordered maps keep snapshot order stable.
struct MazeState
{
    std::map<std::string, DoorState> doorStates;
    std::map<std::string, bool> lightStates;        ///< true = on
    std::map<std::string, bool> dynamicWallStates;  ///< true = closed
    std::vector<BarrierWall> barrierWalls;
    std::map<std::string, TaskState> taskStates;
    std::map<std::string, PipeLockState> pipeLocks;
    std::map<std::string, std::int64_t> disabledGenerators; ///< generator id -> re-enable time
    float shipOxygen = 100.0F;

    /// Border walls always block. Dynamic walls block unless explicitly open.
    /// Door walls block unless the door is open and unlocked.
    [[nodiscard]] bool IsWallSolid(const WallSegment& wall) const;
    [[nodiscard]] bool IsDoorPassable(const std::string& doorId) const;
    /// A room is sealed when every door on its edges is shut.
    [[nodiscard]] bool IsRoomSealed(const MazeLayout& layout, const RoomInfo& room) const;
    [[nodiscard]] bool IsGeneratorDisabled(const std::string& generatorId) const;
    [[nodiscard]] bool IsPipeLocked(const std::string& nodeId) const;

    [[nodiscard]] std::size_t CompletedTaskCount() const;
};

[[nodiscard]] MazeState CreateInitialMazeState(const MazeLayout& layout);
} // namespace trisolar::maze
