#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>

#include "game/cosmos/CosmicScenario.hpp"
#include "game/gameplay/MatchContext.hpp"
#include "game/gameplay/PlayerState.hpp"
#include "game/maze/MazeState.hpp"

namespace trisolar::gameplay
{
enum class MatchPhase : std::uint8_t
{
    Lobby,
    Playing,
    Meeting,
    Ended
};

enum class MeetingStage : std::uint8_t
{
    Discussion,
    Voting,
    Result
};

[[nodiscard]] inline const char* MatchPhaseToText(MatchPhase phase)
{
    switch (phase)
    {
        case MatchPhase::Lobby: return "lobby";
        case MatchPhase::Playing: return "playing";
        case MatchPhase::Meeting: return "meeting";
        case MatchPhase::Ended: return "ended";
        default: return "lobby";
    }
}

[[nodiscard]] inline const char* MeetingStageToText(MeetingStage stage)
{
    switch (stage)
    {
        case MeetingStage::Discussion: return "discussion";
        case MeetingStage::Voting: return "voting";
        case MeetingStage::Result: return "result";
        default: return "discussion";
    }
}

/// Public view of one player. Role and power stay private to their owner.
struct PlayerSnapshot
{
    std::string playerId;
    std::string name;
    std::string color;
    glm::vec3 position{0.0F};
    glm::quat rotation{1.0F, 0.0F, 0.0F, 0.0F};
    bool isAlive = true;
    bool isGhost = false;
    bool isInvisible = false;
    bool hasShield = false;
    bool isImpermeable = false;
    bool isUnderground = false;
    bool inShelter = false;
    bool powerActive = false;
    bool connected = true;
    float speedMultiplier = 1.0F;
    float health = 100.0F;
    DamageSource damageSource = DamageSource::None;
    std::uint32_t lastProcessedInput = 0;
    std::string activeTaskId;
};

struct DoorSnapshot
{
    std::string doorId;
    bool isOpen = false;
    bool isLocked = false;
};

/// Everything a client renders for one tick. Built once per tick and never
/// modified afterwards.
struct MatchSnapshot
{
    std::uint32_t seq = 0;
    std::int64_t serverTimeMs = 0;
    MatchPhase phase = MatchPhase::Lobby;

    // --- Sky ---
    cosmos::Era era = cosmos::Era::Stable;
    float gravity = 1.0F;
    std::string eraDescription;
    float eraSecondsRemaining = 0.0F;
    std::array<glm::vec3, 3> sunPositions{};
    bool isBinary = false;

    // --- Station ---
    float shipOxygen = 100.0F;
    std::vector<DoorSnapshot> doors;
    std::vector<std::pair<std::string, bool>> lights;        ///< true = on
    std::vector<std::pair<std::string, bool>> dynamicWalls;  ///< true = closed
    std::vector<maze::BarrierWall> barriers;
    std::vector<std::pair<std::string, maze::TaskCompletion>> tasks;
    std::vector<std::string> lockedPipes;
    std::vector<std::string> disabledGenerators;
    int tasksCompleted = 0;
    int totalTasks = 0;

    std::vector<PlayerSnapshot> players;
    std::vector<DeadBody> bodies;

    // --- Meeting ---
    MeetingStage meetingStage = MeetingStage::Discussion;
    std::int64_t meetingStageEndMs = 0;
};
} // namespace trisolar::gameplay
