#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/core/EventBus.hpp"
#include "game/cosmos/CosmicScenario.hpp"
#include "game/cosmos/SunSimulation.hpp"
#include "game/gameplay/MatchTuning.hpp"
#include "game/gameplay/Movement.hpp"
#include "game/gameplay/PlayerState.hpp"
#include "game/maze/MazeState.hpp"
#include "game/maze/MazeTypes.hpp"

namespace trisolar::gameplay
{
struct DeadBody
{
    std::string bodyId;
    std::string victimId;
    std::string victimColor;
    glm::vec3 position{0.0F};
    std::int64_t killedAtMs = 0;
    bool reported = false;
};

/// Positions of every living player at one instant. Oracle extrapolates from these.
struct PositionSample
{
    std::int64_t atMs = 0;
    std::map<std::string, glm::vec3> positions;
};

/// All mutable state of one match. Owned by MatchRoom and handed to each
/// subsystem by reference for the duration of a tick or an action.
struct MatchContext
{
    maze::MazeLayout layout;
    maze::MazeState mazeState;
    CollisionWorld collision;
    std::vector<PlayerState> players;
    std::vector<DeadBody> deadBodies;
    MatchTuning tuning;
    cosmos::CosmicScenario scenario;
    cosmos::SunSimulation simulation;
    cosmos::EraInfo era;
    core::EventBus events;
    std::mt19937 rng;
    std::deque<PositionSample> positionHistory;

    std::int64_t nowMs = 0;
    std::int64_t startedAtMs = 0;
    std::int64_t lastSampleMs = 0;
    int nextBodyId = 0;

    [[nodiscard]] double ElapsedSeconds() const;

    [[nodiscard]] PlayerState* FindPlayer(const std::string& playerId);
    [[nodiscard]] const PlayerState* FindPlayer(const std::string& playerId) const;
    [[nodiscard]] PlayerState* FindPlayerByToken(const std::string& sessionToken);
    [[nodiscard]] DeadBody* FindBody(const std::string& bodyId);

    void Publish(const std::string& name, std::vector<std::string> args);
    void PublishTo(const std::string& recipientId, const std::string& name, std::vector<std::string> args);

    /// Turns a living player into a ghost. Drops a reportable corpse unless
    /// the player was ejected, cancels their task and refill, publishes `death`.
    void HandleDeath(PlayerState& player, const std::string& cause, const std::string& killerId, bool leaveBody = true);

    /// Returns an in-progress task of the player to pending.
    void ReleaseActiveTask(PlayerState& player);
};

[[nodiscard]] float DistanceXZ(const glm::vec3& a, const glm::vec3& b);
} // namespace trisolar::gameplay
