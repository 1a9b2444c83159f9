#include "game/gameplay/MatchContext.hpp"

#include <cmath>
#include <iostream>

namespace trisolar::gameplay
{
float DistanceXZ(const glm::vec3& a, const glm::vec3& b)
{
    const float dx = a.x - b.x;
    const float dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

double MatchContext::ElapsedSeconds() const
{
    return static_cast<double>(nowMs - startedAtMs) / 1000.0;
}

PlayerState* MatchContext::FindPlayer(const std::string& playerId)
{
    for (PlayerState& player : players)
    {
        if (player.playerId == playerId)
        {
            return &player;
        }
    }
    return nullptr;
}

const PlayerState* MatchContext::FindPlayer(const std::string& playerId) const
{
    for (const PlayerState& player : players)
    {
        if (player.playerId == playerId)
        {
            return &player;
        }
    }
    return nullptr;
}

PlayerState* MatchContext::FindPlayerByToken(const std::string& sessionToken)
{
    for (PlayerState& player : players)
    {
        if (player.sessionToken == sessionToken)
        {
            return &player;
        }
    }
    return nullptr;
}

DeadBody* MatchContext::FindBody(const std::string& bodyId)
{
    for (DeadBody& body : deadBodies)
    {
        if (body.bodyId == bodyId)
        {
            return &body;
        }
    }
    return nullptr;
}

void MatchContext::Publish(const std::string& name, std::vector<std::string> args)
{
    events.Publish(core::Event{name, std::move(args), nowMs, std::string{}});
}

void MatchContext::PublishTo(const std::string& recipientId, const std::string& name, std::vector<std::string> args)
{
    events.Publish(core::Event{name, std::move(args), nowMs, recipientId});
}

void MatchContext::ReleaseActiveTask(PlayerState& player)
{
    if (player.activeTaskId.empty())
    {
        return;
    }

    const auto it = mazeState.taskStates.find(player.activeTaskId);
    if (it != mazeState.taskStates.end()
        && it->second.completion == maze::TaskCompletion::InProgress
        && it->second.activePlayerId == player.playerId)
    {
        it->second.completion = maze::TaskCompletion::Pending;
        it->second.activePlayerId.clear();
    }
    player.activeTaskId.clear();
}

void MatchContext::HandleDeath(PlayerState& player, const std::string& cause, const std::string& killerId, bool leaveBody)
{
    if (!player.isAlive)
    {
        return;
    }

    ReleaseActiveTask(player);
    player.refillGeneratorId.clear();
    player.refillStartMs = 0;
    player.isAlive = false;
    player.isGhost = true;
    player.health = 0.0F;
    player.hasShield = false;

    if (leaveBody)
    {
        DeadBody body;
        body.bodyId = "body_" + std::to_string(nextBodyId++);
        body.victimId = player.playerId;
        body.victimColor = player.color;
        body.position = player.position;
        body.killedAtMs = nowMs;
        deadBodies.push_back(body);
    }

    player.isUnderground = false;
    player.currentPipeNodeId.clear();

    std::cout << "[Match] " << player.name << " died (" << cause << ")\n";
    Publish("death", {player.playerId, cause, killerId});
}
} // namespace trisolar::gameplay
