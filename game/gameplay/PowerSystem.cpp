#include "game/gameplay/PowerSystem.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <sstream>
#include <type_traits>

namespace trisolar::gameplay
{
namespace
{
constexpr float kNecromancerHeal = 50.0F;
constexpr float kBarrierLength = 4.0F;
constexpr float kBarrierDistance = 2.0F;
constexpr float kMinAimDistance = 0.01F;
constexpr std::int64_t kBarrierLifetimeMs = 10000;
constexpr std::size_t kMaxBarriersPerOwner = 3;
constexpr std::size_t kOracleUpcomingPhases = 2;

bool Contains(const std::vector<std::string>& values, const std::string& value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

void RemoveValue(std::vector<std::string>& values, const std::string& value)
{
    values.erase(std::remove(values.begin(), values.end(), value), values.end());
}

/// Adds the value when absent, removes it when present. Returns true when added.
bool ToggleMembership(std::vector<std::string>& values, const std::string& value)
{
    if (Contains(values, value))
    {
        RemoveValue(values, value);
        return false;
    }
    values.push_back(value);
    return true;
}

glm::vec3 ClampToMap(const glm::vec3& position, float margin)
{
    const float limit = maze::kMapHalfExtent - margin;
    return glm::vec3{
        std::clamp(position.x, -limit, limit),
        position.y,
        std::clamp(position.z, -limit, limit),
    };
}

std::string FormatFloat(float value)
{
    std::ostringstream stream;
    stream.precision(2);
    stream << std::fixed << value;
    return stream.str();
}

bool IsLivingTarget(const PlayerState* target, const PlayerState& caster)
{
    return target != nullptr && target != &caster && target->isAlive && !target->isGhost;
}

void RefreshCollision(MatchContext& match)
{
    match.collision.Refresh(match.layout, match.mazeState);
}
} // namespace

// --- Powers ---

namespace powers
{
ActionResult Metamorph::Apply(PowerContext& context) const
{
    PlayerState& caster = context.caster;
    PlayerState* target = context.match.FindPlayer(context.request.targetId);
    if (!IsLivingTarget(target, caster))
    {
        return ActionResult::Fail(reason::kNoTarget);
    }
    if (target->power == PowerType::None || target->power == PowerType::Metamorph)
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }
    if (DistanceXZ(caster.position, target->position) > context.definition.targetRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    caster.originalColor = caster.color;
    caster.originalPower = caster.power;
    caster.originalUsesLeft = caster.powerUsesLeft;
    caster.originalCharges = caster.powerCharges;

    // The copied power starts fresh: one use or charge, no cooldown.
    caster.color = target->color;
    caster.power = target->power;
    caster.powerUsesLeft = 1;
    caster.powerCharges = 1;
    caster.nextChargeAtMs = 0;
    caster.powerCooldownEnd = 0;
    caster.isMetamorphed = true;
    caster.metamorphEndMs = context.match.nowMs + context.definition.durationMs;

    context.match.Publish("metamorph", {caster.playerId, target->playerId, PowerToId(caster.power)});
    return ActionResult::Ok();
}

void Metamorph::Revert(PowerContext& context) const
{
    PlayerState& caster = context.caster;
    caster.color = caster.originalColor;
    caster.power = caster.originalPower;
    caster.powerUsesLeft = caster.originalUsesLeft;
    caster.powerCharges = caster.originalCharges;
    caster.nextChargeAtMs = 0;
    caster.powerCooldownEnd = context.match.nowMs + context.definition.cooldownMs;
    caster.isMetamorphed = false;
    caster.metamorphEndMs = 0;
    context.match.Publish("metamorph_ended", {caster.playerId});
}

ActionResult Invisible::Apply(PowerContext& context) const
{
    context.caster.isInvisible = true;
    return ActionResult::Ok();
}

void Invisible::Revert(PowerContext& context) const
{
    context.caster.isInvisible = false;
}

ActionResult Teleport::Apply(PowerContext& context) const
{
    PlayerState& caster = context.caster;
    if (caster.isUnderground)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    glm::vec3 destination{0.0F};
    if (context.request.point.has_value())
    {
        destination = *context.request.point;
    }
    else
    {
        const std::vector<maze::RoomInfo>& rooms = context.match.layout.rooms;
        if (rooms.empty())
        {
            return ActionResult::Fail(reason::kNoTarget);
        }
        std::uniform_int_distribution<std::size_t> pick(0, rooms.size() - 1);
        destination = rooms[pick(context.match.rng)].position;
    }
    destination.y = 0.0F;
    caster.position = ClampToMap(destination, context.match.tuning.playerRadius);

    context.match.Publish("teleport", {caster.playerId, FormatFloat(caster.position.x), FormatFloat(caster.position.z)});
    return ActionResult::Ok();
}

void Teleport::Revert(PowerContext&) const
{
}

ActionResult Medic::Apply(PowerContext& context) const
{
    MatchContext& match = context.match;
    PlayerState& caster = context.caster;
    const std::string& targetId = context.request.targetId.empty() ? caster.playerId : context.request.targetId;
    PlayerState* target = match.FindPlayer(targetId);
    if (target == nullptr)
    {
        return ActionResult::Fail(reason::kNoTarget);
    }
    if (target != &caster && DistanceXZ(caster.position, target->position) > context.definition.targetRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    if (target->isGhost)
    {
        target->isAlive = true;
        target->isGhost = false;
        target->health = match.tuning.reviveHealth;
        target->damageSource = DamageSource::None;
        target->possessTargetId.clear();
        target->possessInput.reset();
        target->possessEndMs = 0;
        match.deadBodies.erase(
            std::remove_if(match.deadBodies.begin(), match.deadBodies.end(), [&](const DeadBody& body) {
                return body.victimId == target->playerId;
            }),
            match.deadBodies.end());
        std::cout << "[Power] " << caster.name << " revived " << target->name << "\n";
        match.Publish("revive", {caster.playerId, target->playerId});
        return ActionResult::Ok();
    }

    if (!target->isAlive)
    {
        return ActionResult::Fail(reason::kNoTarget);
    }
    target->hasShield = true;
    match.Publish("shield", {caster.playerId, target->playerId});
    return ActionResult::Ok();
}

void Medic::Revert(PowerContext&) const
{
}

ActionResult TimeController::Apply(PowerContext& context) const
{
    PlayerState& caster = context.caster;
    caster.frozenPlayers.clear();
    for (PlayerState& other : context.match.players)
    {
        if (!IsLivingTarget(&other, caster) || !other.frozenBy.empty())
        {
            continue;
        }
        other.frozenBy = caster.playerId;
        other.RefreshSpeed();
        caster.frozenPlayers.push_back(other.playerId);
    }
    context.match.Publish("time_frozen", {caster.playerId, std::to_string(caster.frozenPlayers.size())});
    return ActionResult::Ok();
}

void TimeController::Revert(PowerContext& context) const
{
    PlayerState& caster = context.caster;
    for (const std::string& id : caster.frozenPlayers)
    {
        PlayerState* other = context.match.FindPlayer(id);
        if (other != nullptr && other->frozenBy == caster.playerId)
        {
            other->frozenBy.clear();
            other->RefreshSpeed();
        }
    }
    caster.frozenPlayers.clear();
    context.match.Publish("time_resumed", {caster.playerId});
}

ActionResult Hacker::Apply(PowerContext& context) const
{
    context.caster.hackerLockedDoors.clear();
    context.caster.hackerToggledLights.clear();
    context.caster.hackerToggledWalls.clear();
    return ActionResult::Ok();
}

void Hacker::Revert(PowerContext& context) const
{
    MatchContext& match = context.match;
    PlayerState& caster = context.caster;
    maze::MazeState& state = match.mazeState;

    for (const std::string& doorId : caster.hackerLockedDoors)
    {
        const auto it = state.doorStates.find(doorId);
        // A sabotage may have replaced the lock; that one carries its own expiry.
        if (it != state.doorStates.end() && it->second.lockedBy == caster.playerId && it->second.lockExpiresAtMs == 0)
        {
            it->second.isLocked = false;
            it->second.lockedBy.clear();
            it->second.lockedAtMs = 0;
        }
    }
    for (const std::string& lightId : caster.hackerToggledLights)
    {
        const auto it = state.lightStates.find(lightId);
        if (it != state.lightStates.end())
        {
            it->second = !it->second;
        }
    }
    for (const std::string& wallId : caster.hackerToggledWalls)
    {
        const auto it = state.dynamicWallStates.find(wallId);
        if (it != state.dynamicWallStates.end())
        {
            it->second = !it->second;
        }
    }

    const bool geometryChanged = !caster.hackerLockedDoors.empty() || !caster.hackerToggledWalls.empty();
    caster.hackerLockedDoors.clear();
    caster.hackerToggledLights.clear();
    caster.hackerToggledWalls.clear();
    if (geometryChanged)
    {
        RefreshCollision(match);
    }
}

ActionResult Flash::Apply(PowerContext& context) const
{
    PlayerState& caster = context.caster;
    caster.flashSavedSpeed = caster.baseSpeedMultiplier;
    caster.baseSpeedMultiplier *= 3.0F;
    caster.RefreshSpeed();
    return ActionResult::Ok();
}

void Flash::Revert(PowerContext& context) const
{
    PlayerState& caster = context.caster;
    caster.baseSpeedMultiplier = caster.flashSavedSpeed;
    caster.RefreshSpeed();
}

ActionResult Necromancer::Apply(PowerContext& context) const
{
    MatchContext& match = context.match;
    PlayerState& caster = context.caster;

    auto bodyIt = match.deadBodies.end();
    if (!context.request.bodyId.empty())
    {
        bodyIt = std::find_if(match.deadBodies.begin(), match.deadBodies.end(), [&](const DeadBody& body) {
            return body.bodyId == context.request.bodyId;
        });
    }
    else
    {
        float bestDistance = context.definition.targetRange;
        for (auto it = match.deadBodies.begin(); it != match.deadBodies.end(); ++it)
        {
            const float distance = DistanceXZ(caster.position, it->position);
            if (!it->reported && distance <= bestDistance)
            {
                bestDistance = distance;
                bodyIt = it;
            }
        }
    }

    if (bodyIt == match.deadBodies.end() || bodyIt->reported)
    {
        return ActionResult::Fail(reason::kNoTarget);
    }
    if (DistanceXZ(caster.position, bodyIt->position) > context.definition.targetRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    const std::string bodyId = bodyIt->bodyId;
    match.deadBodies.erase(bodyIt);
    caster.health = std::min(caster.maxHealth, caster.health + kNecromancerHeal);
    match.Publish("corpse_consumed", {caster.playerId, bodyId});
    return ActionResult::Ok();
}

void Necromancer::Revert(PowerContext&) const
{
}

ActionResult MindController::Apply(PowerContext& context) const
{
    PlayerState& caster = context.caster;
    PlayerState* target = context.match.FindPlayer(context.request.targetId);
    if (!IsLivingTarget(target, caster))
    {
        return ActionResult::Fail(reason::kNoTarget);
    }
    if (DistanceXZ(caster.position, target->position) > context.definition.targetRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    caster.mindControlTargetId = target->playerId;
    caster.mindControlInput.reset();
    context.match.Publish("mind_control", {caster.playerId, target->playerId});
    return ActionResult::Ok();
}

void MindController::Revert(PowerContext& context) const
{
    context.caster.mindControlTargetId.clear();
    context.caster.mindControlInput.reset();
}

ActionResult Barrier::Apply(PowerContext& context) const
{
    MatchContext& match = context.match;
    PlayerState& caster = context.caster;
    if (caster.isUnderground)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const glm::vec2 casterXZ{caster.position.x, caster.position.z};
    glm::vec2 forward{std::sin(caster.yaw), -std::cos(caster.yaw)};
    glm::vec2 center = casterXZ + forward * kBarrierDistance;
    if (context.request.point.has_value())
    {
        center = glm::vec2{context.request.point->x, context.request.point->z};
        const glm::vec2 aim = center - casterXZ;
        const float aimLength = std::sqrt(aim.x * aim.x + aim.y * aim.y);
        if (aimLength > kMinAimDistance)
        {
            forward = aim / aimLength;
        }
    }
    // The wall spans across the aim direction.
    const glm::vec2 right{-forward.y, forward.x};

    std::vector<maze::BarrierWall>& barriers = match.mazeState.barrierWalls;
    const auto owned = static_cast<std::size_t>(std::count_if(barriers.begin(), barriers.end(), [&](const maze::BarrierWall& wall) {
        return wall.ownerId == caster.playerId;
    }));
    if (owned >= kMaxBarriersPerOwner)
    {
        // Barriers are appended in creation order, so the first owned one is the oldest.
        const auto oldest = std::find_if(barriers.begin(), barriers.end(), [&](const maze::BarrierWall& wall) {
            return wall.ownerId == caster.playerId;
        });
        barriers.erase(oldest);
    }

    maze::BarrierWall wall;
    wall.wallId = "barrier_" + caster.playerId + "_" + std::to_string(caster.barrierNextId++);
    wall.ownerId = caster.playerId;
    wall.start = center - right * (kBarrierLength * 0.5F);
    wall.end = center + right * (kBarrierLength * 0.5F);
    wall.expiresAtMs = match.nowMs + kBarrierLifetimeMs;
    barriers.push_back(wall);
    RefreshCollision(match);

    match.Publish("barrier_placed", {caster.playerId, wall.wallId});
    return ActionResult::Ok();
}

void Barrier::Revert(PowerContext&) const
{
}

ActionResult Impermeable::Apply(PowerContext& context) const
{
    context.caster.isImpermeable = true;
    return ActionResult::Ok();
}

void Impermeable::Revert(PowerContext& context) const
{
    context.caster.isImpermeable = false;
}

ActionResult Oracle::Apply(PowerContext& context) const
{
    MatchContext& match = context.match;
    PlayerState& caster = context.caster;

    std::vector<std::string> args;
    for (const OraclePrediction& prediction : PredictPositions(match, caster.playerId, match.tuning.oraclePredictSeconds))
    {
        args.push_back("player:" + prediction.playerId + ":" + FormatFloat(prediction.predicted.x) + ":"
                       + FormatFloat(prediction.predicted.z));
    }

    const double elapsed = match.ElapsedSeconds();
    double startsIn = match.scenario.EraAt(elapsed).secondsRemaining;
    for (const cosmos::CosmicPhase& phase : match.scenario.UpcomingPhases(elapsed, kOracleUpcomingPhases))
    {
        args.push_back(std::string{"era:"} + cosmos::EraToText(phase.era) + ":" + FormatFloat(static_cast<float>(startsIn)));
        startsIn += phase.endSec - phase.startSec;
    }

    match.PublishTo(caster.playerId, "oracle_prediction", std::move(args));
    return ActionResult::Ok();
}

void Oracle::Revert(PowerContext&) const
{
}
} // namespace powers

std::optional<Power> MakePower(PowerType type)
{
    switch (type)
    {
        case PowerType::Metamorph: return Power{powers::Metamorph{}};
        case PowerType::Invisible: return Power{powers::Invisible{}};
        case PowerType::Teleport: return Power{powers::Teleport{}};
        case PowerType::Medic: return Power{powers::Medic{}};
        case PowerType::TimeController: return Power{powers::TimeController{}};
        case PowerType::Hacker: return Power{powers::Hacker{}};
        case PowerType::Flash: return Power{powers::Flash{}};
        case PowerType::Necromancer: return Power{powers::Necromancer{}};
        case PowerType::MindController: return Power{powers::MindController{}};
        case PowerType::Barrier: return Power{powers::Barrier{}};
        case PowerType::Impermeable: return Power{powers::Impermeable{}};
        case PowerType::Oracle: return Power{powers::Oracle{}};
        case PowerType::None:
        default: return std::nullopt;
    }
}

PowerKind KindOf(const Power& power)
{
    return std::visit([](const auto& alternative) { return std::decay_t<decltype(alternative)>::kKind; }, power);
}

std::uint32_t MutatedFieldsOf(const Power& power)
{
    return std::visit([](const auto& alternative) { return std::decay_t<decltype(alternative)>::kMutates; }, power);
}

std::vector<OraclePrediction> PredictPositions(const MatchContext& context, const std::string& casterId, float horizonSeconds)
{
    std::vector<OraclePrediction> predictions;
    const PositionSample* oldest = context.positionHistory.empty() ? nullptr : &context.positionHistory.front();

    for (const PlayerState& player : context.players)
    {
        if (player.playerId == casterId || !player.isAlive || player.isGhost)
        {
            continue;
        }

        OraclePrediction prediction;
        prediction.playerId = player.playerId;
        prediction.current = player.position;
        prediction.predicted = player.position;

        if (oldest != nullptr)
        {
            const auto it = oldest->positions.find(player.playerId);
            const float spanSeconds = static_cast<float>(context.nowMs - oldest->atMs) / 1000.0F;
            if (it != oldest->positions.end() && spanSeconds > 0.0F)
            {
                const glm::vec3 velocity = (player.position - it->second) / spanSeconds;
                prediction.predicted = ClampToMap(player.position + velocity * horizonSeconds, 0.0F);
            }
        }
        predictions.push_back(prediction);
    }
    return predictions;
}

// --- PowerSystem ---

PowerSystem::PowerSystem(PowerRegistry registry)
    : m_registry(std::move(registry))
{
}

void PowerSystem::InitializePlayer(PlayerState& player) const
{
    const PowerDefinition& definition = m_registry.Get(player.power);
    player.powerActive = false;
    player.powerActiveEnd = 0;
    player.powerCooldownEnd = 0;
    player.powerUsesLeft = definition.usesPerMatch;
    player.powerCharges = definition.maxCharges;
    player.nextChargeAtMs = 0;
    player.isMetamorphed = false;
    player.metamorphEndMs = 0;
}

ActionResult PowerSystem::Activate(MatchContext& context, PlayerState& player, const PowerRequest& request)
{
    if (!player.isAlive || player.isGhost)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    std::optional<Power> power = MakePower(player.power);
    if (!power.has_value())
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }

    if (player.powerActive)
    {
        Deactivate(context, player);
        return ActionResult::Ok();
    }

    const PowerDefinition& definition = m_registry.Get(player.power);
    const std::int64_t now = context.nowMs;
    if (definition.IsChargeBased())
    {
        if (player.powerCharges <= 0)
        {
            return ActionResult::Fail(reason::kNoCharges);
        }
    }
    else
    {
        if (now < player.powerCooldownEnd)
        {
            return ActionResult::Fail(reason::kCooldown);
        }
        if (player.powerUsesLeft <= 0)
        {
            return ActionResult::Fail(reason::kNoUses);
        }
    }

    const int savedUses = player.powerUsesLeft;
    const int savedCharges = player.powerCharges;
    const std::int64_t savedNextCharge = player.nextChargeAtMs;
    if (definition.IsChargeBased())
    {
        --player.powerCharges;
        if (player.nextChargeAtMs == 0)
        {
            player.nextChargeAtMs = now + definition.cooldownMs;
        }
    }
    else
    {
        --player.powerUsesLeft;
    }

    const PowerType castType = player.power;
    PowerContext powerContext{context, player, request, definition};
    const ActionResult result = std::visit([&](const auto& alternative) { return alternative.Apply(powerContext); }, *power);
    if (!result)
    {
        player.powerUsesLeft = savedUses;
        player.powerCharges = savedCharges;
        player.nextChargeAtMs = savedNextCharge;
        return result;
    }

    switch (KindOf(*power))
    {
        case PowerKind::Duration:
            player.powerActive = true;
            player.powerActiveEnd = now + definition.durationMs;
            break;
        case PowerKind::Instant:
            if (!definition.IsChargeBased())
            {
                player.powerCooldownEnd = now + definition.cooldownMs;
            }
            break;
        case PowerKind::Transform:
        default:
            break;
    }

    std::cout << "[Power] " << player.name << " activated " << definition.displayName << "\n";
    context.Publish("power_activated", {player.playerId, PowerToId(castType)});
    return ActionResult::Ok();
}

void PowerSystem::Deactivate(MatchContext& context, PlayerState& player)
{
    if (!player.powerActive)
    {
        if (player.isMetamorphed)
        {
            EndMetamorph(context, player);
        }
        return;
    }

    const PowerDefinition& definition = m_registry.Get(player.power);
    const PowerRequest request;
    PowerContext powerContext{context, player, request, definition};
    if (std::optional<Power> power = MakePower(player.power))
    {
        std::visit([&](const auto& alternative) { alternative.Revert(powerContext); }, *power);
    }

    player.powerActive = false;
    player.powerActiveEnd = 0;
    if (!definition.IsChargeBased())
    {
        player.powerCooldownEnd = context.nowMs + definition.cooldownMs;
    }

    std::cout << "[Power] " << player.name << " ended " << definition.displayName << "\n";
    context.Publish("power_ended", {player.playerId, PowerToId(player.power)});
}

void PowerSystem::EndMetamorph(MatchContext& context, PlayerState& player)
{
    if (!player.isMetamorphed)
    {
        return;
    }
    if (player.powerActive)
    {
        Deactivate(context, player);
    }

    const PowerRequest request;
    PowerContext powerContext{context, player, request, m_registry.Get(PowerType::Metamorph)};
    powers::Metamorph{}.Revert(powerContext);
}

void PowerSystem::ExpireBarriers(MatchContext& context) const
{
    std::vector<maze::BarrierWall>& barriers = context.mazeState.barrierWalls;
    const auto expired = std::remove_if(barriers.begin(), barriers.end(), [&](const maze::BarrierWall& wall) {
        return context.nowMs >= wall.expiresAtMs;
    });
    if (expired == barriers.end())
    {
        return;
    }

    for (auto it = expired; it != barriers.end(); ++it)
    {
        context.Publish("barrier_expired", {it->ownerId, it->wallId});
    }
    barriers.erase(expired, barriers.end());
    RefreshCollision(context);
}

void PowerSystem::RechargeCharges(MatchContext& context) const
{
    for (PlayerState& player : context.players)
    {
        // A copied power runs on the metamorph clock and never recharges.
        if (player.isMetamorphed)
        {
            continue;
        }
        const PowerDefinition& definition = m_registry.Get(player.power);
        if (!definition.IsChargeBased() || player.powerActive)
        {
            continue;
        }
        if (player.powerCharges >= definition.maxCharges)
        {
            player.nextChargeAtMs = 0;
            continue;
        }
        if (player.nextChargeAtMs == 0)
        {
            player.nextChargeAtMs = context.nowMs + definition.cooldownMs;
            continue;
        }
        if (context.nowMs >= player.nextChargeAtMs)
        {
            ++player.powerCharges;
            player.nextChargeAtMs = player.powerCharges < definition.maxCharges ? context.nowMs + definition.cooldownMs : 0;
        }
    }
}

void PowerSystem::ExpirePowers(MatchContext& context)
{
    for (PlayerState& player : context.players)
    {
        const bool dead = !player.isAlive;
        if (player.powerActive && (dead || context.nowMs >= player.powerActiveEnd))
        {
            Deactivate(context, player);
        }
        if (player.isMetamorphed && (dead || context.nowMs >= player.metamorphEndMs))
        {
            EndMetamorph(context, player);
        }
    }
}

ActionResult PowerSystem::HackerAction(
    MatchContext& context,
    PlayerState& player,
    const std::string& targetType,
    const std::string& targetId
)
{
    if (!player.isAlive || player.power != PowerType::Hacker || !player.powerActive)
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }

    maze::MazeState& state = context.mazeState;
    const MatchTuning& tuning = context.tuning;

    if (targetType == "door" || targetType == "door_sabotage")
    {
        if (context.layout.FindDoor(targetId) == nullptr)
        {
            return ActionResult::Fail(reason::kNotFound);
        }
        maze::DoorState& door = state.doorStates[targetId];
        if (door.isLocked && door.lockedBy != player.playerId)
        {
            return ActionResult::Fail(reason::kLocked);
        }

        if (targetType == "door_sabotage")
        {
            RemoveValue(player.hackerLockedDoors, targetId);
            door.isOpen = false;
            door.isLocked = true;
            door.lockedBy = player.playerId;
            door.lockedAtMs = context.nowMs;
            door.lockExpiresAtMs = context.nowMs + tuning.sabotageDoorMs;
            context.Publish("door_sabotaged", {targetId, player.playerId});
        }
        else if (ToggleMembership(player.hackerLockedDoors, targetId))
        {
            door.isOpen = false;
            door.isLocked = true;
            door.lockedBy = player.playerId;
            door.lockedAtMs = context.nowMs;
            door.lockExpiresAtMs = 0;
            context.Publish("door_locked", {targetId, player.playerId});
        }
        else
        {
            door.isLocked = false;
            door.lockedBy.clear();
            door.lockedAtMs = 0;
            door.lockExpiresAtMs = 0;
            context.Publish("door_unlocked", {targetId, player.playerId});
        }
        RefreshCollision(context);
        return ActionResult::Ok();
    }

    if (targetType == "light")
    {
        const auto it = state.lightStates.find(targetId);
        if (it == state.lightStates.end())
        {
            return ActionResult::Fail(reason::kNotFound);
        }
        it->second = !it->second;
        ToggleMembership(player.hackerToggledLights, targetId);
        context.Publish("light_toggled", {targetId, it->second ? "on" : "off"});
        return ActionResult::Ok();
    }

    if (targetType == "wall")
    {
        const auto it = state.dynamicWallStates.find(targetId);
        if (it == state.dynamicWallStates.end())
        {
            return ActionResult::Fail(reason::kNotFound);
        }
        it->second = !it->second;
        ToggleMembership(player.hackerToggledWalls, targetId);
        RefreshCollision(context);
        context.Publish("wall_toggled", {targetId, it->second ? "closed" : "open"});
        return ActionResult::Ok();
    }

    if (targetType == "pipe")
    {
        if (context.layout.FindPipeNode(targetId) == nullptr)
        {
            return ActionResult::Fail(reason::kNotFound);
        }
        maze::PipeLockState& lock = state.pipeLocks[targetId];
        lock.isLocked = true;
        lock.lockedBy = player.playerId;
        lock.lockExpiresAtMs = context.nowMs + tuning.sabotagePipeMs;
        context.Publish("pipe_locked", {targetId, player.playerId});
        return ActionResult::Ok();
    }

    if (targetType == "generator")
    {
        if (context.layout.FindGenerator(targetId) == nullptr)
        {
            return ActionResult::Fail(reason::kNotFound);
        }
        state.disabledGenerators[targetId] = context.nowMs + tuning.sabotageGeneratorMs;
        for (PlayerState& other : context.players)
        {
            if (other.refillGeneratorId == targetId)
            {
                other.refillGeneratorId.clear();
                other.refillStartMs = 0;
                context.Publish("refill_cancelled", {other.playerId, targetId});
            }
        }
        context.Publish("generator_disabled", {targetId, player.playerId});
        return ActionResult::Ok();
    }

    return ActionResult::Fail(reason::kNotFound);
}
} // namespace trisolar::gameplay
