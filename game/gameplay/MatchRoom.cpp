#include "game/gameplay/MatchRoom.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <numeric>
#include <sstream>

#include "game/maze/MazeGenerator.hpp"

namespace trisolar::gameplay
{
namespace
{
constexpr float kPi = 3.14159265358979323846F;
constexpr float kMaxTickSeconds = 0.25F;
constexpr std::size_t kMaxQueuedInputs = 60;

constexpr std::array<const char*, 15> kPlayerColors{
    "#e74c3c", "#3498db", "#2ecc71", "#f1c40f", "#9b59b6",
    "#e67e22", "#1abc9c", "#e84393", "#00cec9", "#6c5ce7",
    "#fd79a8", "#ffeaa7", "#dfe6e9", "#636e72", "#b2bec3",
};

/// FNV-1a over the seed bytes followed by the wall id.
std::uint32_t WallPhaseHash(std::uint32_t seed, const std::string& wallId)
{
    std::uint32_t hash = 2166136261U;
    auto mix = [&hash](std::uint8_t byte) {
        hash ^= byte;
        hash *= 16777619U;
    };
    for (int shift = 0; shift < 32; shift += 8)
    {
        mix(static_cast<std::uint8_t>((seed >> shift) & 0xFFU));
    }
    for (const char c : wallId)
    {
        mix(static_cast<std::uint8_t>(c));
    }
    return hash;
}

glm::vec3 OnCircle(std::size_t index, std::size_t count, float radius)
{
    const float angle = count == 0 ? 0.0F : (static_cast<float>(index) / static_cast<float>(count)) * 2.0F * kPi;
    return glm::vec3{std::cos(angle) * radius, 0.0F, std::sin(angle) * radius};
}

std::string FormatSeconds(double seconds)
{
    std::ostringstream stream;
    stream.precision(1);
    stream << std::fixed << seconds;
    return stream.str();
}

bool ContainsId(const std::vector<std::string>& values, const std::string& value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}
} // namespace

MatchRoom::MatchRoom(
    std::string code,
    MatchTuning tuning,
    PowerRegistry registry,
    cosmos::CosmicScenario scenario,
    std::uint32_t rngSeed,
    RoomLimits limits
)
    : m_code(std::move(code))
    , m_limits(limits)
    , m_powers(std::move(registry))
    , m_tokenRng(rngSeed)
{
    m_context.tuning = std::move(tuning);
    m_context.scenario = std::move(scenario);
    m_context.rng.seed(rngSeed);
    m_context.era = m_context.scenario.EraAt(0.0);
}

// --- Lobby ---

JoinResult MatchRoom::Join(const std::string& name, const std::string& sessionToken, std::int64_t nowMs)
{
    JoinResult result;
    if (!sessionToken.empty())
    {
        if (PlayerState* existing = m_context.FindPlayerByToken(sessionToken))
        {
            existing->connected = true;
            existing->disconnectedAtMs = 0;
            result.playerId = existing->playerId;
            result.sessionToken = existing->sessionToken;
            result.reconnected = true;
            std::cout << "[Match] " << existing->name << " reconnected to room " << m_code << "\n";
            m_context.Publish("player_reconnected", {existing->playerId});
            return result;
        }
    }

    if (m_phase != MatchPhase::Lobby)
    {
        result.status = ActionResult::Fail(reason::kWrongState);
        return result;
    }
    if (static_cast<int>(m_context.players.size()) >= m_limits.maxPlayers)
    {
        result.status = ActionResult::Fail(reason::kNotAllowed);
        return result;
    }

    PlayerState player;
    player.playerId = "player_" + std::to_string(m_nextPlayerId++);
    player.sessionToken = NextSessionToken();
    player.name = name.empty() ? player.playerId : name;
    player.color = NextFreeColor();
    player.connected = true;
    m_context.players.push_back(player);

    m_context.nowMs = nowMs;
    result.playerId = player.playerId;
    result.sessionToken = player.sessionToken;
    std::cout << "[Match] " << player.name << " joined room " << m_code << " (" << m_context.players.size() << "/"
              << m_limits.maxPlayers << ")\n";
    m_context.Publish("player_joined", {player.playerId, player.name, player.color});
    return result;
}

void MatchRoom::Disconnect(const std::string& playerId, std::int64_t nowMs)
{
    PlayerState* player = m_context.FindPlayer(playerId);
    if (player == nullptr)
    {
        return;
    }

    if (m_phase == MatchPhase::Lobby)
    {
        RemovePlayer(playerId);
        return;
    }

    player->connected = false;
    player->disconnectedAtMs = nowMs;
    std::cout << "[Match] " << player->name << " disconnected, holding slot for " << m_context.tuning.reconnectGraceMs
              << " ms\n";
    m_context.Publish("player_disconnected", {player->playerId});
}

ActionResult MatchRoom::Start(std::int64_t nowMs, std::uint32_t mazeSeed)
{
    if (m_phase != MatchPhase::Lobby)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (static_cast<int>(m_context.players.size()) < m_limits.minPlayers || m_context.players.empty())
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }

    const int playerCount = static_cast<int>(m_context.players.size());
    maze::MazeGenerator::GenerationSettings settings;
    settings.tasksPerPlayer = m_context.tuning.tasksPerPlayer;

    m_mazeSeed = mazeSeed;
    m_context.layout = maze::MazeGenerator{}.Generate(mazeSeed, playerCount, settings);
    m_context.mazeState = maze::CreateInitialMazeState(m_context.layout);
    m_context.collision.Build(m_context.layout);
    m_context.collision.Refresh(m_context.layout, m_context.mazeState);
    m_context.simulation = cosmos::SunSimulation(m_context.scenario.Masses(), m_context.scenario.initialConfig);
    m_context.rng.seed(mazeSeed);
    m_context.nowMs = nowMs;
    m_context.startedAtMs = nowMs;
    m_context.lastSampleMs = 0;
    m_context.positionHistory.clear();
    m_context.deadBodies.clear();
    m_context.nextBodyId = 0;
    m_context.era = m_context.scenario.EraAt(0.0);
    m_wasBinary = false;
    m_oxygenDepleted = false;

    for (PlayerState& player : m_context.players)
    {
        PlayerState fresh;
        fresh.playerId = player.playerId;
        fresh.sessionToken = player.sessionToken;
        fresh.name = player.name;
        fresh.color = player.color;
        fresh.connected = player.connected;
        fresh.disconnectedAtMs = player.disconnectedAtMs;
        fresh.maxHealth = m_context.tuning.maxHealth;
        fresh.health = m_context.tuning.maxHealth;
        fresh.emergencyUsesLeft = m_context.tuning.emergencyUses;
        player = std::move(fresh);
    }

    AssignRolesAndPowers();
    AssignTasks();
    PlaceSpawns();

    m_phase = MatchPhase::Playing;
    m_result.reset();
    m_meeting.reset();

    int shadows = 0;
    for (const PlayerState& player : m_context.players)
    {
        shadows += player.role == Role::Shadow ? 1 : 0;
    }
    std::cout << "[Match] Room " << m_code << " started seed=" << mazeSeed << " players=" << playerCount
              << " shadows=" << shadows << " tasks=" << m_context.layout.tasks.size() << "\n";
    m_context.Publish("match_started", {std::to_string(mazeSeed), std::to_string(playerCount)});

    BuildSnapshot();
    return ActionResult::Ok();
}

void MatchRoom::AssignRolesAndPowers()
{
    std::vector<PlayerState>& players = m_context.players;
    const std::size_t count = players.size();
    const std::size_t shadowCount = std::max<std::size_t>(1, count / 3);

    std::vector<std::size_t> order(count);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::shuffle(order.begin(), order.end(), m_context.rng);
    for (std::size_t i = 0; i < count; ++i)
    {
        players[order[i]].role = i < shadowCount ? Role::Shadow : Role::Crew;
    }

    std::vector<PowerType> deck(kAllPowers.begin(), kAllPowers.end());
    std::shuffle(deck.begin(), deck.end(), m_context.rng);
    for (std::size_t i = 0; i < count; ++i)
    {
        players[i].power = deck[i % deck.size()];
        m_powers.InitializePlayer(players[i]);
    }
}

void MatchRoom::AssignTasks()
{
    std::vector<std::string> taskIds;
    taskIds.reserve(m_context.layout.tasks.size());
    for (const maze::TaskStation& task : m_context.layout.tasks)
    {
        taskIds.push_back(task.id);
    }
    std::shuffle(taskIds.begin(), taskIds.end(), m_context.rng);

    // Shadows draw from the same cycle so their fake list looks like a real one.
    std::size_t cursor = 0;
    for (PlayerState& player : m_context.players)
    {
        player.assignedTasks.clear();
        for (int i = 0; i < m_context.tuning.tasksPerPlayer && !taskIds.empty(); ++i)
        {
            player.assignedTasks.push_back(taskIds[cursor % taskIds.size()]);
            ++cursor;
        }
    }
}

void MatchRoom::PlaceSpawns()
{
    const std::size_t count = m_context.players.size();
    for (std::size_t i = 0; i < count; ++i)
    {
        PlayerState& player = m_context.players[i];
        player.position = OnCircle(i, count, m_context.tuning.spawnRadius);
        player.yaw = 0.0F;
        player.rotation = YawToQuaternion(0.0F);
    }
}

std::string MatchRoom::NextSessionToken()
{
    static constexpr char kHex[] = "0123456789abcdef";
    std::uniform_int_distribution<int> digit(0, 15);
    std::string token;
    do
    {
        token.clear();
        for (int i = 0; i < 32; ++i)
        {
            token.push_back(kHex[digit(m_tokenRng)]);
        }
    } while (m_context.FindPlayerByToken(token) != nullptr);
    return token;
}

std::string MatchRoom::NextFreeColor() const
{
    for (const char* color : kPlayerColors)
    {
        const bool taken = std::any_of(m_context.players.begin(), m_context.players.end(), [&](const PlayerState& player) {
            return player.color == color;
        });
        if (!taken)
        {
            return color;
        }
    }
    return kPlayerColors[m_context.players.size() % kPlayerColors.size()];
}

PlayerState* MatchRoom::FindPlaying(const std::string& playerId)
{
    if (m_phase != MatchPhase::Playing)
    {
        return nullptr;
    }
    return m_context.FindPlayer(playerId);
}

// --- Tick ---

void MatchRoom::Tick(std::int64_t nowMs)
{
    const std::int64_t previousMs = m_context.nowMs;
    m_context.nowMs = nowMs;
    if (m_phase == MatchPhase::Lobby || m_phase == MatchPhase::Ended)
    {
        FlushEvents();
        return;
    }

    const float dtSeconds = std::clamp(static_cast<float>(nowMs - previousMs) / 1000.0F, 0.0F, kMaxTickSeconds);
    RemoveExpiredDisconnects();

    if (m_phase == MatchPhase::Meeting)
    {
        UpdateMeeting();
        BuildSnapshot();
        if (m_phase == MatchPhase::Playing)
        {
            CheckWinConditions();
        }
        FlushEvents();
        return;
    }

    const float inputDt = 1.0F / static_cast<float>(std::max(1, m_context.tuning.tickRate));

    SamplePositionHistory();
    UpdateEra();
    m_context.simulation.Advance(static_cast<double>(dtSeconds));
    const bool isBinary = m_context.simulation.Events().isBinary;
    if (isBinary && !m_wasBinary)
    {
        m_context.Publish("binary_formed", {});
    }
    m_wasBinary = isBinary;

    UpdateDynamicWalls();
    m_powers.ExpireBarriers(m_context);
    m_powers.RechargeCharges(m_context);
    ExpireLocks();
    m_powers.ExpirePowers(m_context);
    ExpirePossession();
    ProcessInputs(inputDt);
    ProcessRedirectedInputs(inputDt);
    m_hazards.Apply(m_context, dtSeconds);
    UpdateOxygen(dtSeconds);
    BuildSnapshot();
    CheckWinConditions();
    FlushEvents();
}

void MatchRoom::FlushEvents()
{
    m_context.events.DispatchQueued();
}

void MatchRoom::SamplePositionHistory()
{
    const MatchTuning& tuning = m_context.tuning;
    if (!m_context.positionHistory.empty() && m_context.nowMs - m_context.lastSampleMs < tuning.oracleSampleIntervalMs)
    {
        return;
    }

    PositionSample sample;
    sample.atMs = m_context.nowMs;
    for (const PlayerState& player : m_context.players)
    {
        if (player.isAlive && !player.isGhost)
        {
            sample.positions.emplace(player.playerId, player.position);
        }
    }
    m_context.positionHistory.push_back(std::move(sample));
    m_context.lastSampleMs = m_context.nowMs;
    while (m_context.positionHistory.size() > static_cast<std::size_t>(std::max(1, tuning.oracleHistorySize)))
    {
        m_context.positionHistory.pop_front();
    }
}

void MatchRoom::UpdateEra()
{
    const cosmos::EraInfo next = m_context.scenario.EraAt(m_context.ElapsedSeconds());
    const bool changed = next.phaseIndex != m_context.era.phaseIndex;
    m_context.era = next;
    if (!changed)
    {
        return;
    }

    std::cout << "[Hazard] Era " << cosmos::EraToText(next.era) << " gravity=" << next.gravity << " - " << next.description
              << "\n";
    m_context.Publish("era_changed", {cosmos::EraToText(next.era), next.description, FormatSeconds(next.gravity)});
}

void MatchRoom::UpdateDynamicWalls()
{
    const MatchTuning& tuning = m_context.tuning;
    const std::int64_t period = std::max(1, tuning.WallPeriodMs(m_context.era.era));
    const auto closedSpan = static_cast<std::int64_t>(static_cast<float>(period) * tuning.wallClosedFraction);
    const std::int64_t elapsedMs = std::max<std::int64_t>(0, m_context.nowMs - m_context.startedAtMs);

    bool changed = false;
    for (const std::string& wallId : m_context.layout.dynamicWallIds)
    {
        const bool heldByHacker = std::any_of(m_context.players.begin(), m_context.players.end(), [&](const PlayerState& player) {
            return ContainsId(player.hackerToggledWalls, wallId);
        });
        if (heldByHacker)
        {
            continue;
        }

        const std::int64_t offset = static_cast<std::int64_t>(WallPhaseHash(m_mazeSeed, wallId) % static_cast<std::uint32_t>(period));
        const bool closed = ((elapsedMs + offset) % period) < closedSpan;
        bool& state = m_context.mazeState.dynamicWallStates[wallId];
        if (state != closed)
        {
            state = closed;
            changed = true;
        }
    }

    if (changed)
    {
        m_context.collision.Refresh(m_context.layout, m_context.mazeState);
    }
}

void MatchRoom::ExpireLocks()
{
    const std::int64_t now = m_context.nowMs;
    maze::MazeState& state = m_context.mazeState;

    bool doorsChanged = false;
    for (auto& [doorId, door] : state.doorStates)
    {
        if (door.isLocked && door.lockExpiresAtMs > 0 && now >= door.lockExpiresAtMs)
        {
            door.isLocked = false;
            door.lockedBy.clear();
            door.lockedAtMs = 0;
            door.lockExpiresAtMs = 0;
            doorsChanged = true;
            m_context.Publish("door_unlocked", {doorId, ""});
        }
    }

    for (auto& [nodeId, lock] : state.pipeLocks)
    {
        if (lock.isLocked && lock.lockExpiresAtMs > 0 && now >= lock.lockExpiresAtMs)
        {
            lock = maze::PipeLockState{};
            m_context.Publish("pipe_unlocked", {nodeId});
        }
    }

    for (auto it = state.disabledGenerators.begin(); it != state.disabledGenerators.end();)
    {
        if (now >= it->second)
        {
            m_context.Publish("generator_enabled", {it->first});
            it = state.disabledGenerators.erase(it);
        }
        else
        {
            ++it;
        }
    }

    if (doorsChanged)
    {
        m_context.collision.Refresh(m_context.layout, m_context.mazeState);
    }
}

void MatchRoom::ExpirePossession()
{
    for (PlayerState& ghost : m_context.players)
    {
        if (ghost.possessTargetId.empty())
        {
            continue;
        }
        const PlayerState* target = m_context.FindPlayer(ghost.possessTargetId);
        const bool targetGone = target == nullptr || !target->isAlive;
        if (!ghost.isGhost || targetGone || m_context.nowMs >= ghost.possessEndMs)
        {
            m_context.Publish("possess_ended", {ghost.playerId, ghost.possessTargetId});
            ghost.possessTargetId.clear();
            ghost.possessInput.reset();
        }
    }
}

void MatchRoom::MovePlayer(PlayerState& player, const PlayerInput& input, float dtSeconds)
{
    MovementContext movement;
    movement.world = &m_context.collision;
    movement.underground = player.isUnderground;
    movement.radius = m_context.tuning.playerRadius;

    // Ghosts pass through everything; impermeable players only through surface walls.
    const bool skipCollision = player.isGhost || (player.isImpermeable && !player.isUnderground);
    const float gravityFactor = player.isGhost ? 1.0F : GravitySlowdown(m_context.era.gravity);

    player.position = ApplyMovement(
        player.position,
        input,
        dtSeconds,
        player.speedMultiplier * gravityFactor,
        skipCollision ? nullptr : &movement,
        m_context.tuning.playerSpeed);
    player.yaw = input.yaw;
    player.rotation = YawToQuaternion(input.yaw);
}

void MatchRoom::ProcessInputs(float dtSeconds)
{
    for (PlayerState& player : m_context.players)
    {
        while (!player.inputQueue.empty())
        {
            const PlayerInput input = player.inputQueue.front();
            player.inputQueue.pop_front();
            if (input.seq <= player.lastProcessedInput)
            {
                continue;
            }
            MovePlayer(player, input, dtSeconds);
            player.lastProcessedInput = input.seq;
        }
    }
}

void MatchRoom::ProcessRedirectedInputs(float dtSeconds)
{
    for (PlayerState& controller : m_context.players)
    {
        const bool mindControlling = controller.power == PowerType::MindController && controller.powerActive
            && !controller.mindControlTargetId.empty() && controller.mindControlInput.has_value();
        if (mindControlling)
        {
            PlayerState* target = m_context.FindPlayer(controller.mindControlTargetId);
            if (target != nullptr && target->isAlive && !target->isGhost)
            {
                MovePlayer(*target, *controller.mindControlInput, dtSeconds);
            }
        }

        const bool possessing = controller.isGhost && !controller.possessTargetId.empty() && controller.possessInput.has_value();
        if (possessing)
        {
            PlayerState* target = m_context.FindPlayer(controller.possessTargetId);
            if (target != nullptr && target->isAlive && !target->isGhost)
            {
                MovePlayer(*target, *controller.possessInput, dtSeconds);
            }
        }
    }
}

void MatchRoom::UpdateOxygen(float dtSeconds)
{
    maze::MazeState& state = m_context.mazeState;
    const MatchTuning& tuning = m_context.tuning;

    const std::vector<maze::RoomInfo>& rooms = m_context.layout.rooms;
    std::size_t unsealed = 0;
    for (const maze::RoomInfo& room : rooms)
    {
        unsealed += state.IsRoomSealed(m_context.layout, room) ? 0 : 1;
    }
    const float unsealedFraction = rooms.empty() ? 1.0F : static_cast<float>(unsealed) / static_cast<float>(rooms.size());
    const float drain = tuning.oxygenDrainPerSecond * (0.5F + 0.5F * unsealedFraction) * dtSeconds;
    state.shipOxygen = std::max(0.0F, state.shipOxygen - drain);

    if (state.shipOxygen <= 0.0F && !m_oxygenDepleted)
    {
        m_oxygenDepleted = true;
        std::cout << "[Hazard] Ship oxygen depleted in room " << m_code << "\n";
        m_context.Publish("oxygen_depleted", {});
    }

    for (PlayerState& player : m_context.players)
    {
        if (player.refillGeneratorId.empty())
        {
            continue;
        }

        const std::string generatorId = player.refillGeneratorId;
        const maze::OxygenGenerator* generator = m_context.layout.FindGenerator(generatorId);
        const bool cancelled = generator == nullptr || !player.isAlive || state.IsGeneratorDisabled(generatorId)
            || DistanceXZ(player.position, generator->position) > tuning.generatorRange;
        if (cancelled)
        {
            player.refillGeneratorId.clear();
            player.refillStartMs = 0;
            m_context.Publish("refill_cancelled", {player.playerId, generatorId});
            continue;
        }

        if (m_context.nowMs - player.refillStartMs >= tuning.oxygenRefillMs)
        {
            state.shipOxygen = 100.0F;
            m_oxygenDepleted = false;
            player.refillGeneratorId.clear();
            player.refillStartMs = 0;
            std::cout << "[Match] " << player.name << " refilled oxygen at " << generator->roomName << "\n";
            m_context.Publish("oxygen_refilled", {player.playerId, generatorId});
        }
    }
}

void MatchRoom::BuildSnapshot()
{
    const maze::MazeState& state = m_context.mazeState;
    const cosmos::SimulationEvents& simulationEvents = m_context.simulation.Events();

    MatchSnapshot snapshot;
    snapshot.seq = ++m_snapshotSeq;
    snapshot.serverTimeMs = m_context.nowMs;
    snapshot.phase = m_phase;

    snapshot.era = m_context.era.era;
    snapshot.gravity = m_context.era.gravity;
    snapshot.eraDescription = m_context.era.description;
    snapshot.eraSecondsRemaining = static_cast<float>(m_context.era.secondsRemaining);
    const std::array<glm::dvec3, 3>& suns = m_context.simulation.SunPositions();
    for (std::size_t i = 0; i < suns.size(); ++i)
    {
        snapshot.sunPositions[i] = glm::vec3(suns[i]);
    }
    snapshot.isBinary = simulationEvents.isBinary;

    snapshot.shipOxygen = state.shipOxygen;
    for (const auto& [doorId, door] : state.doorStates)
    {
        snapshot.doors.push_back(DoorSnapshot{doorId, door.isOpen, door.isLocked});
    }
    snapshot.lights.assign(state.lightStates.begin(), state.lightStates.end());
    snapshot.dynamicWalls.assign(state.dynamicWallStates.begin(), state.dynamicWallStates.end());
    snapshot.barriers = state.barrierWalls;
    for (const auto& [taskId, task] : state.taskStates)
    {
        snapshot.tasks.emplace_back(taskId, task.completion);
    }
    for (const auto& [nodeId, lock] : state.pipeLocks)
    {
        if (lock.isLocked)
        {
            snapshot.lockedPipes.push_back(nodeId);
        }
    }
    for (const auto& [generatorId, until] : state.disabledGenerators)
    {
        snapshot.disabledGenerators.push_back(generatorId);
    }
    snapshot.tasksCompleted = static_cast<int>(state.CompletedTaskCount());
    snapshot.totalTasks = static_cast<int>(state.taskStates.size());

    for (const PlayerState& player : m_context.players)
    {
        PlayerSnapshot view;
        view.playerId = player.playerId;
        view.name = player.name;
        view.color = player.color;
        view.position = player.position;
        view.rotation = player.rotation;
        view.isAlive = player.isAlive;
        view.isGhost = player.isGhost;
        view.isInvisible = player.isInvisible;
        view.hasShield = player.hasShield;
        view.isImpermeable = player.isImpermeable;
        view.isUnderground = player.isUnderground;
        view.inShelter = player.inShelter;
        view.powerActive = player.powerActive;
        view.connected = player.connected;
        view.speedMultiplier = player.speedMultiplier;
        view.health = player.health;
        view.damageSource = player.damageSource;
        view.lastProcessedInput = player.lastProcessedInput;
        view.activeTaskId = player.activeTaskId;
        snapshot.players.push_back(std::move(view));
    }
    snapshot.bodies = m_context.deadBodies;

    if (m_meeting.has_value())
    {
        snapshot.meetingStage = m_meeting->stage;
        snapshot.meetingStageEndMs = m_meeting->stageEndMs;
    }

    m_snapshot = std::move(snapshot);
}

void MatchRoom::CheckWinConditions()
{
    if (m_phase != MatchPhase::Playing)
    {
        return;
    }

    const std::vector<PlayerState>& players = m_context.players;
    if (players.empty())
    {
        EndMatch("shadow", "all_left");
        return;
    }

    int aliveCrew = 0;
    int aliveShadows = 0;
    for (const PlayerState& player : players)
    {
        if (!player.isAlive)
        {
            continue;
        }
        (player.role == Role::Shadow ? aliveShadows : aliveCrew) += 1;
    }

    if (aliveCrew == 0)
    {
        EndMatch("shadow", "all_crew_dead");
        return;
    }
    if (aliveShadows == 0)
    {
        EndMatch("crew", "shadow_eliminated");
        return;
    }

    const maze::MazeState& state = m_context.mazeState;
    if (!state.taskStates.empty() && state.CompletedTaskCount() == state.taskStates.size())
    {
        EndMatch("crew", "all_tasks_done");
    }
}

void MatchRoom::EndMatch(const std::string& winner, const std::string& reason)
{
    MatchResult result;
    result.winner = winner;
    result.reason = reason;
    result.tasksCompleted = static_cast<int>(m_context.mazeState.CompletedTaskCount());
    result.totalTasks = static_cast<int>(m_context.mazeState.taskStates.size());
    result.durationSeconds = m_context.ElapsedSeconds();
    m_result = result;
    m_phase = MatchPhase::Ended;
    m_meeting.reset();

    std::cout << "[Match] Room " << m_code << " ended: " << winner << " wins (" << reason << ") tasks="
              << result.tasksCompleted << "/" << result.totalTasks << "\n";
    m_context.Publish(
        "match_ended",
        {winner, reason, std::to_string(result.tasksCompleted), std::to_string(result.totalTasks),
         FormatSeconds(result.durationSeconds)});
}

void MatchRoom::RemoveExpiredDisconnects()
{
    std::vector<std::string> expired;
    for (const PlayerState& player : m_context.players)
    {
        if (!player.connected && m_context.nowMs - player.disconnectedAtMs >= m_context.tuning.reconnectGraceMs)
        {
            expired.push_back(player.playerId);
        }
    }
    for (const std::string& playerId : expired)
    {
        RemovePlayer(playerId);
    }
}

void MatchRoom::RemovePlayer(const std::string& playerId)
{
    PlayerState* player = m_context.FindPlayer(playerId);
    if (player == nullptr)
    {
        return;
    }

    // Active powers hold references to other players, so they end first.
    if (player->powerActive)
    {
        m_powers.Deactivate(m_context, *player);
    }
    if (player->isMetamorphed)
    {
        m_powers.EndMetamorph(m_context, *player);
    }
    m_context.ReleaseActiveTask(*player);

    for (PlayerState& other : m_context.players)
    {
        if (other.mindControlTargetId == playerId)
        {
            other.mindControlTargetId.clear();
            other.mindControlInput.reset();
        }
        if (other.possessTargetId == playerId)
        {
            other.possessTargetId.clear();
            other.possessInput.reset();
        }
    }

    if (m_meeting.has_value())
    {
        std::vector<std::string>& alive = m_meeting->alivePlayers;
        alive.erase(std::remove(alive.begin(), alive.end(), playerId), alive.end());
        m_meeting->votes.erase(playerId);
        m_meeting->preMeetingPositions.erase(playerId);
    }

    std::cout << "[Match] " << player->name << " left room " << m_code << "\n";
    std::vector<PlayerState>& players = m_context.players;
    players.erase(
        std::remove_if(players.begin(), players.end(), [&](const PlayerState& p) { return p.playerId == playerId; }),
        players.end());
    m_context.Publish("player_left", {playerId});
}

// --- Meetings ---

void MatchRoom::TriggerMeeting(const std::string& reporterId, const std::string& bodyId)
{
    MeetingState meeting;
    meeting.reporterId = reporterId;
    meeting.bodyId = bodyId;
    meeting.stage = MeetingStage::Discussion;
    meeting.stageEndMs = m_context.nowMs + m_context.tuning.discussionMs;

    for (PlayerState& player : m_context.players)
    {
        m_context.ReleaseActiveTask(player);
        player.refillGeneratorId.clear();
        player.refillStartMs = 0;
        player.inputQueue.clear();
        if (player.isAlive)
        {
            meeting.alivePlayers.push_back(player.playerId);
            meeting.preMeetingPositions[player.playerId] = player.position;
        }
    }

    for (std::size_t i = 0; i < meeting.alivePlayers.size(); ++i)
    {
        PlayerState* player = m_context.FindPlayer(meeting.alivePlayers[i]);
        player->position = OnCircle(i, meeting.alivePlayers.size(), m_context.tuning.meetingRadius);
        player->isUnderground = false;
        player->currentPipeNodeId.clear();
    }

    if (DeadBody* body = m_context.FindBody(bodyId))
    {
        body->reported = true;
    }

    m_meeting = std::move(meeting);
    m_phase = MatchPhase::Meeting;
    std::cout << "[Meeting] Meeting in room " << m_code << " called by " << reporterId
              << (bodyId.empty() ? std::string{" (emergency)"} : " (body " + bodyId + ")") << "\n";
    m_context.Publish("meeting_started", {reporterId, bodyId});
}

void MatchRoom::UpdateMeeting()
{
    if (!m_meeting.has_value())
    {
        m_phase = MatchPhase::Playing;
        return;
    }

    MeetingState& meeting = *m_meeting;
    if (m_context.nowMs < meeting.stageEndMs)
    {
        return;
    }

    switch (meeting.stage)
    {
        case MeetingStage::Discussion:
            meeting.stage = MeetingStage::Voting;
            meeting.stageEndMs = m_context.nowMs + m_context.tuning.votingMs;
            std::cout << "[Meeting] Voting started in room " << m_code << "\n";
            m_context.Publish("meeting_voting", {});
            break;
        case MeetingStage::Voting:
            ResolveVotes();
            break;
        case MeetingStage::Result:
        default:
            ResumeFromMeeting();
            break;
    }
}

void MatchRoom::ResolveVotes()
{
    MeetingState& meeting = *m_meeting;

    std::map<std::string, int> counts;
    int skipVotes = 0;
    for (const std::string& voterId : meeting.alivePlayers)
    {
        const auto vote = meeting.votes.find(voterId);
        if (vote == meeting.votes.end() || vote->second.empty())
        {
            ++skipVotes;
        }
        else
        {
            ++counts[vote->second];
        }
    }

    int maxVotes = 0;
    std::string ejectedId;
    bool tie = false;
    for (const auto& [targetId, count] : counts)
    {
        if (count > maxVotes)
        {
            maxVotes = count;
            ejectedId = targetId;
            tie = false;
        }
        else if (count == maxVotes)
        {
            tie = true;
        }
    }
    if (tie || skipVotes >= maxVotes)
    {
        ejectedId.clear();
    }

    if (PlayerState* ejected = m_context.FindPlayer(ejectedId))
    {
        m_context.HandleDeath(*ejected, "ejected", "", false);
    }

    meeting.ejectedId = ejectedId;
    meeting.stage = MeetingStage::Result;
    meeting.stageEndMs = m_context.nowMs + m_context.tuning.resultDisplayMs;

    std::vector<std::string> args{ejectedId};
    for (const auto& [voterId, targetId] : meeting.votes)
    {
        args.push_back(voterId + "=" + targetId);
    }
    std::cout << "[Meeting] Vote result in room " << m_code << ": " << (ejectedId.empty() ? "nobody" : ejectedId)
              << " ejected\n";
    m_context.Publish("vote_result", std::move(args));
}

void MatchRoom::ResumeFromMeeting()
{
    const MeetingState meeting = std::move(*m_meeting);
    m_meeting.reset();

    for (PlayerState& player : m_context.players)
    {
        const auto saved = meeting.preMeetingPositions.find(player.playerId);
        if (player.isAlive && saved != meeting.preMeetingPositions.end())
        {
            player.position = saved->second;
        }
    }

    // Samples taken before the meeting would extrapolate across the teleport.
    m_context.positionHistory.clear();
    m_phase = MatchPhase::Playing;
    std::cout << "[Meeting] Game resumed in room " << m_code << "\n";
    m_context.Publish("meeting_ended", {meeting.ejectedId});
}

// --- Movement actions ---

ActionResult MatchRoom::QueueInput(const std::string& playerId, const PlayerInput& input)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(m_phase == MatchPhase::Playing ? reason::kNotFound : reason::kWrongState);
    }
    if (input.seq <= player->lastProcessedInput)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    player->inputQueue.push_back(input);
    while (player->inputQueue.size() > kMaxQueuedInputs)
    {
        player->inputQueue.pop_front();
    }
    return ActionResult::Ok();
}

ActionResult MatchRoom::SetMindControlInput(const std::string& playerId, const PlayerInput& input)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (player->power != PowerType::MindController || !player->powerActive || player->mindControlTargetId.empty())
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }
    player->mindControlInput = input;
    return ActionResult::Ok();
}

ActionResult MatchRoom::ActivateControlledPower(const std::string& playerId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (player->power != PowerType::MindController || !player->powerActive || player->mindControlTargetId.empty())
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }

    PlayerState* target = m_context.FindPlayer(player->mindControlTargetId);
    if (target == nullptr || !target->isAlive)
    {
        return ActionResult::Fail(reason::kNoTarget);
    }
    return m_powers.Activate(m_context, *target, PowerRequest{});
}

// --- Doors ---

ActionResult MatchRoom::InteractDoor(const std::string& playerId, const std::string& doorId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive || player->isUnderground)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const maze::DoorInfo* door = m_context.layout.FindDoor(doorId);
    if (door == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    if (DistanceXZ(player->position, door->position) > m_context.tuning.doorInteractRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    maze::DoorState& state = m_context.mazeState.doorStates[doorId];
    if (state.isLocked)
    {
        return ActionResult::Fail(reason::kLocked);
    }

    state.isOpen = !state.isOpen;
    m_context.collision.Refresh(m_context.layout, m_context.mazeState);
    m_context.Publish("door_toggled", {doorId, state.isOpen ? "open" : "closed", player->playerId});
    return ActionResult::Ok();
}

ActionResult MatchRoom::LockDoor(const std::string& playerId, const std::string& doorId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive || player->isUnderground)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const maze::DoorInfo* door = m_context.layout.FindDoor(doorId);
    if (door == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }

    // Only lockable from inside the room the door belongs to.
    const auto [row, col] = maze::WorldToCell(player->position.x, player->position.z);
    const maze::RoomInfo* room = m_context.layout.RoomAtCell(row, col);
    if (room == nullptr)
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }
    const std::vector<const maze::DoorInfo*> roomDoors = m_context.layout.DoorsTouchingCell(room->row, room->col);
    if (std::find(roomDoors.begin(), roomDoors.end(), door) == roomDoors.end())
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }
    if (DistanceXZ(player->position, door->position) > m_context.tuning.doorInteractRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    maze::DoorState& state = m_context.mazeState.doorStates[doorId];
    if (state.isLocked && state.lockedBy != player->playerId)
    {
        return ActionResult::Fail(reason::kLocked);
    }

    if (state.isLocked)
    {
        state.isLocked = false;
        state.lockedBy.clear();
        state.lockedAtMs = 0;
        state.lockExpiresAtMs = 0;
        m_context.Publish("door_unlocked", {doorId, player->playerId});
    }
    else
    {
        state.isOpen = false;
        state.isLocked = true;
        state.lockedBy = player->playerId;
        state.lockedAtMs = m_context.nowMs;
        state.lockExpiresAtMs = m_context.nowMs + m_context.tuning.doorLockMs;
        m_context.Publish("door_locked", {doorId, player->playerId});
    }
    m_context.collision.Refresh(m_context.layout, m_context.mazeState);
    return ActionResult::Ok();
}

// --- Tasks ---

ActionResult MatchRoom::StartTask(const std::string& playerId, const std::string& taskId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive && !player->isGhost)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const maze::TaskStation* station = m_context.layout.FindTask(taskId);
    if (station == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    maze::TaskState& task = m_context.mazeState.taskStates[taskId];
    if (task.completion == maze::TaskCompletion::Completed)
    {
        return ActionResult::Fail(reason::kAlreadyCompleted);
    }

    // Ghosts may work on any task from anywhere.
    if (!player->isGhost)
    {
        if (!player->IsAssigned(taskId))
        {
            return ActionResult::Fail(reason::kNotAssigned);
        }
        if (DistanceXZ(player->position, station->position) > m_context.tuning.taskInteractRange)
        {
            return ActionResult::Fail(reason::kTooFar);
        }
    }
    if (task.completion == maze::TaskCompletion::InProgress && task.activePlayerId != player->playerId)
    {
        return ActionResult::Fail(reason::kInUse);
    }
    if (!player->activeTaskId.empty() && player->activeTaskId != taskId)
    {
        return ActionResult::Fail(reason::kBusy);
    }

    player->activeTaskId = taskId;
    if (player->role == Role::Crew || player->isGhost)
    {
        task.completion = maze::TaskCompletion::InProgress;
        task.activePlayerId = player->playerId;
    }
    m_context.Publish("task_started", {taskId, player->playerId});
    return ActionResult::Ok();
}

ActionResult MatchRoom::CompleteTask(const std::string& playerId, const std::string& taskId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (m_context.layout.FindTask(taskId) == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    maze::TaskState& task = m_context.mazeState.taskStates[taskId];
    if (task.completion == maze::TaskCompletion::Completed)
    {
        return ActionResult::Fail(reason::kAlreadyCompleted);
    }
    if (player->activeTaskId != taskId)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    player->activeTaskId.clear();
    if (player->role == Role::Shadow && !player->isGhost)
    {
        m_context.PublishTo(player->playerId, "task_completed", {taskId, player->playerId});
        return ActionResult::Ok();
    }

    task.completion = maze::TaskCompletion::Completed;
    task.activePlayerId.clear();
    task.completedByPlayerId = player->playerId;

    const std::size_t completed = m_context.mazeState.CompletedTaskCount();
    const std::size_t total = m_context.mazeState.taskStates.size();
    std::cout << "[Match] " << player->name << " completed " << taskId << " (" << completed << "/" << total << ")\n";
    m_context.Publish("task_completed", {taskId, player->playerId, std::to_string(completed), std::to_string(total)});
    return ActionResult::Ok();
}

ActionResult MatchRoom::CancelTask(const std::string& playerId, const std::string& taskId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (m_context.layout.FindTask(taskId) == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    if (player->activeTaskId != taskId)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    m_context.ReleaseActiveTask(*player);
    m_context.Publish("task_cancelled", {taskId, player->playerId});
    return ActionResult::Ok();
}

// --- Powers ---

ActionResult MatchRoom::ActivatePower(const std::string& playerId, const PowerRequest& request)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    return m_powers.Activate(m_context, *player, request);
}

ActionResult MatchRoom::DeactivatePower(const std::string& playerId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->powerActive && !player->isMetamorphed)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    m_powers.Deactivate(m_context, *player);
    return ActionResult::Ok();
}

ActionResult MatchRoom::HackerAction(const std::string& playerId, const std::string& targetType, const std::string& targetId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    return m_powers.HackerAction(m_context, *player, targetType, targetId);
}

// --- Shadow and meetings ---

ActionResult MatchRoom::AttemptKill(const std::string& playerId, const std::string& targetId)
{
    PlayerState* killer = FindPlaying(playerId);
    if (killer == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!killer->isAlive || killer->role != Role::Shadow)
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }
    if (m_context.nowMs < killer->killCooldownEnd)
    {
        return ActionResult::Fail(reason::kCooldown);
    }

    PlayerState* target = m_context.FindPlayer(targetId);
    if (target == nullptr || target == killer || !target->isAlive || target->isGhost || target->role == Role::Shadow)
    {
        return ActionResult::Fail(reason::kNoTarget);
    }
    if (target->isUnderground != killer->isUnderground
        || DistanceXZ(killer->position, target->position) > m_context.tuning.killRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    killer->killCooldownEnd = m_context.nowMs + m_context.tuning.killCooldownMs;
    if (target->hasShield)
    {
        target->hasShield = false;
        std::cout << "[Match] " << target->name << "'s shield absorbed a kill\n";
        m_context.Publish("shield_broken", {target->playerId, killer->playerId});
        return ActionResult::Ok();
    }

    m_context.Publish("kill", {killer->playerId, target->playerId});
    m_context.HandleDeath(*target, "killed", killer->playerId);
    return ActionResult::Ok();
}

ActionResult MatchRoom::ReportBody(const std::string& playerId, const std::string& bodyId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive || player->isGhost)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const DeadBody* body = m_context.FindBody(bodyId);
    if (body == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    if (body->reported)
    {
        return ActionResult::Fail(reason::kAlreadyCompleted);
    }
    if (DistanceXZ(player->position, body->position) > m_context.tuning.reportRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    TriggerMeeting(player->playerId, bodyId);
    return ActionResult::Ok();
}

ActionResult MatchRoom::CallEmergencyMeeting(const std::string& playerId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive || player->isGhost)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (m_context.nowMs < player->emergencyCooldownEnd)
    {
        return ActionResult::Fail(reason::kCooldown);
    }
    if (player->emergencyUsesLeft <= 0)
    {
        return ActionResult::Fail(reason::kNoUses);
    }
    if (DistanceXZ(player->position, m_context.layout.emergencyButton.position) > m_context.tuning.emergencyButtonRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    --player->emergencyUsesLeft;
    player->emergencyCooldownEnd = m_context.nowMs + m_context.tuning.emergencyCooldownMs;
    TriggerMeeting(player->playerId, "");
    return ActionResult::Ok();
}

ActionResult MatchRoom::CastVote(const std::string& playerId, const std::string& targetId)
{
    if (m_phase != MatchPhase::Meeting || !m_meeting.has_value() || m_meeting->stage != MeetingStage::Voting)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    MeetingState& meeting = *m_meeting;
    if (!ContainsId(meeting.alivePlayers, playerId))
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }
    if (meeting.votes.count(playerId) > 0)
    {
        return ActionResult::Fail(reason::kAlreadyCompleted);
    }
    if (!targetId.empty())
    {
        const PlayerState* target = m_context.FindPlayer(targetId);
        if (target == nullptr || !target->isAlive)
        {
            return ActionResult::Fail(reason::kNoTarget);
        }
    }

    meeting.votes[playerId] = targetId;
    m_context.Publish("vote_cast", {playerId});

    const bool everyoneVoted = std::all_of(meeting.alivePlayers.begin(), meeting.alivePlayers.end(), [&](const std::string& id) {
        return meeting.votes.count(id) > 0;
    });
    if (everyoneVoted)
    {
        ResolveVotes();
    }
    return ActionResult::Ok();
}

// --- Oxygen ---

ActionResult MatchRoom::StartRefill(const std::string& playerId, const std::string& generatorId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive || player->isGhost)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const maze::OxygenGenerator* generator = m_context.layout.FindGenerator(generatorId);
    if (generator == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    if (m_context.mazeState.IsGeneratorDisabled(generatorId))
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }
    if (DistanceXZ(player->position, generator->position) > m_context.tuning.generatorRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    const bool someoneElseRefilling = std::any_of(m_context.players.begin(), m_context.players.end(), [&](const PlayerState& other) {
        return other.playerId != player->playerId && !other.refillGeneratorId.empty();
    });
    if (someoneElseRefilling)
    {
        return ActionResult::Fail(reason::kBusy);
    }

    player->refillGeneratorId = generatorId;
    player->refillStartMs = m_context.nowMs;
    m_context.Publish("refill_started", {player->playerId, generatorId});
    return ActionResult::Ok();
}

ActionResult MatchRoom::CancelRefill(const std::string& playerId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (player->refillGeneratorId.empty())
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const std::string generatorId = player->refillGeneratorId;
    player->refillGeneratorId.clear();
    player->refillStartMs = 0;
    m_context.Publish("refill_cancelled", {player->playerId, generatorId});
    return ActionResult::Ok();
}

// --- Ghosts ---

ActionResult MatchRoom::Possess(const std::string& playerId, const std::string& targetId)
{
    PlayerState* ghost = FindPlaying(playerId);
    if (ghost == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!ghost->isGhost)
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }
    if (m_context.nowMs < ghost->possessCooldownEndMs)
    {
        return ActionResult::Fail(reason::kCooldown);
    }
    if (!ghost->possessTargetId.empty())
    {
        return ActionResult::Fail(reason::kBusy);
    }

    const PlayerState* target = m_context.FindPlayer(targetId);
    if (target == nullptr || !target->isAlive || target->isGhost)
    {
        return ActionResult::Fail(reason::kNoTarget);
    }

    const MatchTuning& tuning = m_context.tuning;
    ghost->possessTargetId = targetId;
    ghost->possessInput.reset();
    ghost->possessEndMs = m_context.nowMs + tuning.possessionDurationMs;
    ghost->possessCooldownEndMs = ghost->possessEndMs + tuning.possessionCooldownMs;
    m_context.Publish("possess_started", {ghost->playerId, targetId});
    return ActionResult::Ok();
}

ActionResult MatchRoom::ReleasePossession(const std::string& playerId)
{
    PlayerState* ghost = FindPlaying(playerId);
    if (ghost == nullptr || !ghost->isGhost || ghost->possessTargetId.empty())
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    m_context.Publish("possess_ended", {ghost->playerId, ghost->possessTargetId});
    ghost->possessTargetId.clear();
    ghost->possessInput.reset();
    return ActionResult::Ok();
}

ActionResult MatchRoom::SetPossessInput(const std::string& playerId, const PlayerInput& input)
{
    PlayerState* ghost = FindPlaying(playerId);
    if (ghost == nullptr || !ghost->isGhost || ghost->possessTargetId.empty())
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    ghost->possessInput = input;
    return ActionResult::Ok();
}

ActionResult MatchRoom::ToggleLight(const std::string& playerId, const std::string& lightId)
{
    PlayerState* ghost = FindPlaying(playerId);
    if (ghost == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!ghost->isGhost)
    {
        return ActionResult::Fail(reason::kNotAllowed);
    }

    const auto it = m_context.mazeState.lightStates.find(lightId);
    if (it == m_context.mazeState.lightStates.end())
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    it->second = !it->second;
    m_context.Publish("light_toggled", {lightId, it->second ? "on" : "off"});
    return ActionResult::Ok();
}

// --- Pipes ---

ActionResult MatchRoom::EnterPipe(const std::string& playerId, const std::string& nodeId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive || player->isGhost || player->isUnderground)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const maze::PipeNode* node = m_context.layout.FindPipeNode(nodeId);
    if (node == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    if (m_context.mazeState.IsPipeLocked(nodeId))
    {
        return ActionResult::Fail(reason::kLocked);
    }
    if (DistanceXZ(player->position, node->surfacePosition) > m_context.tuning.pipeRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    m_context.ReleaseActiveTask(*player);
    player->position = node->undergroundPosition;
    player->isUnderground = true;
    player->currentPipeNodeId = nodeId;
    std::cout << "[Pipe] " << player->name << " entered pipe at " << node->roomName << "\n";
    return ActionResult::Ok();
}

ActionResult MatchRoom::ExitPipe(const std::string& playerId, const std::string& nodeId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive || !player->isUnderground)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const maze::PipeNode* node = m_context.layout.FindPipeNode(nodeId);
    if (node == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }
    if (m_context.mazeState.IsPipeLocked(nodeId))
    {
        return ActionResult::Fail(reason::kLocked);
    }
    if (DistanceXZ(player->position, node->undergroundPosition) > m_context.tuning.pipeRange)
    {
        return ActionResult::Fail(reason::kTooFar);
    }

    player->position = node->surfacePosition;
    player->isUnderground = false;
    player->currentPipeNodeId.clear();
    std::cout << "[Pipe] " << player->name << " exited pipe at " << node->roomName << "\n";
    return ActionResult::Ok();
}

ActionResult MatchRoom::TravelPipe(const std::string& playerId, const std::string& nodeId)
{
    PlayerState* player = FindPlaying(playerId);
    if (player == nullptr)
    {
        return ActionResult::Fail(reason::kWrongState);
    }
    if (!player->isAlive || !player->isUnderground)
    {
        return ActionResult::Fail(reason::kWrongState);
    }

    const maze::PipeNode* node = m_context.layout.FindPipeNode(nodeId);
    if (node == nullptr)
    {
        return ActionResult::Fail(reason::kNotFound);
    }

    player->position = node->undergroundPosition;
    player->currentPipeNodeId = nodeId;
    std::cout << "[Pipe] " << player->name << " travelled to " << node->roomName << "\n";
    return ActionResult::Ok();
}
} // namespace trisolar::gameplay
