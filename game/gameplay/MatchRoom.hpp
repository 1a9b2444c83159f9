#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <glm/vec3.hpp>

#include "game/cosmos/CosmicScenario.hpp"
#include "game/gameplay/ActionResult.hpp"
#include "game/gameplay/HazardSystem.hpp"
#include "game/gameplay/MatchContext.hpp"
#include "game/gameplay/MatchSnapshot.hpp"
#include "game/gameplay/MatchTuning.hpp"
#include "game/gameplay/PowerRegistry.hpp"
#include "game/gameplay/PowerSystem.hpp"

namespace trisolar::gameplay
{
struct RoomLimits
{
    int minPlayers = 1;
    int maxPlayers = 10;
};

struct MeetingState
{
    std::string reporterId;
    std::string bodyId; ///< empty for the emergency button
    MeetingStage stage = MeetingStage::Discussion;
    std::int64_t stageEndMs = 0;
    std::map<std::string, std::string> votes; ///< voter -> target, "" = skip
    std::vector<std::string> alivePlayers;
    std::map<std::string, glm::vec3> preMeetingPositions;
    std::string ejectedId;
};

struct MatchResult
{
    std::string winner; ///< "crew" or "shadow"
    std::string reason;
    int tasksCompleted = 0;
    int totalTasks = 0;
    double durationSeconds = 0.0;
};

struct JoinResult
{
    ActionResult status;
    std::string playerId;
    std::string sessionToken;
    bool reconnected = false;
};

/// One isolated match: lobby, role deal, the fixed-step tick and every
/// player action. Actions validate against the state of the last tick and
/// take effect immediately; the owning server loop is the only caller.
class MatchRoom
{
public:
    MatchRoom(
        std::string code,
        MatchTuning tuning,
        PowerRegistry registry,
        cosmos::CosmicScenario scenario,
        std::uint32_t rngSeed,
        RoomLimits limits = RoomLimits{}
    );

    // --- Lobby ---
    /// A known session token reconnects its player; otherwise a new player joins.
    [[nodiscard]] JoinResult Join(const std::string& name, const std::string& sessionToken, std::int64_t nowMs);
    void Disconnect(const std::string& playerId, std::int64_t nowMs);
    [[nodiscard]] ActionResult Start(std::int64_t nowMs, std::uint32_t mazeSeed);

    /// One fixed step. Runs the full simulation while playing and only the
    /// meeting timers during a meeting.
    void Tick(std::int64_t nowMs);
    /// Delivers queued events to subscribers.
    void FlushEvents();

    // --- Movement ---
    [[nodiscard]] ActionResult QueueInput(const std::string& playerId, const PlayerInput& input);
    [[nodiscard]] ActionResult SetMindControlInput(const std::string& playerId, const PlayerInput& input);
    [[nodiscard]] ActionResult ActivateControlledPower(const std::string& playerId);

    // --- Doors and tasks ---
    [[nodiscard]] ActionResult InteractDoor(const std::string& playerId, const std::string& doorId);
    [[nodiscard]] ActionResult LockDoor(const std::string& playerId, const std::string& doorId);
    [[nodiscard]] ActionResult StartTask(const std::string& playerId, const std::string& taskId);
    [[nodiscard]] ActionResult CompleteTask(const std::string& playerId, const std::string& taskId);
    [[nodiscard]] ActionResult CancelTask(const std::string& playerId, const std::string& taskId);

    // --- Powers ---
    [[nodiscard]] ActionResult ActivatePower(const std::string& playerId, const PowerRequest& request);
    [[nodiscard]] ActionResult DeactivatePower(const std::string& playerId);
    [[nodiscard]] ActionResult HackerAction(const std::string& playerId, const std::string& targetType, const std::string& targetId);

    // --- Shadow and meetings ---
    [[nodiscard]] ActionResult AttemptKill(const std::string& playerId, const std::string& targetId);
    [[nodiscard]] ActionResult ReportBody(const std::string& playerId, const std::string& bodyId);
    [[nodiscard]] ActionResult CallEmergencyMeeting(const std::string& playerId);
    /// An empty targetId is a skip vote.
    [[nodiscard]] ActionResult CastVote(const std::string& playerId, const std::string& targetId);

    // --- Oxygen ---
    [[nodiscard]] ActionResult StartRefill(const std::string& playerId, const std::string& generatorId);
    [[nodiscard]] ActionResult CancelRefill(const std::string& playerId);

    // --- Ghosts ---
    [[nodiscard]] ActionResult Possess(const std::string& playerId, const std::string& targetId);
    [[nodiscard]] ActionResult ReleasePossession(const std::string& playerId);
    [[nodiscard]] ActionResult SetPossessInput(const std::string& playerId, const PlayerInput& input);
    [[nodiscard]] ActionResult ToggleLight(const std::string& playerId, const std::string& lightId);

    // --- Pipes ---
    [[nodiscard]] ActionResult EnterPipe(const std::string& playerId, const std::string& nodeId);
    [[nodiscard]] ActionResult ExitPipe(const std::string& playerId, const std::string& nodeId);
    [[nodiscard]] ActionResult TravelPipe(const std::string& playerId, const std::string& nodeId);

    [[nodiscard]] const std::string& Code() const { return m_code; }
    [[nodiscard]] MatchPhase Phase() const { return m_phase; }
    [[nodiscard]] std::uint32_t MazeSeed() const { return m_mazeSeed; }
    [[nodiscard]] std::size_t PlayerCount() const { return m_context.players.size(); }
    [[nodiscard]] bool IsFinished() const { return m_phase == MatchPhase::Ended; }
    [[nodiscard]] const std::optional<MeetingState>& Meeting() const { return m_meeting; }
    [[nodiscard]] const std::optional<MatchResult>& Result() const { return m_result; }
    [[nodiscard]] const MatchSnapshot& LatestSnapshot() const { return m_snapshot; }
    [[nodiscard]] const PowerSystem& Powers() const { return m_powers; }
    [[nodiscard]] core::EventBus& Events() { return m_context.events; }

    [[nodiscard]] MatchContext& Context() { return m_context; }
    [[nodiscard]] const MatchContext& Context() const { return m_context; }

private:
    [[nodiscard]] PlayerState* FindPlaying(const std::string& playerId);
    [[nodiscard]] std::string NextSessionToken();
    [[nodiscard]] std::string NextFreeColor() const;

    void AssignRolesAndPowers();
    void AssignTasks();
    void PlaceSpawns();

    // --- Tick steps ---
    void SamplePositionHistory();
    void UpdateEra();
    void UpdateDynamicWalls();
    void ExpireLocks();
    void ExpirePossession();
    void ProcessInputs(float dtSeconds);
    void ProcessRedirectedInputs(float dtSeconds);
    void UpdateOxygen(float dtSeconds);
    void BuildSnapshot();
    void CheckWinConditions();

    // --- Meetings ---
    void TriggerMeeting(const std::string& reporterId, const std::string& bodyId);
    void UpdateMeeting();
    void ResolveVotes();
    void ResumeFromMeeting();

    void MovePlayer(PlayerState& player, const PlayerInput& input, float dtSeconds);
    void RemoveExpiredDisconnects();
    void RemovePlayer(const std::string& playerId);
    void EndMatch(const std::string& winner, const std::string& reason);

    std::string m_code;
    RoomLimits m_limits;
    MatchPhase m_phase = MatchPhase::Lobby;
    MatchContext m_context;
    PowerSystem m_powers;
    HazardSystem m_hazards;
    std::optional<MeetingState> m_meeting;
    std::optional<MatchResult> m_result;
    MatchSnapshot m_snapshot;
    std::mt19937 m_tokenRng;
    std::uint32_t m_mazeSeed = 0;
    std::uint32_t m_snapshotSeq = 0;
    int m_nextPlayerId = 1;
    bool m_wasBinary = false;
    bool m_oxygenDepleted = false;
};
} // namespace trisolar::gameplay
