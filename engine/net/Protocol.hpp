#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/core/EventBus.hpp"
#include "game/gameplay/MatchSnapshot.hpp"
#include "game/gameplay/Movement.hpp"
#include "game/gameplay/PlayerState.hpp"
#include "game/gameplay/PowerTypes.hpp"

namespace trisolar::net
{
constexpr std::int32_t kProtocolVersion = 3;

// --- Client to server ---
constexpr std::uint8_t kPacketHello = 1;
constexpr std::uint8_t kPacketStartMatch = 2;
constexpr std::uint8_t kPacketInput = 3;
constexpr std::uint8_t kPacketDoorInteract = 4;
constexpr std::uint8_t kPacketDoorLock = 5;
constexpr std::uint8_t kPacketTaskStart = 6;
constexpr std::uint8_t kPacketTaskComplete = 7;
constexpr std::uint8_t kPacketTaskCancel = 8;
constexpr std::uint8_t kPacketPowerActivate = 9;
constexpr std::uint8_t kPacketPowerDeactivate = 10;
constexpr std::uint8_t kPacketKillAttempt = 11;
constexpr std::uint8_t kPacketOxygenStartRefill = 12;
constexpr std::uint8_t kPacketOxygenCancelRefill = 13;
constexpr std::uint8_t kPacketBodyReport = 14;
constexpr std::uint8_t kPacketEmergencyMeeting = 15;
constexpr std::uint8_t kPacketVoteCast = 16;
constexpr std::uint8_t kPacketMindControlInput = 17;
constexpr std::uint8_t kPacketMindControlPower = 18;
constexpr std::uint8_t kPacketHackerAction = 19;
constexpr std::uint8_t kPacketGhostPossess = 20;
constexpr std::uint8_t kPacketGhostRelease = 21;
constexpr std::uint8_t kPacketGhostPossessInput = 22;
constexpr std::uint8_t kPacketGhostToggleLight = 23;
constexpr std::uint8_t kPacketPipeEnter = 24;
constexpr std::uint8_t kPacketPipeExit = 25;
constexpr std::uint8_t kPacketPipeTravel = 26;

// --- Server to client ---
constexpr std::uint8_t kPacketWelcome = 100;
constexpr std::uint8_t kPacketMatchStarted = 101;
constexpr std::uint8_t kPacketSnapshot = 102;
constexpr std::uint8_t kPacketEvent = 103;
constexpr std::uint8_t kPacketActionRejected = 104;

/// Input flag bits shared by Input, MindControlInput and GhostPossessInput.
constexpr std::uint8_t kInputForward = 1U << 0;
constexpr std::uint8_t kInputBackward = 1U << 1;
constexpr std::uint8_t kInputLeft = 1U << 2;
constexpr std::uint8_t kInputRight = 1U << 3;

struct HelloPacket
{
    std::int32_t protocolVersion = kProtocolVersion;
    std::string name;
    std::string roomCode;
    std::string sessionToken; ///< empty for a fresh join
};

struct StartMatchPacket
{
    std::optional<std::uint32_t> mazeSeed;
};

/// Input (with seq and pitch), MindControlInput or GhostPossessInput.
struct InputPacket
{
    std::uint8_t type = kPacketInput;
    gameplay::PlayerInput input;
};

/// Every action that carries a single id. An empty VoteCast target is a skip.
struct TargetPacket
{
    std::uint8_t type = 0;
    std::string targetId;
};

struct PowerActivatePacket
{
    std::string targetId;
    std::optional<glm::vec3> point;
    std::string bodyId;
};

struct HackerActionPacket
{
    std::string targetType;
    std::string targetId;
};

/// Actions with no payload: PowerDeactivate, OxygenCancelRefill,
/// EmergencyMeeting, MindControlPower, GhostRelease.
struct SignalPacket
{
    std::uint8_t type = 0;
};

using ClientPacket = std::variant<
    HelloPacket,
    StartMatchPacket,
    InputPacket,
    TargetPacket,
    PowerActivatePacket,
    HackerActionPacket,
    SignalPacket>;

/// Action name used in ActionRejected, e.g. "door_interact".
[[nodiscard]] const char* PacketActionName(std::uint8_t type);

[[nodiscard]] std::uint8_t PackInputFlags(const gameplay::PlayerInput& input);
void UnpackInputFlags(std::uint8_t flags, gameplay::PlayerInput& outInput);

void EncodeHello(const HelloPacket& packet, std::vector<std::uint8_t>& outBuffer);
void EncodeStartMatch(const StartMatchPacket& packet, std::vector<std::uint8_t>& outBuffer);
void EncodeInput(const InputPacket& packet, std::vector<std::uint8_t>& outBuffer);
/// False when type is not a single-id action.
bool EncodeTarget(const TargetPacket& packet, std::vector<std::uint8_t>& outBuffer);
void EncodePowerActivate(const PowerActivatePacket& packet, std::vector<std::uint8_t>& outBuffer);
void EncodeHackerAction(const HackerActionPacket& packet, std::vector<std::uint8_t>& outBuffer);
/// False when type is not a payload-free action.
bool EncodeSignal(const SignalPacket& packet, std::vector<std::uint8_t>& outBuffer);

/// Malformed or unknown packets yield nullopt. Trailing bytes are rejected.
[[nodiscard]] std::optional<ClientPacket> DecodeClientPacket(const std::vector<std::uint8_t>& buffer);

struct WelcomePacket
{
    std::string playerId;
    std::string sessionToken;
    std::string roomCode;
    bool reconnected = false;
};

/// Private to one player. Geometry is never sent: clients regenerate it from the seed.
struct MatchStartedPacket
{
    gameplay::Role role = gameplay::Role::Crew;
    gameplay::PowerType power = gameplay::PowerType::None;
    std::uint32_t mazeSeed = 0;
    std::uint32_t playerCount = 0;
    std::vector<std::string> assignedTasks;
    std::string scenarioJson;
};

struct ActionRejectedPacket
{
    std::string action;
    std::string reason;
};

void EncodeWelcome(const WelcomePacket& packet, std::vector<std::uint8_t>& outBuffer);
bool DecodeWelcome(const std::vector<std::uint8_t>& buffer, WelcomePacket& outPacket);

void EncodeMatchStarted(const MatchStartedPacket& packet, std::vector<std::uint8_t>& outBuffer);
bool DecodeMatchStarted(const std::vector<std::uint8_t>& buffer, MatchStartedPacket& outPacket);

/// Other players who are invisible are left out of the viewer's copy.
void EncodeSnapshot(
    const gameplay::MatchSnapshot& snapshot,
    const std::string& viewerId,
    std::vector<std::uint8_t>& outBuffer
);
bool DecodeSnapshot(const std::vector<std::uint8_t>& buffer, gameplay::MatchSnapshot& outSnapshot);

void EncodeEvent(const core::Event& event, std::vector<std::uint8_t>& outBuffer);
bool DecodeEvent(const std::vector<std::uint8_t>& buffer, core::Event& outEvent);

void EncodeActionRejected(const ActionRejectedPacket& packet, std::vector<std::uint8_t>& outBuffer);
bool DecodeActionRejected(const std::vector<std::uint8_t>& buffer, ActionRejectedPacket& outPacket);
} // namespace trisolar::net
