#include "engine/net/Protocol.hpp"

#include <cmath>

#include "engine/net/ByteCodec.hpp"

namespace trisolar::net
{
namespace
{
constexpr std::size_t kMaxNameLength = 32;
constexpr std::size_t kMaxIdLength = 64;
constexpr std::size_t kMaxTextLength = 1024;
constexpr std::uint16_t kMaxListLength = 4096;

bool IsTargetType(std::uint8_t type)
{
    switch (type)
    {
        case kPacketDoorInteract:
        case kPacketDoorLock:
        case kPacketTaskStart:
        case kPacketTaskComplete:
        case kPacketTaskCancel:
        case kPacketKillAttempt:
        case kPacketOxygenStartRefill:
        case kPacketBodyReport:
        case kPacketVoteCast:
        case kPacketGhostPossess:
        case kPacketGhostToggleLight:
        case kPacketPipeEnter:
        case kPacketPipeExit:
        case kPacketPipeTravel:
            return true;
        default:
            return false;
    }
}

bool IsSignalType(std::uint8_t type)
{
    switch (type)
    {
        case kPacketPowerDeactivate:
        case kPacketOxygenCancelRefill:
        case kPacketEmergencyMeeting:
        case kPacketMindControlPower:
        case kPacketGhostRelease:
            return true;
        default:
            return false;
    }
}

bool IsRedirectedInputType(std::uint8_t type)
{
    return type == kPacketMindControlInput || type == kPacketGhostPossessInput;
}

void AppendVec3(std::vector<std::uint8_t>& buffer, const glm::vec3& value)
{
    AppendValue(buffer, value.x);
    AppendValue(buffer, value.y);
    AppendValue(buffer, value.z);
}

bool ReadVec3(const std::vector<std::uint8_t>& buffer, std::size_t& offset, glm::vec3& outValue)
{
    return ReadValue(buffer, offset, outValue.x) && ReadValue(buffer, offset, outValue.y)
        && ReadValue(buffer, offset, outValue.z);
}

void AppendVec2(std::vector<std::uint8_t>& buffer, const glm::vec2& value)
{
    AppendValue(buffer, value.x);
    AppendValue(buffer, value.y);
}

bool ReadVec2(const std::vector<std::uint8_t>& buffer, std::size_t& offset, glm::vec2& outValue)
{
    return ReadValue(buffer, offset, outValue.x) && ReadValue(buffer, offset, outValue.y);
}

void AppendStringList(std::vector<std::uint8_t>& buffer, const std::vector<std::string>& values)
{
    const auto count = static_cast<std::uint16_t>(std::min<std::size_t>(values.size(), kMaxListLength));
    AppendValue(buffer, count);
    for (std::uint16_t i = 0; i < count; ++i)
    {
        AppendString(buffer, values[i], kMaxTextLength);
    }
}

bool ReadStringList(const std::vector<std::uint8_t>& buffer, std::size_t& offset, std::vector<std::string>& outValues)
{
    std::uint16_t count = 0;
    if (!ReadValue(buffer, offset, count) || count > kMaxListLength)
    {
        return false;
    }
    outValues.clear();
    outValues.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i)
    {
        std::string value;
        if (!ReadString(buffer, offset, value))
        {
            return false;
        }
        outValues.push_back(std::move(value));
    }
    return true;
}

/// Count prefix followed by one entry per element.
template <typename T, typename Writer>
void AppendList(std::vector<std::uint8_t>& buffer, const std::vector<T>& values, Writer writer)
{
    const auto count = static_cast<std::uint16_t>(std::min<std::size_t>(values.size(), kMaxListLength));
    AppendValue(buffer, count);
    for (std::uint16_t i = 0; i < count; ++i)
    {
        writer(values[i]);
    }
}

template <typename T, typename Reader>
bool ReadList(const std::vector<std::uint8_t>& buffer, std::size_t& offset, std::vector<T>& outValues, Reader reader)
{
    std::uint16_t count = 0;
    if (!ReadValue(buffer, offset, count) || count > kMaxListLength)
    {
        return false;
    }
    outValues.clear();
    outValues.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i)
    {
        T value{};
        if (!reader(value))
        {
            return false;
        }
        outValues.push_back(std::move(value));
    }
    return true;
}

bool ReadHeader(const std::vector<std::uint8_t>& buffer, std::size_t& offset, std::uint8_t expected)
{
    std::uint8_t type = 0;
    return ReadValue(buffer, offset, type) && type == expected;
}
} // namespace

const char* PacketActionName(std::uint8_t type)
{
    switch (type)
    {
        case kPacketHello: return "hello";
        case kPacketStartMatch: return "start_match";
        case kPacketInput: return "input";
        case kPacketDoorInteract: return "door_interact";
        case kPacketDoorLock: return "door_lock";
        case kPacketTaskStart: return "task_start";
        case kPacketTaskComplete: return "task_complete";
        case kPacketTaskCancel: return "task_cancel";
        case kPacketPowerActivate: return "power_activate";
        case kPacketPowerDeactivate: return "power_deactivate";
        case kPacketKillAttempt: return "kill_attempt";
        case kPacketOxygenStartRefill: return "oxygen_start_refill";
        case kPacketOxygenCancelRefill: return "oxygen_cancel_refill";
        case kPacketBodyReport: return "body_report";
        case kPacketEmergencyMeeting: return "emergency_meeting";
        case kPacketVoteCast: return "vote_cast";
        case kPacketMindControlInput: return "mind_control_input";
        case kPacketMindControlPower: return "mind_control_power";
        case kPacketHackerAction: return "hacker_action";
        case kPacketGhostPossess: return "ghost_possess";
        case kPacketGhostRelease: return "ghost_release";
        case kPacketGhostPossessInput: return "ghost_possess_input";
        case kPacketGhostToggleLight: return "ghost_toggle_light";
        case kPacketPipeEnter: return "pipe_enter";
        case kPacketPipeExit: return "pipe_exit";
        case kPacketPipeTravel: return "pipe_travel";
        default: return "unknown";
    }
}

std::uint8_t PackInputFlags(const gameplay::PlayerInput& input)
{
    std::uint8_t flags = 0;
    flags |= input.forward ? kInputForward : 0;
    flags |= input.backward ? kInputBackward : 0;
    flags |= input.left ? kInputLeft : 0;
    flags |= input.right ? kInputRight : 0;
    return flags;
}

void UnpackInputFlags(std::uint8_t flags, gameplay::PlayerInput& outInput)
{
    outInput.forward = (flags & kInputForward) != 0;
    outInput.backward = (flags & kInputBackward) != 0;
    outInput.left = (flags & kInputLeft) != 0;
    outInput.right = (flags & kInputRight) != 0;
}

// --- Client packets ---

void EncodeHello(const HelloPacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, kPacketHello);
    AppendValue(outBuffer, packet.protocolVersion);
    AppendString(outBuffer, packet.name, kMaxNameLength);
    AppendString(outBuffer, packet.roomCode, kMaxIdLength);
    AppendString(outBuffer, packet.sessionToken, kMaxIdLength);
}

void EncodeStartMatch(const StartMatchPacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, kPacketStartMatch);
    AppendBool(outBuffer, packet.mazeSeed.has_value());
    if (packet.mazeSeed.has_value())
    {
        AppendValue(outBuffer, *packet.mazeSeed);
    }
}

void EncodeInput(const InputPacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, packet.type);
    if (packet.type == kPacketInput)
    {
        AppendValue(outBuffer, packet.input.seq);
    }
    AppendValue(outBuffer, PackInputFlags(packet.input));
    AppendValue(outBuffer, packet.input.yaw);
    if (packet.type == kPacketInput)
    {
        AppendValue(outBuffer, packet.input.pitch);
    }
}

bool EncodeTarget(const TargetPacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    if (!IsTargetType(packet.type))
    {
        return false;
    }
    AppendValue(outBuffer, packet.type);
    AppendString(outBuffer, packet.targetId, kMaxIdLength);
    return true;
}

void EncodePowerActivate(const PowerActivatePacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, kPacketPowerActivate);
    AppendString(outBuffer, packet.targetId, kMaxIdLength);
    AppendBool(outBuffer, packet.point.has_value());
    if (packet.point.has_value())
    {
        AppendVec3(outBuffer, *packet.point);
    }
    AppendString(outBuffer, packet.bodyId, kMaxIdLength);
}

void EncodeHackerAction(const HackerActionPacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, kPacketHackerAction);
    AppendString(outBuffer, packet.targetType, kMaxIdLength);
    AppendString(outBuffer, packet.targetId, kMaxIdLength);
}

bool EncodeSignal(const SignalPacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    if (!IsSignalType(packet.type))
    {
        return false;
    }
    AppendValue(outBuffer, packet.type);
    return true;
}

std::optional<ClientPacket> DecodeClientPacket(const std::vector<std::uint8_t>& buffer)
{
    std::size_t offset = 0;
    std::uint8_t type = 0;
    if (!ReadValue(buffer, offset, type))
    {
        return std::nullopt;
    }

    std::optional<ClientPacket> result;
    if (type == kPacketHello)
    {
        HelloPacket packet;
        if (ReadValue(buffer, offset, packet.protocolVersion) && ReadString(buffer, offset, packet.name)
            && ReadString(buffer, offset, packet.roomCode) && ReadString(buffer, offset, packet.sessionToken))
        {
            result = packet;
        }
    }
    else if (type == kPacketStartMatch)
    {
        StartMatchPacket packet;
        bool hasSeed = false;
        if (ReadBool(buffer, offset, hasSeed))
        {
            std::uint32_t seed = 0;
            if (!hasSeed)
            {
                result = packet;
            }
            else if (ReadValue(buffer, offset, seed))
            {
                packet.mazeSeed = seed;
                result = packet;
            }
        }
    }
    else if (type == kPacketInput || IsRedirectedInputType(type))
    {
        InputPacket packet;
        packet.type = type;
        std::uint8_t flags = 0;
        bool ok = type != kPacketInput || ReadValue(buffer, offset, packet.input.seq);
        ok = ok && ReadValue(buffer, offset, flags) && ReadValue(buffer, offset, packet.input.yaw);
        ok = ok && (type != kPacketInput || ReadValue(buffer, offset, packet.input.pitch));
        ok = ok && std::isfinite(packet.input.yaw) && std::isfinite(packet.input.pitch);
        if (ok)
        {
            UnpackInputFlags(flags, packet.input);
            result = packet;
        }
    }
    else if (IsTargetType(type))
    {
        TargetPacket packet;
        packet.type = type;
        if (ReadString(buffer, offset, packet.targetId))
        {
            result = packet;
        }
    }
    else if (type == kPacketPowerActivate)
    {
        PowerActivatePacket packet;
        bool hasPoint = false;
        bool ok = ReadString(buffer, offset, packet.targetId) && ReadBool(buffer, offset, hasPoint);
        if (ok && hasPoint)
        {
            glm::vec3 point{0.0F};
            ok = ReadVec3(buffer, offset, point) && std::isfinite(point.x) && std::isfinite(point.y) && std::isfinite(point.z);
            packet.point = point;
        }
        if (ok && ReadString(buffer, offset, packet.bodyId))
        {
            result = packet;
        }
    }
    else if (type == kPacketHackerAction)
    {
        HackerActionPacket packet;
        if (ReadString(buffer, offset, packet.targetType) && ReadString(buffer, offset, packet.targetId))
        {
            result = packet;
        }
    }
    else if (IsSignalType(type))
    {
        result = SignalPacket{type};
    }

    if (offset != buffer.size())
    {
        return std::nullopt;
    }
    return result;
}

// --- Server packets ---

void EncodeWelcome(const WelcomePacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, kPacketWelcome);
    AppendValue(outBuffer, kProtocolVersion);
    AppendString(outBuffer, packet.playerId, kMaxIdLength);
    AppendString(outBuffer, packet.sessionToken, kMaxIdLength);
    AppendString(outBuffer, packet.roomCode, kMaxIdLength);
    AppendBool(outBuffer, packet.reconnected);
}

bool DecodeWelcome(const std::vector<std::uint8_t>& buffer, WelcomePacket& outPacket)
{
    std::size_t offset = 0;
    std::int32_t version = 0;
    if (!ReadHeader(buffer, offset, kPacketWelcome) || !ReadValue(buffer, offset, version) || version != kProtocolVersion)
    {
        return false;
    }
    return ReadString(buffer, offset, outPacket.playerId) && ReadString(buffer, offset, outPacket.sessionToken)
        && ReadString(buffer, offset, outPacket.roomCode) && ReadBool(buffer, offset, outPacket.reconnected);
}

void EncodeMatchStarted(const MatchStartedPacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, kPacketMatchStarted);
    AppendValue(outBuffer, static_cast<std::uint8_t>(packet.role));
    AppendValue(outBuffer, static_cast<std::uint8_t>(packet.power));
    AppendValue(outBuffer, packet.mazeSeed);
    AppendValue(outBuffer, packet.playerCount);
    AppendStringList(outBuffer, packet.assignedTasks);

    // Scenario JSON can exceed the short string limit.
    const auto length = static_cast<std::uint32_t>(packet.scenarioJson.size());
    AppendValue(outBuffer, length);
    outBuffer.insert(outBuffer.end(), packet.scenarioJson.begin(), packet.scenarioJson.end());
}

bool DecodeMatchStarted(const std::vector<std::uint8_t>& buffer, MatchStartedPacket& outPacket)
{
    std::size_t offset = 0;
    std::uint8_t roleByte = 0;
    std::uint8_t powerByte = 0;
    if (!ReadHeader(buffer, offset, kPacketMatchStarted) || !ReadValue(buffer, offset, roleByte)
        || !ReadValue(buffer, offset, powerByte) || !ReadValue(buffer, offset, outPacket.mazeSeed)
        || !ReadValue(buffer, offset, outPacket.playerCount) || !ReadStringList(buffer, offset, outPacket.assignedTasks))
    {
        return false;
    }
    if (roleByte > static_cast<std::uint8_t>(gameplay::Role::Shadow)
        || powerByte > static_cast<std::uint8_t>(gameplay::PowerType::Oracle))
    {
        return false;
    }
    outPacket.role = static_cast<gameplay::Role>(roleByte);
    outPacket.power = static_cast<gameplay::PowerType>(powerByte);

    std::uint32_t length = 0;
    if (!ReadValue(buffer, offset, length) || offset + length > buffer.size())
    {
        return false;
    }
    outPacket.scenarioJson.assign(reinterpret_cast<const char*>(buffer.data() + offset), length);
    return true;
}

void EncodeSnapshot(const gameplay::MatchSnapshot& snapshot, const std::string& viewerId, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    outBuffer.reserve(512 + snapshot.players.size() * 96);
    AppendValue(outBuffer, kPacketSnapshot);
    AppendValue(outBuffer, snapshot.seq);
    AppendValue(outBuffer, snapshot.serverTimeMs);
    AppendValue(outBuffer, static_cast<std::uint8_t>(snapshot.phase));

    AppendValue(outBuffer, static_cast<std::uint8_t>(snapshot.era));
    AppendValue(outBuffer, snapshot.gravity);
    AppendString(outBuffer, snapshot.eraDescription, kMaxTextLength);
    AppendValue(outBuffer, snapshot.eraSecondsRemaining);
    for (const glm::vec3& sun : snapshot.sunPositions)
    {
        AppendVec3(outBuffer, sun);
    }
    AppendBool(outBuffer, snapshot.isBinary);

    AppendValue(outBuffer, snapshot.shipOxygen);
    AppendList(outBuffer, snapshot.doors, [&](const gameplay::DoorSnapshot& door) {
        AppendString(outBuffer, door.doorId, kMaxIdLength);
        AppendBool(outBuffer, door.isOpen);
        AppendBool(outBuffer, door.isLocked);
    });
    const auto appendFlag = [&](const std::pair<std::string, bool>& entry) {
        AppendString(outBuffer, entry.first, kMaxIdLength);
        AppendBool(outBuffer, entry.second);
    };
    AppendList(outBuffer, snapshot.lights, appendFlag);
    AppendList(outBuffer, snapshot.dynamicWalls, appendFlag);
    AppendList(outBuffer, snapshot.barriers, [&](const maze::BarrierWall& barrier) {
        AppendString(outBuffer, barrier.wallId, kMaxIdLength);
        AppendString(outBuffer, barrier.ownerId, kMaxIdLength);
        AppendVec2(outBuffer, barrier.start);
        AppendVec2(outBuffer, barrier.end);
        AppendValue(outBuffer, barrier.expiresAtMs);
    });
    AppendList(outBuffer, snapshot.tasks, [&](const std::pair<std::string, maze::TaskCompletion>& task) {
        AppendString(outBuffer, task.first, kMaxIdLength);
        AppendValue(outBuffer, static_cast<std::uint8_t>(task.second));
    });
    AppendStringList(outBuffer, snapshot.lockedPipes);
    AppendStringList(outBuffer, snapshot.disabledGenerators);
    AppendValue(outBuffer, static_cast<std::int32_t>(snapshot.tasksCompleted));
    AppendValue(outBuffer, static_cast<std::int32_t>(snapshot.totalTasks));

    std::vector<const gameplay::PlayerSnapshot*> visible;
    for (const gameplay::PlayerSnapshot& player : snapshot.players)
    {
        if (!player.isInvisible || player.playerId == viewerId)
        {
            visible.push_back(&player);
        }
    }
    AppendList(outBuffer, visible, [&](const gameplay::PlayerSnapshot* player) {
        AppendString(outBuffer, player->playerId, kMaxIdLength);
        AppendString(outBuffer, player->name, kMaxNameLength);
        AppendString(outBuffer, player->color, kMaxIdLength);
        AppendVec3(outBuffer, player->position);
        AppendValue(outBuffer, player->rotation.w);
        AppendValue(outBuffer, player->rotation.x);
        AppendValue(outBuffer, player->rotation.y);
        AppendValue(outBuffer, player->rotation.z);
        std::uint16_t flags = 0;
        flags |= player->isAlive ? 1U << 0 : 0U;
        flags |= player->isGhost ? 1U << 1 : 0U;
        flags |= player->isInvisible ? 1U << 2 : 0U;
        flags |= player->hasShield ? 1U << 3 : 0U;
        flags |= player->isImpermeable ? 1U << 4 : 0U;
        flags |= player->isUnderground ? 1U << 5 : 0U;
        flags |= player->inShelter ? 1U << 6 : 0U;
        flags |= player->powerActive ? 1U << 7 : 0U;
        flags |= player->connected ? 1U << 8 : 0U;
        AppendValue(outBuffer, flags);
        AppendValue(outBuffer, player->speedMultiplier);
        AppendValue(outBuffer, player->health);
        AppendValue(outBuffer, static_cast<std::uint8_t>(player->damageSource));
        AppendValue(outBuffer, player->lastProcessedInput);
        AppendString(outBuffer, player->activeTaskId, kMaxIdLength);
    });

    AppendList(outBuffer, snapshot.bodies, [&](const gameplay::DeadBody& body) {
        AppendString(outBuffer, body.bodyId, kMaxIdLength);
        AppendString(outBuffer, body.victimId, kMaxIdLength);
        AppendString(outBuffer, body.victimColor, kMaxIdLength);
        AppendVec3(outBuffer, body.position);
        AppendBool(outBuffer, body.reported);
    });

    AppendValue(outBuffer, static_cast<std::uint8_t>(snapshot.meetingStage));
    AppendValue(outBuffer, snapshot.meetingStageEndMs);
}

bool DecodeSnapshot(const std::vector<std::uint8_t>& buffer, gameplay::MatchSnapshot& outSnapshot)
{
    std::size_t offset = 0;
    gameplay::MatchSnapshot snapshot;
    std::uint8_t phaseByte = 0;
    std::uint8_t eraByte = 0;
    if (!ReadHeader(buffer, offset, kPacketSnapshot) || !ReadValue(buffer, offset, snapshot.seq)
        || !ReadValue(buffer, offset, snapshot.serverTimeMs) || !ReadValue(buffer, offset, phaseByte)
        || !ReadValue(buffer, offset, eraByte) || !ReadValue(buffer, offset, snapshot.gravity)
        || !ReadString(buffer, offset, snapshot.eraDescription) || !ReadValue(buffer, offset, snapshot.eraSecondsRemaining))
    {
        return false;
    }
    if (phaseByte > static_cast<std::uint8_t>(gameplay::MatchPhase::Ended)
        || eraByte > static_cast<std::uint8_t>(cosmos::Era::ChaosGravity))
    {
        return false;
    }
    snapshot.phase = static_cast<gameplay::MatchPhase>(phaseByte);
    snapshot.era = static_cast<cosmos::Era>(eraByte);

    for (glm::vec3& sun : snapshot.sunPositions)
    {
        if (!ReadVec3(buffer, offset, sun))
        {
            return false;
        }
    }
    if (!ReadBool(buffer, offset, snapshot.isBinary) || !ReadValue(buffer, offset, snapshot.shipOxygen))
    {
        return false;
    }

    const bool stationOk =
        ReadList(buffer, offset, snapshot.doors, [&](gameplay::DoorSnapshot& door) {
            return ReadString(buffer, offset, door.doorId) && ReadBool(buffer, offset, door.isOpen)
                && ReadBool(buffer, offset, door.isLocked);
        })
        && ReadList(buffer, offset, snapshot.lights, [&](std::pair<std::string, bool>& entry) {
               return ReadString(buffer, offset, entry.first) && ReadBool(buffer, offset, entry.second);
           })
        && ReadList(buffer, offset, snapshot.dynamicWalls, [&](std::pair<std::string, bool>& entry) {
               return ReadString(buffer, offset, entry.first) && ReadBool(buffer, offset, entry.second);
           })
        && ReadList(buffer, offset, snapshot.barriers, [&](maze::BarrierWall& barrier) {
               return ReadString(buffer, offset, barrier.wallId) && ReadString(buffer, offset, barrier.ownerId)
                   && ReadVec2(buffer, offset, barrier.start) && ReadVec2(buffer, offset, barrier.end)
                   && ReadValue(buffer, offset, barrier.expiresAtMs);
           })
        && ReadList(buffer, offset, snapshot.tasks, [&](std::pair<std::string, maze::TaskCompletion>& task) {
               std::uint8_t completion = 0;
               if (!ReadString(buffer, offset, task.first) || !ReadValue(buffer, offset, completion)
                   || completion > static_cast<std::uint8_t>(maze::TaskCompletion::Completed))
               {
                   return false;
               }
               task.second = static_cast<maze::TaskCompletion>(completion);
               return true;
           })
        && ReadStringList(buffer, offset, snapshot.lockedPipes)
        && ReadStringList(buffer, offset, snapshot.disabledGenerators);
    if (!stationOk)
    {
        return false;
    }

    std::int32_t completed = 0;
    std::int32_t total = 0;
    if (!ReadValue(buffer, offset, completed) || !ReadValue(buffer, offset, total))
    {
        return false;
    }
    snapshot.tasksCompleted = completed;
    snapshot.totalTasks = total;

    const bool playersOk = ReadList(buffer, offset, snapshot.players, [&](gameplay::PlayerSnapshot& player) {
        std::uint16_t flags = 0;
        std::uint8_t damage = 0;
        const bool ok = ReadString(buffer, offset, player.playerId) && ReadString(buffer, offset, player.name)
            && ReadString(buffer, offset, player.color) && ReadVec3(buffer, offset, player.position)
            && ReadValue(buffer, offset, player.rotation.w) && ReadValue(buffer, offset, player.rotation.x)
            && ReadValue(buffer, offset, player.rotation.y) && ReadValue(buffer, offset, player.rotation.z)
            && ReadValue(buffer, offset, flags) && ReadValue(buffer, offset, player.speedMultiplier)
            && ReadValue(buffer, offset, player.health) && ReadValue(buffer, offset, damage)
            && ReadValue(buffer, offset, player.lastProcessedInput) && ReadString(buffer, offset, player.activeTaskId);
        if (!ok || damage > static_cast<std::uint8_t>(gameplay::DamageSource::Oxygen))
        {
            return false;
        }
        player.isAlive = (flags & (1U << 0)) != 0;
        player.isGhost = (flags & (1U << 1)) != 0;
        player.isInvisible = (flags & (1U << 2)) != 0;
        player.hasShield = (flags & (1U << 3)) != 0;
        player.isImpermeable = (flags & (1U << 4)) != 0;
        player.isUnderground = (flags & (1U << 5)) != 0;
        player.inShelter = (flags & (1U << 6)) != 0;
        player.powerActive = (flags & (1U << 7)) != 0;
        player.connected = (flags & (1U << 8)) != 0;
        player.damageSource = static_cast<gameplay::DamageSource>(damage);
        return true;
    });
    if (!playersOk)
    {
        return false;
    }

    const bool bodiesOk = ReadList(buffer, offset, snapshot.bodies, [&](gameplay::DeadBody& body) {
        return ReadString(buffer, offset, body.bodyId) && ReadString(buffer, offset, body.victimId)
            && ReadString(buffer, offset, body.victimColor) && ReadVec3(buffer, offset, body.position)
            && ReadBool(buffer, offset, body.reported);
    });
    std::uint8_t stageByte = 0;
    if (!bodiesOk || !ReadValue(buffer, offset, stageByte) || !ReadValue(buffer, offset, snapshot.meetingStageEndMs)
        || stageByte > static_cast<std::uint8_t>(gameplay::MeetingStage::Result))
    {
        return false;
    }
    snapshot.meetingStage = static_cast<gameplay::MeetingStage>(stageByte);

    outSnapshot = std::move(snapshot);
    return true;
}

void EncodeEvent(const core::Event& event, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, kPacketEvent);
    AppendString(outBuffer, event.name, kMaxIdLength);
    AppendValue(outBuffer, event.atMs);
    AppendStringList(outBuffer, event.args);
}

bool DecodeEvent(const std::vector<std::uint8_t>& buffer, core::Event& outEvent)
{
    std::size_t offset = 0;
    return ReadHeader(buffer, offset, kPacketEvent) && ReadString(buffer, offset, outEvent.name)
        && ReadValue(buffer, offset, outEvent.atMs) && ReadStringList(buffer, offset, outEvent.args);
}

void EncodeActionRejected(const ActionRejectedPacket& packet, std::vector<std::uint8_t>& outBuffer)
{
    outBuffer.clear();
    AppendValue(outBuffer, kPacketActionRejected);
    AppendString(outBuffer, packet.action, kMaxIdLength);
    AppendString(outBuffer, packet.reason, kMaxTextLength);
}

bool DecodeActionRejected(const std::vector<std::uint8_t>& buffer, ActionRejectedPacket& outPacket)
{
    std::size_t offset = 0;
    return ReadHeader(buffer, offset, kPacketActionRejected) && ReadString(buffer, offset, outPacket.action)
        && ReadString(buffer, offset, outPacket.reason);
}
} // namespace trisolar::net
