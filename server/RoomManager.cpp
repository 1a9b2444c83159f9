#include "server/RoomManager.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace trisolar::server
{
namespace
{
constexpr char kRoomCodeAlphabet[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
constexpr std::size_t kRoomCodeLength = 6;

constexpr const char* kVersionMismatch = "version_mismatch";
constexpr const char* kNotInRoom = "not_in_room";
constexpr const char* kNotHost = "not_host";
} // namespace

RoomManager::RoomManager(
    ServerConfig config,
    gameplay::MatchTuning tuning,
    gameplay::PowerRegistry registry,
    cosmos::CosmicScenario scenario,
    PacketSink& sink,
    std::uint32_t seed
)
    : m_config(config)
    , m_tuning(std::move(tuning))
    , m_registry(std::move(registry))
    , m_scenario(std::move(scenario))
    , m_sink(sink)
    , m_rng(seed)
{
    m_tuning.tickRate = m_config.tickRate;
    m_tuning.reconnectGraceMs = m_config.disconnectGraceMs;
    m_scenarioJson = cosmos::ScenarioToJson(m_scenario).dump();
}

gameplay::MatchRoom* RoomManager::FindRoom(const std::string& code)
{
    const auto it = m_rooms.find(code);
    return it == m_rooms.end() ? nullptr : it->second.room.get();
}

std::vector<std::string> RoomManager::RoomCodes() const
{
    std::vector<std::string> codes;
    codes.reserve(m_rooms.size());
    for (const auto& [code, entry] : m_rooms)
    {
        codes.push_back(code);
    }
    return codes;
}

void RoomManager::OnConnect(net::PeerId peer)
{
    m_sessions[peer] = Session{};
    std::cout << "[Net] Peer " << peer << " connected\n";
}

void RoomManager::OnDisconnect(net::PeerId peer, std::int64_t nowMs)
{
    const auto it = m_sessions.find(peer);
    if (it == m_sessions.end())
    {
        return;
    }

    const Session session = it->second;
    m_sessions.erase(it);
    std::cout << "[Net] Peer " << peer << " disconnected\n";

    const auto roomIt = m_rooms.find(session.roomCode);
    if (roomIt == m_rooms.end())
    {
        return;
    }

    RoomEntry& entry = roomIt->second;
    const auto mapped = entry.peersByPlayer.find(session.playerId);
    if (mapped != entry.peersByPlayer.end() && mapped->second == peer)
    {
        entry.peersByPlayer.erase(mapped);
        entry.room->Disconnect(session.playerId, nowMs);
        entry.room->FlushEvents();
    }
}

void RoomManager::OnPacket(net::PeerId peer, const std::vector<std::uint8_t>& payload, std::int64_t nowMs)
{
    const std::optional<net::ClientPacket> decoded = net::DecodeClientPacket(payload);
    if (!decoded.has_value())
    {
        return;
    }

    if (const auto* hello = std::get_if<net::HelloPacket>(&*decoded))
    {
        HandleHello(peer, *hello, nowMs);
        return;
    }

    const std::uint8_t packetType = payload.front();
    const auto sessionIt = m_sessions.find(peer);
    if (sessionIt == m_sessions.end() || sessionIt->second.roomCode.empty())
    {
        Reject(peer, packetType, kNotInRoom);
        return;
    }

    // A copy: a dropped room clears the session map.
    const Session session = sessionIt->second;
    const auto roomIt = m_rooms.find(session.roomCode);
    if (roomIt == m_rooms.end())
    {
        return;
    }

    if (const auto* start = std::get_if<net::StartMatchPacket>(&*decoded))
    {
        HandleStartMatch(peer, session, *start, nowMs);
        return;
    }

    const gameplay::ActionResult result = Dispatch(*roomIt->second.room, session.playerId, *decoded);
    // Stale or early movement samples are routine and never answered.
    if (!result && packetType != net::kPacketInput)
    {
        Reject(peer, packetType, result.reason);
    }
}

void RoomManager::HandleHello(net::PeerId peer, const net::HelloPacket& hello, std::int64_t nowMs)
{
    if (hello.protocolVersion != net::kProtocolVersion)
    {
        std::cerr << "[Net] Peer " << peer << " protocol " << hello.protocolVersion << ", server " << net::kProtocolVersion
                  << "\n";
        Reject(peer, net::kPacketHello, kVersionMismatch);
        return;
    }

    Session& session = m_sessions[peer];
    if (!session.roomCode.empty())
    {
        Reject(peer, net::kPacketHello, gameplay::reason::kWrongState);
        return;
    }

    RoomEntry* entry = nullptr;
    if (hello.roomCode.empty())
    {
        entry = &CreateRoom(NextRoomCode());
    }
    else
    {
        const auto it = m_rooms.find(hello.roomCode);
        if (it == m_rooms.end())
        {
            Reject(peer, net::kPacketHello, gameplay::reason::kNotFound);
            return;
        }
        entry = &it->second;
    }

    const gameplay::JoinResult joined = entry->room->Join(hello.name, hello.sessionToken, nowMs);
    if (!joined.status)
    {
        Reject(peer, net::kPacketHello, joined.status.reason);
        if (entry->room->PlayerCount() == 0)
        {
            const std::string code = entry->room->Code();
            DropRoom(code);
        }
        return;
    }

    // A reconnect on a new peer takes over from the stale one.
    const auto previous = entry->peersByPlayer.find(joined.playerId);
    if (previous != entry->peersByPlayer.end() && previous->second != peer)
    {
        m_sessions.erase(previous->second);
    }
    entry->peersByPlayer[joined.playerId] = peer;
    session.roomCode = entry->room->Code();
    session.playerId = joined.playerId;

    net::WelcomePacket welcome;
    welcome.playerId = joined.playerId;
    welcome.sessionToken = joined.sessionToken;
    welcome.roomCode = entry->room->Code();
    welcome.reconnected = joined.reconnected;
    net::EncodeWelcome(welcome, m_scratch);
    m_sink.Send(peer, m_scratch, true);

    if (joined.reconnected && entry->room->Phase() != gameplay::MatchPhase::Lobby)
    {
        SendMatchStarted(*entry, joined.playerId);
    }
    entry->room->FlushEvents();
}

void RoomManager::HandleStartMatch(
    net::PeerId peer,
    const Session& session,
    const net::StartMatchPacket& packet,
    std::int64_t nowMs
)
{
    RoomEntry& entry = m_rooms.at(session.roomCode);
    gameplay::MatchRoom& room = *entry.room;

    // The longest-standing player hosts the room.
    const std::vector<gameplay::PlayerState>& players = room.Context().players;
    if (players.empty() || players.front().playerId != session.playerId)
    {
        Reject(peer, net::kPacketStartMatch, kNotHost);
        return;
    }

    const std::uint32_t mazeSeed = packet.mazeSeed.value_or(static_cast<std::uint32_t>(m_rng()));
    const gameplay::ActionResult result = room.Start(nowMs, mazeSeed);
    if (!result)
    {
        Reject(peer, net::kPacketStartMatch, result.reason);
        return;
    }

    for (const gameplay::PlayerState& player : room.Context().players)
    {
        SendMatchStarted(entry, player.playerId);
    }
    room.FlushEvents();
}

gameplay::ActionResult RoomManager::Dispatch(
    gameplay::MatchRoom& room,
    const std::string& playerId,
    const net::ClientPacket& packet
)
{
    using gameplay::ActionResult;

    if (const auto* input = std::get_if<net::InputPacket>(&packet))
    {
        switch (input->type)
        {
            case net::kPacketMindControlInput: return room.SetMindControlInput(playerId, input->input);
            case net::kPacketGhostPossessInput: return room.SetPossessInput(playerId, input->input);
            case net::kPacketInput:
            default: return room.QueueInput(playerId, input->input);
        }
    }

    if (const auto* target = std::get_if<net::TargetPacket>(&packet))
    {
        const std::string& id = target->targetId;
        switch (target->type)
        {
            case net::kPacketDoorInteract: return room.InteractDoor(playerId, id);
            case net::kPacketDoorLock: return room.LockDoor(playerId, id);
            case net::kPacketTaskStart: return room.StartTask(playerId, id);
            case net::kPacketTaskComplete: return room.CompleteTask(playerId, id);
            case net::kPacketTaskCancel: return room.CancelTask(playerId, id);
            case net::kPacketKillAttempt: return room.AttemptKill(playerId, id);
            case net::kPacketOxygenStartRefill: return room.StartRefill(playerId, id);
            case net::kPacketBodyReport: return room.ReportBody(playerId, id);
            case net::kPacketVoteCast: return room.CastVote(playerId, id);
            case net::kPacketGhostPossess: return room.Possess(playerId, id);
            case net::kPacketGhostToggleLight: return room.ToggleLight(playerId, id);
            case net::kPacketPipeEnter: return room.EnterPipe(playerId, id);
            case net::kPacketPipeExit: return room.ExitPipe(playerId, id);
            case net::kPacketPipeTravel: return room.TravelPipe(playerId, id);
            default: return ActionResult::Fail(gameplay::reason::kNotAllowed);
        }
    }

    if (const auto* power = std::get_if<net::PowerActivatePacket>(&packet))
    {
        gameplay::PowerRequest request;
        request.targetId = power->targetId;
        request.point = power->point;
        request.bodyId = power->bodyId;
        return room.ActivatePower(playerId, request);
    }

    if (const auto* hacker = std::get_if<net::HackerActionPacket>(&packet))
    {
        return room.HackerAction(playerId, hacker->targetType, hacker->targetId);
    }

    if (const auto* signal = std::get_if<net::SignalPacket>(&packet))
    {
        switch (signal->type)
        {
            case net::kPacketPowerDeactivate: return room.DeactivatePower(playerId);
            case net::kPacketOxygenCancelRefill: return room.CancelRefill(playerId);
            case net::kPacketEmergencyMeeting: return room.CallEmergencyMeeting(playerId);
            case net::kPacketMindControlPower: return room.ActivateControlledPower(playerId);
            case net::kPacketGhostRelease: return room.ReleasePossession(playerId);
            default: return ActionResult::Fail(gameplay::reason::kNotAllowed);
        }
    }

    return ActionResult::Fail(gameplay::reason::kNotAllowed);
}

void RoomManager::Tick(std::int64_t nowMs)
{
    std::vector<std::string> finished;
    for (auto& [code, entry] : m_rooms)
    {
        entry.room->Tick(nowMs);
        if (entry.room->Phase() != gameplay::MatchPhase::Lobby)
        {
            SendSnapshots(entry);
        }
        if (entry.room->IsFinished() || entry.room->PlayerCount() == 0)
        {
            finished.push_back(code);
        }
    }

    for (const std::string& code : finished)
    {
        DropRoom(code);
    }
}

RoomManager::RoomEntry& RoomManager::CreateRoom(const std::string& code)
{
    gameplay::RoomLimits limits;
    limits.minPlayers = m_config.minPlayers;
    limits.maxPlayers = m_config.maxPlayersPerRoom;

    RoomEntry& entry = m_rooms[code];
    entry.room = std::make_unique<gameplay::MatchRoom>(code, m_tuning, m_registry, m_scenario, m_rng(), limits);
    entry.room->Events().SubscribeAll([this, code](const core::Event& event) { ForwardEvent(code, event); });
    std::cout << "[Server] Created room " << code << "\n";
    return entry;
}

std::string RoomManager::NextRoomCode()
{
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kRoomCodeAlphabet) - 2);
    std::string code;
    do
    {
        code.clear();
        for (std::size_t i = 0; i < kRoomCodeLength; ++i)
        {
            code.push_back(kRoomCodeAlphabet[pick(m_rng)]);
        }
    } while (m_rooms.count(code) > 0);
    return code;
}

void RoomManager::ForwardEvent(const std::string& roomCode, const core::Event& event)
{
    const auto it = m_rooms.find(roomCode);
    if (it == m_rooms.end())
    {
        return;
    }

    std::vector<std::uint8_t> payload;
    net::EncodeEvent(event, payload);
    for (const auto& [playerId, peer] : it->second.peersByPlayer)
    {
        if (event.recipient.empty() || event.recipient == playerId)
        {
            m_sink.Send(peer, payload, true);
        }
    }
}

void RoomManager::SendMatchStarted(const RoomEntry& entry, const std::string& playerId)
{
    const auto peerIt = entry.peersByPlayer.find(playerId);
    const gameplay::PlayerState* player = entry.room->Context().FindPlayer(playerId);
    if (peerIt == entry.peersByPlayer.end() || player == nullptr)
    {
        return;
    }

    net::MatchStartedPacket packet;
    packet.role = player->role;
    packet.power = player->power;
    packet.mazeSeed = entry.room->MazeSeed();
    packet.playerCount = static_cast<std::uint32_t>(entry.room->PlayerCount());
    packet.assignedTasks = player->assignedTasks;
    packet.scenarioJson = m_scenarioJson;

    std::vector<std::uint8_t> payload;
    net::EncodeMatchStarted(packet, payload);
    m_sink.Send(peerIt->second, payload, true);
}

void RoomManager::SendSnapshots(const RoomEntry& entry)
{
    const gameplay::MatchSnapshot& snapshot = entry.room->LatestSnapshot();
    for (const auto& [playerId, peer] : entry.peersByPlayer)
    {
        net::EncodeSnapshot(snapshot, playerId, m_scratch);
        m_sink.Send(peer, m_scratch, false);
    }
}

void RoomManager::Reject(net::PeerId peer, std::uint8_t packetType, const std::string& reason)
{
    net::ActionRejectedPacket packet;
    packet.action = net::PacketActionName(packetType);
    packet.reason = reason;
    net::EncodeActionRejected(packet, m_scratch);
    m_sink.Send(peer, m_scratch, true);
}

void RoomManager::DropRoom(const std::string& code)
{
    const auto it = m_rooms.find(code);
    if (it == m_rooms.end())
    {
        return;
    }

    // Peers stay connected and may send a new Hello.
    for (const auto& [playerId, peer] : it->second.peersByPlayer)
    {
        const auto session = m_sessions.find(peer);
        if (session != m_sessions.end())
        {
            session->second = Session{};
        }
    }

    std::cout << "[Server] Closed room " << code << "\n";
    m_rooms.erase(it);
}
} // namespace trisolar::server
