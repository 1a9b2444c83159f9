#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine/net/NetworkSession.hpp"
#include "engine/net/Protocol.hpp"
#include "game/cosmos/CosmicScenario.hpp"
#include "game/gameplay/MatchRoom.hpp"
#include "game/gameplay/MatchTuning.hpp"
#include "game/gameplay/PowerRegistry.hpp"
#include "server/ServerConfig.hpp"

namespace trisolar::server
{
/// Outbound side of the transport. NetworkSession in production, a recorder in tests.
class PacketSink
{
public:
    virtual ~PacketSink() = default;
    virtual void Send(net::PeerId peer, const std::vector<std::uint8_t>& payload, bool reliable) = 0;
};

/// Owns every room and maps peers to (room, player). Decoded packets are
/// applied to the owning room; rejections go back as ActionRejected.
class RoomManager
{
public:
    RoomManager(
        ServerConfig config,
        gameplay::MatchTuning tuning,
        gameplay::PowerRegistry registry,
        cosmos::CosmicScenario scenario,
        PacketSink& sink,
        std::uint32_t seed
    );

    void OnConnect(net::PeerId peer);
    void OnDisconnect(net::PeerId peer, std::int64_t nowMs);
    /// Malformed payloads are dropped without a reply.
    void OnPacket(net::PeerId peer, const std::vector<std::uint8_t>& payload, std::int64_t nowMs);

    /// Ticks every room, streams snapshots and drops finished or empty rooms.
    void Tick(std::int64_t nowMs);

    [[nodiscard]] std::size_t RoomCount() const { return m_rooms.size(); }
    [[nodiscard]] gameplay::MatchRoom* FindRoom(const std::string& code);
    [[nodiscard]] std::vector<std::string> RoomCodes() const;

private:
    struct Session
    {
        std::string roomCode;
        std::string playerId;
    };

    struct RoomEntry
    {
        std::unique_ptr<gameplay::MatchRoom> room;
        std::unordered_map<std::string, net::PeerId> peersByPlayer;
    };

    void HandleHello(net::PeerId peer, const net::HelloPacket& hello, std::int64_t nowMs);
    void HandleStartMatch(net::PeerId peer, const Session& session, const net::StartMatchPacket& packet, std::int64_t nowMs);
    [[nodiscard]] gameplay::ActionResult Dispatch(gameplay::MatchRoom& room, const std::string& playerId, const net::ClientPacket& packet);

    RoomEntry& CreateRoom(const std::string& code);
    [[nodiscard]] std::string NextRoomCode();
    void ForwardEvent(const std::string& roomCode, const core::Event& event);
    void SendMatchStarted(const RoomEntry& entry, const std::string& playerId);
    void SendSnapshots(const RoomEntry& entry);
    void Reject(net::PeerId peer, std::uint8_t packetType, const std::string& reason);
    void DropRoom(const std::string& code);

    ServerConfig m_config;
    gameplay::MatchTuning m_tuning;
    gameplay::PowerRegistry m_registry;
    cosmos::CosmicScenario m_scenario;
    std::string m_scenarioJson;
    PacketSink& m_sink;
    std::mt19937 m_rng;

    std::map<std::string, RoomEntry> m_rooms;
    std::unordered_map<net::PeerId, Session> m_sessions;
    std::vector<std::uint8_t> m_scratch;
};
} // namespace trisolar::server
