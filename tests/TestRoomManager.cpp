#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "server/RoomManager.hpp"

using namespace trisolar;
using server::RoomManager;

namespace
{
struct SentPacket
{
    net::PeerId peer = 0;
    std::vector<std::uint8_t> payload;
    bool reliable = true;
};

class RecordingSink : public server::PacketSink
{
public:
    void Send(net::PeerId peer, const std::vector<std::uint8_t>& payload, bool reliable) override
    {
        sent.push_back(SentPacket{peer, payload, reliable});
    }

    [[nodiscard]] std::vector<SentPacket> To(net::PeerId peer, std::uint8_t type) const
    {
        std::vector<SentPacket> result;
        for (const SentPacket& packet : sent)
        {
            if (packet.peer == peer && !packet.payload.empty() && packet.payload.front() == type)
            {
                result.push_back(packet);
            }
        }
        return result;
    }

    std::vector<SentPacket> sent;
};

struct ManagerFixture
{
    ManagerFixture()
        : manager(
              server::ServerConfig{},
              gameplay::MatchTuning{},
              gameplay::PowerRegistry{},
              cosmos::DefaultCosmicScenario(),
              sink,
              42U
          )
    {
    }

    void Hello(net::PeerId peer, const std::string& name, const std::string& roomCode = "", const std::string& token = "")
    {
        net::HelloPacket hello;
        hello.name = name;
        hello.roomCode = roomCode;
        hello.sessionToken = token;
        std::vector<std::uint8_t> buffer;
        net::EncodeHello(hello, buffer);
        manager.OnPacket(peer, buffer, nowMs);
    }

    void StartMatch(net::PeerId peer, std::uint32_t seed)
    {
        net::StartMatchPacket packet;
        packet.mazeSeed = seed;
        std::vector<std::uint8_t> buffer;
        net::EncodeStartMatch(packet, buffer);
        manager.OnPacket(peer, buffer, nowMs);
    }

    net::WelcomePacket LastWelcome(net::PeerId peer) const
    {
        const std::vector<SentPacket> welcomes = sink.To(peer, net::kPacketWelcome);
        REQUIRE_FALSE(welcomes.empty());
        net::WelcomePacket welcome;
        REQUIRE(net::DecodeWelcome(welcomes.back().payload, welcome));
        return welcome;
    }

    net::ActionRejectedPacket LastRejection(net::PeerId peer) const
    {
        const std::vector<SentPacket> rejections = sink.To(peer, net::kPacketActionRejected);
        REQUIRE_FALSE(rejections.empty());
        net::ActionRejectedPacket rejected;
        REQUIRE(net::DecodeActionRejected(rejections.back().payload, rejected));
        return rejected;
    }

    /// Host on peer 1 and a guest on peer 2 sharing one room.
    std::string OpenTwoPlayerRoom()
    {
        manager.OnConnect(1);
        manager.OnConnect(2);
        Hello(1, "Host");
        const std::string code = LastWelcome(1).roomCode;
        Hello(2, "Guest", code);
        return code;
    }

    RecordingSink sink;
    RoomManager manager;
    std::int64_t nowMs = 5000;
};
} // namespace

TEST_CASE("Hello without a room code opens a new room", "[server]")
{
    ManagerFixture fixture;
    fixture.manager.OnConnect(1);
    fixture.Hello(1, "Host");

    const net::WelcomePacket welcome = fixture.LastWelcome(1);
    CHECK(welcome.playerId == "player_1");
    CHECK(welcome.sessionToken.size() == 32);
    CHECK(welcome.roomCode.size() == 6);
    CHECK_FALSE(welcome.reconnected);
    CHECK(fixture.manager.RoomCount() == 1);
    REQUIRE(fixture.manager.FindRoom(welcome.roomCode) != nullptr);
    CHECK(fixture.manager.FindRoom(welcome.roomCode)->PlayerCount() == 1);

    // The join itself is broadcast as an event.
    CHECK_FALSE(fixture.sink.To(1, net::kPacketEvent).empty());
}

TEST_CASE("Hello with a room code joins that room", "[server]")
{
    ManagerFixture fixture;
    const std::string code = fixture.OpenTwoPlayerRoom();

    const net::WelcomePacket guest = fixture.LastWelcome(2);
    CHECK(guest.roomCode == code);
    CHECK(guest.playerId == "player_2");
    CHECK(fixture.manager.RoomCount() == 1);

    // The host hears about the guest.
    bool sawJoin = false;
    for (const SentPacket& packet : fixture.sink.To(1, net::kPacketEvent))
    {
        core::Event event;
        REQUIRE(net::DecodeEvent(packet.payload, event));
        sawJoin = sawJoin || (event.name == "player_joined" && event.args.front() == "player_2");
    }
    CHECK(sawJoin);
}

TEST_CASE("Hello is rejected for unknown rooms and old clients", "[server]")
{
    ManagerFixture fixture;
    fixture.manager.OnConnect(1);

    SECTION("unknown room code")
    {
        fixture.Hello(1, "Lost", "ZZZZZZ");
        const net::ActionRejectedPacket rejected = fixture.LastRejection(1);
        CHECK(rejected.action == "hello");
        CHECK(rejected.reason == "not_found");
        CHECK(fixture.manager.RoomCount() == 0);
    }
    SECTION("protocol version mismatch")
    {
        net::HelloPacket hello;
        hello.protocolVersion = net::kProtocolVersion - 1;
        hello.name = "Old";
        std::vector<std::uint8_t> buffer;
        net::EncodeHello(hello, buffer);
        fixture.manager.OnPacket(1, buffer, fixture.nowMs);

        CHECK(fixture.LastRejection(1).reason == "version_mismatch");
        CHECK(fixture.sink.To(1, net::kPacketWelcome).empty());
    }
    SECTION("second hello on a joined peer")
    {
        fixture.Hello(1, "Host");
        fixture.Hello(1, "Host again");
        CHECK(fixture.LastRejection(1).reason == "wrong_state");
        CHECK(fixture.manager.RoomCount() == 1);
    }
}

TEST_CASE("Actions before joining a room are answered with not_in_room", "[server]")
{
    ManagerFixture fixture;
    fixture.manager.OnConnect(1);

    std::vector<std::uint8_t> buffer;
    REQUIRE(net::EncodeSignal(net::SignalPacket{net::kPacketEmergencyMeeting}, buffer));
    fixture.manager.OnPacket(1, buffer, fixture.nowMs);

    const net::ActionRejectedPacket rejected = fixture.LastRejection(1);
    CHECK(rejected.action == "emergency_meeting");
    CHECK(rejected.reason == "not_in_room");
}

TEST_CASE("Malformed payloads get no reply", "[server]")
{
    ManagerFixture fixture;
    fixture.manager.OnConnect(1);
    fixture.manager.OnPacket(1, {0xEE, 0x01, 0x02}, fixture.nowMs);
    fixture.manager.OnPacket(1, {}, fixture.nowMs);
    CHECK(fixture.sink.sent.empty());
}

TEST_CASE("Only the host can start the match", "[server]")
{
    ManagerFixture fixture;
    const std::string code = fixture.OpenTwoPlayerRoom();

    fixture.StartMatch(2, 1234);
    CHECK(fixture.LastRejection(2).reason == "not_host");
    CHECK(fixture.manager.FindRoom(code)->Phase() == gameplay::MatchPhase::Lobby);

    fixture.StartMatch(1, 1234);
    CHECK(fixture.manager.FindRoom(code)->Phase() == gameplay::MatchPhase::Playing);

    int shadows = 0;
    for (const net::PeerId peer : {1U, 2U})
    {
        const std::vector<SentPacket> started = fixture.sink.To(peer, net::kPacketMatchStarted);
        REQUIRE(started.size() == 1);
        CHECK(started.front().reliable);

        net::MatchStartedPacket packet;
        REQUIRE(net::DecodeMatchStarted(started.front().payload, packet));
        CHECK(packet.mazeSeed == 1234);
        CHECK(packet.playerCount == 2);
        CHECK(packet.power != gameplay::PowerType::None);
        CHECK_FALSE(packet.scenarioJson.empty());
        shadows += packet.role == gameplay::Role::Shadow ? 1 : 0;
    }
    CHECK(shadows == 1);
}

TEST_CASE("A lone host cannot start", "[server]")
{
    ManagerFixture fixture;
    fixture.manager.OnConnect(1);
    fixture.Hello(1, "Host");
    fixture.StartMatch(1, 1234);

    const net::ActionRejectedPacket rejected = fixture.LastRejection(1);
    CHECK(rejected.action == "start_match");
    CHECK(rejected.reason == "not_allowed");
}

TEST_CASE("Ticks stream snapshots once the match runs", "[server]")
{
    ManagerFixture fixture;
    fixture.OpenTwoPlayerRoom();

    fixture.manager.Tick(fixture.nowMs + 50);
    CHECK(fixture.sink.To(1, net::kPacketSnapshot).empty());

    fixture.StartMatch(1, 1234);
    fixture.manager.Tick(fixture.nowMs + 100);

    for (const net::PeerId peer : {1U, 2U})
    {
        const std::vector<SentPacket> snapshots = fixture.sink.To(peer, net::kPacketSnapshot);
        REQUIRE(snapshots.size() == 1);
        CHECK_FALSE(snapshots.front().reliable);

        gameplay::MatchSnapshot snapshot;
        REQUIRE(net::DecodeSnapshot(snapshots.front().payload, snapshot));
        CHECK(snapshot.phase == gameplay::MatchPhase::Playing);
        CHECK(snapshot.players.size() == 2);
    }
}

TEST_CASE("Room rejections are sent back with the action name", "[server]")
{
    ManagerFixture fixture;
    fixture.OpenTwoPlayerRoom();
    fixture.StartMatch(1, 1234);

    std::vector<std::uint8_t> buffer;
    REQUIRE(net::EncodeTarget(net::TargetPacket{net::kPacketTaskStart, "no_such_task"}, buffer));
    fixture.manager.OnPacket(2, buffer, fixture.nowMs);

    const net::ActionRejectedPacket rejected = fixture.LastRejection(2);
    CHECK(rejected.action == "task_start");
    CHECK(rejected.reason == "not_found");
}

TEST_CASE("Stale inputs are dropped silently", "[server]")
{
    ManagerFixture fixture;
    fixture.OpenTwoPlayerRoom();
    fixture.StartMatch(1, 1234);
    const std::size_t before = fixture.sink.To(1, net::kPacketActionRejected).size();

    net::InputPacket input;
    input.input.seq = 0;
    std::vector<std::uint8_t> buffer;
    net::EncodeInput(input, buffer);
    fixture.manager.OnPacket(1, buffer, fixture.nowMs);
    fixture.manager.OnPacket(1, buffer, fixture.nowMs);

    CHECK(fixture.sink.To(1, net::kPacketActionRejected).size() == before);
}

TEST_CASE("Empty lobbies are closed on the next tick", "[server]")
{
    ManagerFixture fixture;
    fixture.manager.OnConnect(1);
    fixture.Hello(1, "Host");
    REQUIRE(fixture.manager.RoomCount() == 1);

    fixture.manager.OnDisconnect(1, fixture.nowMs);
    fixture.manager.Tick(fixture.nowMs + 50);
    CHECK(fixture.manager.RoomCount() == 0);
}

TEST_CASE("A player reconnects on a new peer with the session token", "[server]")
{
    ManagerFixture fixture;
    const std::string code = fixture.OpenTwoPlayerRoom();
    fixture.StartMatch(1, 1234);
    const net::WelcomePacket original = fixture.LastWelcome(2);

    fixture.manager.OnDisconnect(2, fixture.nowMs);
    const gameplay::PlayerState* guest = fixture.manager.FindRoom(code)->Context().FindPlayer(original.playerId);
    REQUIRE(guest != nullptr);
    CHECK_FALSE(guest->connected);

    fixture.manager.OnConnect(3);
    fixture.Hello(3, "Guest", code, original.sessionToken);

    const net::WelcomePacket resumed = fixture.LastWelcome(3);
    CHECK(resumed.reconnected);
    CHECK(resumed.playerId == original.playerId);
    CHECK(fixture.sink.To(3, net::kPacketMatchStarted).size() == 1);
    CHECK(guest->connected);

    // Snapshots now go to the new peer.
    fixture.manager.Tick(fixture.nowMs + 50);
    CHECK(fixture.sink.To(3, net::kPacketSnapshot).size() == 1);
}
