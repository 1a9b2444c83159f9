#include <catch2/catch.hpp>

#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "engine/net/Protocol.hpp"

using namespace trisolar;
using namespace trisolar::net;

namespace
{
template <typename T>
T DecodeAs(const std::vector<std::uint8_t>& buffer)
{
    const std::optional<ClientPacket> packet = DecodeClientPacket(buffer);
    REQUIRE(packet.has_value());
    REQUIRE(std::holds_alternative<T>(*packet));
    return std::get<T>(*packet);
}

gameplay::PlayerSnapshot MakePlayerView(const std::string& id, bool invisible)
{
    gameplay::PlayerSnapshot view;
    view.playerId = id;
    view.name = id;
    view.color = "#ffffff";
    view.isAlive = true;
    view.isInvisible = invisible;
    view.connected = true;
    view.health = 75.0F;
    return view;
}
} // namespace

TEST_CASE("Hello carries version, name, room code and token", "[net][protocol]")
{
    HelloPacket hello;
    hello.name = "Ye Wenjie";
    hello.roomCode = "ABC123";
    hello.sessionToken = "0123456789abcdef";

    std::vector<std::uint8_t> buffer;
    EncodeHello(hello, buffer);
    REQUIRE(buffer.front() == kPacketHello);

    const HelloPacket decoded = DecodeAs<HelloPacket>(buffer);
    CHECK(decoded.protocolVersion == kProtocolVersion);
    CHECK(decoded.name == "Ye Wenjie");
    CHECK(decoded.roomCode == "ABC123");
    CHECK(decoded.sessionToken == "0123456789abcdef");
}

TEST_CASE("Over-long names are truncated on the wire", "[net][protocol]")
{
    HelloPacket hello;
    hello.name = std::string(100, 'x');
    std::vector<std::uint8_t> buffer;
    EncodeHello(hello, buffer);
    CHECK(DecodeAs<HelloPacket>(buffer).name.size() == 32);
}

TEST_CASE("Start match seed is optional", "[net][protocol]")
{
    std::vector<std::uint8_t> buffer;
    EncodeStartMatch(StartMatchPacket{}, buffer);
    CHECK_FALSE(DecodeAs<StartMatchPacket>(buffer).mazeSeed.has_value());

    StartMatchPacket seeded;
    seeded.mazeSeed = 77U;
    EncodeStartMatch(seeded, buffer);
    const StartMatchPacket decoded = DecodeAs<StartMatchPacket>(buffer);
    REQUIRE(decoded.mazeSeed.has_value());
    CHECK(*decoded.mazeSeed == 77U);
}

TEST_CASE("Input flags and angles survive encoding", "[net][protocol]")
{
    InputPacket packet;
    packet.input.seq = 42;
    packet.input.forward = true;
    packet.input.left = true;
    packet.input.yaw = 1.25F;
    packet.input.pitch = -0.5F;

    std::vector<std::uint8_t> buffer;
    EncodeInput(packet, buffer);
    const InputPacket decoded = DecodeAs<InputPacket>(buffer);
    CHECK(decoded.type == kPacketInput);
    CHECK(decoded.input.seq == 42);
    CHECK(decoded.input.forward);
    CHECK(decoded.input.left);
    CHECK_FALSE(decoded.input.backward);
    CHECK_FALSE(decoded.input.right);
    CHECK(decoded.input.yaw == 1.25F);
    CHECK(decoded.input.pitch == -0.5F);
}

TEST_CASE("Redirected inputs carry no sequence or pitch", "[net][protocol]")
{
    InputPacket packet;
    packet.type = kPacketGhostPossessInput;
    packet.input.seq = 9;
    packet.input.right = true;
    packet.input.pitch = 0.7F;

    std::vector<std::uint8_t> buffer;
    EncodeInput(packet, buffer);
    CHECK(buffer.size() == 1 + 1 + sizeof(float));

    const InputPacket decoded = DecodeAs<InputPacket>(buffer);
    CHECK(decoded.type == kPacketGhostPossessInput);
    CHECK(decoded.input.seq == 0);
    CHECK(decoded.input.right);
    CHECK(decoded.input.pitch == 0.0F);
}

TEST_CASE("Target and signal packets keep their type", "[net][protocol]")
{
    std::vector<std::uint8_t> buffer;
    REQUIRE(EncodeTarget(TargetPacket{kPacketTaskStart, "task_3"}, buffer));
    const TargetPacket target = DecodeAs<TargetPacket>(buffer);
    CHECK(target.type == kPacketTaskStart);
    CHECK(target.targetId == "task_3");

    REQUIRE(EncodeTarget(TargetPacket{kPacketVoteCast, ""}, buffer));
    CHECK(DecodeAs<TargetPacket>(buffer).targetId.empty());

    CHECK_FALSE(EncodeTarget(TargetPacket{kPacketEmergencyMeeting, "x"}, buffer));
    CHECK(buffer.empty());

    REQUIRE(EncodeSignal(SignalPacket{kPacketEmergencyMeeting}, buffer));
    CHECK(DecodeAs<SignalPacket>(buffer).type == kPacketEmergencyMeeting);
    CHECK_FALSE(EncodeSignal(SignalPacket{kPacketTaskStart}, buffer));
}

TEST_CASE("Power activation with and without a point", "[net][protocol]")
{
    PowerActivatePacket packet;
    packet.targetId = "player_2";
    std::vector<std::uint8_t> buffer;
    EncodePowerActivate(packet, buffer);
    PowerActivatePacket decoded = DecodeAs<PowerActivatePacket>(buffer);
    CHECK(decoded.targetId == "player_2");
    CHECK_FALSE(decoded.point.has_value());
    CHECK(decoded.bodyId.empty());

    packet.point = glm::vec3{1.5F, 0.0F, -7.25F};
    packet.bodyId = "body_4";
    EncodePowerActivate(packet, buffer);
    decoded = DecodeAs<PowerActivatePacket>(buffer);
    REQUIRE(decoded.point.has_value());
    CHECK(decoded.point->x == 1.5F);
    CHECK(decoded.point->z == -7.25F);
    CHECK(decoded.bodyId == "body_4");
}

TEST_CASE("Hacker actions name a target type", "[net][protocol]")
{
    std::vector<std::uint8_t> buffer;
    EncodeHackerAction(HackerActionPacket{"door_sabotage", "door_3_4_N"}, buffer);
    const HackerActionPacket decoded = DecodeAs<HackerActionPacket>(buffer);
    CHECK(decoded.targetType == "door_sabotage");
    CHECK(decoded.targetId == "door_3_4_N");
}

TEST_CASE("Malformed client packets are rejected", "[net][protocol]")
{
    std::vector<std::uint8_t> buffer;

    SECTION("empty")
    {
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());
    }
    SECTION("unknown type")
    {
        buffer = {0xEE, 0x00};
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());
        buffer = {kPacketWelcome};
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());
    }
    SECTION("trailing bytes")
    {
        REQUIRE(EncodeTarget(TargetPacket{kPacketDoorInteract, "door_1"}, buffer));
        buffer.push_back(0);
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());

        REQUIRE(EncodeSignal(SignalPacket{kPacketGhostRelease}, buffer));
        buffer.push_back(1);
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());
    }
    SECTION("truncated string")
    {
        HelloPacket hello;
        hello.name = "Wang Miao";
        EncodeHello(hello, buffer);
        buffer.resize(buffer.size() - 3);
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());
    }
    SECTION("seed flag without a seed")
    {
        buffer = {kPacketStartMatch, 1};
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());
    }
    SECTION("non-finite input angles")
    {
        InputPacket input;
        input.input.seq = 3;
        input.input.forward = true;
        input.input.yaw = std::numeric_limits<float>::quiet_NaN();
        EncodeInput(input, buffer);
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());

        input.input.yaw = 0.0F;
        input.input.pitch = std::numeric_limits<float>::infinity();
        EncodeInput(input, buffer);
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());

        InputPacket steer;
        steer.type = kPacketMindControlInput;
        steer.input.yaw = -std::numeric_limits<float>::infinity();
        EncodeInput(steer, buffer);
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());
    }
    SECTION("non-finite power point")
    {
        PowerActivatePacket power;
        power.point = glm::vec3{1.0F, 0.0F, std::numeric_limits<float>::quiet_NaN()};
        EncodePowerActivate(power, buffer);
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());

        power.point = glm::vec3{std::numeric_limits<float>::infinity(), 0.0F, 2.0F};
        EncodePowerActivate(power, buffer);
        CHECK_FALSE(DecodeClientPacket(buffer).has_value());
    }
}

TEST_CASE("Every client packet type has an action name", "[net][protocol]")
{
    for (std::uint8_t type = kPacketHello; type <= kPacketPipeTravel; ++type)
    {
        CHECK(std::string{PacketActionName(type)} != "unknown");
    }
    CHECK(std::string{PacketActionName(kPacketSnapshot)} == "unknown");
    CHECK(std::string{PacketActionName(kPacketDoorInteract)} == "door_interact");
}

TEST_CASE("Welcome checks the protocol version", "[net][protocol]")
{
    WelcomePacket welcome;
    welcome.playerId = "player_1";
    welcome.sessionToken = "feedface";
    welcome.roomCode = "QWE789";
    welcome.reconnected = true;

    std::vector<std::uint8_t> buffer;
    EncodeWelcome(welcome, buffer);
    WelcomePacket decoded;
    REQUIRE(DecodeWelcome(buffer, decoded));
    CHECK(decoded.playerId == "player_1");
    CHECK(decoded.sessionToken == "feedface");
    CHECK(decoded.roomCode == "QWE789");
    CHECK(decoded.reconnected);

    // Byte 1 is the low byte of the little-endian version.
    buffer[1] = static_cast<std::uint8_t>(kProtocolVersion + 1);
    CHECK_FALSE(DecodeWelcome(buffer, decoded));
}

TEST_CASE("Match start is private to its player", "[net][protocol]")
{
    MatchStartedPacket packet;
    packet.role = gameplay::Role::Shadow;
    packet.power = gameplay::PowerType::Oracle;
    packet.mazeSeed = 1234;
    packet.playerCount = 6;
    packet.assignedTasks = {"task_1", "task_7"};
    packet.scenarioJson = std::string(5000, 'j');

    std::vector<std::uint8_t> buffer;
    EncodeMatchStarted(packet, buffer);
    MatchStartedPacket decoded;
    REQUIRE(DecodeMatchStarted(buffer, decoded));
    CHECK(decoded.role == gameplay::Role::Shadow);
    CHECK(decoded.power == gameplay::PowerType::Oracle);
    CHECK(decoded.mazeSeed == 1234);
    CHECK(decoded.playerCount == 6);
    CHECK(decoded.assignedTasks == packet.assignedTasks);
    CHECK(decoded.scenarioJson.size() == 5000);

    buffer[2] = 200;
    CHECK_FALSE(DecodeMatchStarted(buffer, decoded));
}

TEST_CASE("Events and rejections round trip", "[net][protocol]")
{
    core::Event event;
    event.name = "vote_result";
    event.atMs = 123456789;
    event.args = {"player_3", "player_1=player_3", "player_2="};

    std::vector<std::uint8_t> buffer;
    EncodeEvent(event, buffer);
    core::Event decodedEvent;
    REQUIRE(DecodeEvent(buffer, decodedEvent));
    CHECK(decodedEvent.name == "vote_result");
    CHECK(decodedEvent.atMs == 123456789);
    CHECK(decodedEvent.args == event.args);

    EncodeActionRejected(ActionRejectedPacket{"kill_attempt", "cooldown"}, buffer);
    ActionRejectedPacket rejected;
    REQUIRE(DecodeActionRejected(buffer, rejected));
    CHECK(rejected.action == "kill_attempt");
    CHECK(rejected.reason == "cooldown");
    CHECK_FALSE(DecodeEvent(buffer, decodedEvent));
}

TEST_CASE("Invisible players are hidden from everyone but themselves", "[net][protocol][snapshot]")
{
    gameplay::MatchSnapshot snapshot;
    snapshot.seq = 5;
    snapshot.phase = gameplay::MatchPhase::Playing;
    snapshot.shipOxygen = 64.0F;
    snapshot.players.push_back(MakePlayerView("player_1", false));
    snapshot.players.push_back(MakePlayerView("player_2", true));
    snapshot.players.push_back(MakePlayerView("player_3", false));
    snapshot.doors.push_back(gameplay::DoorSnapshot{"door_a", true, false});
    snapshot.tasks.emplace_back("task_0", maze::TaskCompletion::Completed);

    std::vector<std::uint8_t> buffer;
    gameplay::MatchSnapshot seen;

    EncodeSnapshot(snapshot, "player_1", buffer);
    REQUIRE(DecodeSnapshot(buffer, seen));
    CHECK(seen.seq == 5);
    CHECK(seen.phase == gameplay::MatchPhase::Playing);
    CHECK(seen.shipOxygen == 64.0F);
    REQUIRE(seen.players.size() == 2);
    CHECK(seen.players[0].playerId == "player_1");
    CHECK(seen.players[1].playerId == "player_3");
    CHECK(seen.players[0].health == 75.0F);
    REQUIRE(seen.doors.size() == 1);
    CHECK(seen.doors[0].isOpen);
    REQUIRE(seen.tasks.size() == 1);
    CHECK(seen.tasks[0].second == maze::TaskCompletion::Completed);

    EncodeSnapshot(snapshot, "player_2", buffer);
    REQUIRE(DecodeSnapshot(buffer, seen));
    REQUIRE(seen.players.size() == 3);
    CHECK(seen.players[1].isInvisible);
}
