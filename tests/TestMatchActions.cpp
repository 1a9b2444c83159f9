#include <catch2/catch.hpp>

#include <string>

#include <glm/geometric.hpp>

#include "MatchFixture.hpp"

using namespace trisolar;
using namespace trisolar::gameplay;
using tests::MatchFixture;

namespace
{
std::string OtherCrew(const MatchFixture& fixture, const std::string& exclude)
{
    for (const std::string& id : fixture.AllWithRole(Role::Crew))
    {
        if (id != exclude)
        {
            return id;
        }
    }
    return {};
}

/// Swaps in a fresh single-use power, as if it had been dealt at start.
void GivePower(PlayerState& player, PowerType type)
{
    player.power = type;
    player.powerActive = false;
    player.powerCooldownEnd = 0;
    player.powerUsesLeft = 1;
    player.powerCharges = 0;
}

const maze::RoomInfo* FirstRoomWithDoor(const maze::MazeLayout& layout)
{
    for (const maze::RoomInfo& room : layout.rooms)
    {
        if (room.doorId.has_value() && layout.FindDoor(*room.doorId) != nullptr)
        {
            return &room;
        }
    }
    return nullptr;
}

/// A point one metre inside `room`, just behind its door.
glm::vec3 InsideDoor(const maze::RoomInfo& room, const maze::DoorInfo& door)
{
    glm::vec3 inward = room.position - door.position;
    inward.y = 0.0F;
    return door.position + glm::normalize(inward);
}
} // namespace

TEST_CASE("Doors toggle within reach", "[match][doors]")
{
    MatchFixture fixture;
    MatchRoom& room = fixture.room;
    const maze::DoorInfo& door = room.Context().layout.doors.front();
    PlayerState& player = fixture.Player(fixture.ids[0]);

    CHECK(room.InteractDoor(player.playerId, "door_missing").reason == reason::kNotFound);
    player.position = door.position + glm::vec3{6.0F, 0.0F, 0.0F};
    CHECK(room.InteractDoor(player.playerId, door.id).reason == reason::kTooFar);

    player.position = door.position;
    REQUIRE(room.InteractDoor(player.playerId, door.id).ok);
    CHECK(room.Context().mazeState.doorStates.at(door.id).isOpen);
    REQUIRE(room.InteractDoor(player.playerId, door.id).ok);
    CHECK_FALSE(room.Context().mazeState.doorStates.at(door.id).isOpen);

    fixture.Advance();
    CHECK(fixture.SawEvent("door_toggled"));
}

TEST_CASE("Doors lock from inside their room and expire", "[match][doors]")
{
    MatchFixture fixture;
    MatchRoom& room = fixture.room;
    const maze::MazeLayout& layout = room.Context().layout;
    const maze::RoomInfo* target = FirstRoomWithDoor(layout);
    REQUIRE(target != nullptr);
    const maze::DoorInfo& door = *layout.FindDoor(*target->doorId);

    PlayerState& locker = fixture.Player(fixture.ids[0]);
    PlayerState& other = fixture.Player(fixture.ids[1]);

    SECTION("outside any room the lock is refused")
    {
        for (const maze::MazeCell& cell : layout.cells)
        {
            if (layout.RoomAtCell(cell.row, cell.col) == nullptr)
            {
                const glm::vec2 center = maze::CellToWorld(cell.row, cell.col).Center();
                locker.position = glm::vec3{center.x, 0.0F, center.y};
                break;
            }
        }
        CHECK(room.LockDoor(locker.playerId, door.id).reason == reason::kNotAllowed);
    }

    SECTION("the lock holds for its duration")
    {
        fixture.Advance();
        locker.position = InsideDoor(*target, door);
        other.position = locker.position;

        REQUIRE(room.LockDoor(locker.playerId, door.id).ok);
        const maze::DoorState& state = room.Context().mazeState.doorStates.at(door.id);
        CHECK(state.isLocked);
        CHECK_FALSE(state.isOpen);
        CHECK(state.lockedBy == locker.playerId);
        CHECK(state.lockExpiresAtMs == room.Context().nowMs + room.Context().tuning.doorLockMs);

        CHECK(room.InteractDoor(other.playerId, door.id).reason == reason::kLocked);
        CHECK(room.LockDoor(other.playerId, door.id).reason == reason::kLocked);

        const int lockTicks = room.Context().tuning.doorLockMs / 50;
        fixture.Advance(lockTicks - 1);
        CHECK(room.Context().mazeState.doorStates.at(door.id).isLocked);
        fixture.Advance();
        CHECK_FALSE(room.Context().mazeState.doorStates.at(door.id).isLocked);
        CHECK(fixture.SawEvent("door_unlocked"));
    }

    SECTION("the locker can release early")
    {
        locker.position = InsideDoor(*target, door);
        REQUIRE(room.LockDoor(locker.playerId, door.id).ok);
        REQUIRE(room.LockDoor(locker.playerId, door.id).ok);
        CHECK_FALSE(room.Context().mazeState.doorStates.at(door.id).isLocked);
        CHECK(room.Context().mazeState.doorStates.at(door.id).lockedBy.empty());
    }
}

TEST_CASE("Only ghosts flicker lights", "[match][ghost]")
{
    MatchFixture fixture;
    MatchRoom& room = fixture.room;
    REQUIRE_FALSE(room.Context().mazeState.lightStates.empty());
    const std::string light = room.Context().mazeState.lightStates.begin()->first;
    const std::string ghostId = fixture.FirstWithRole(Role::Crew);

    CHECK(room.ToggleLight(ghostId, light).reason == reason::kNotAllowed);
    room.Context().HandleDeath(fixture.Player(ghostId), "cold", std::string{});

    CHECK(room.ToggleLight(ghostId, "light_missing").reason == reason::kNotFound);
    const bool before = room.Context().mazeState.lightStates.at(light);
    REQUIRE(room.ToggleLight(ghostId, light).ok);
    CHECK(room.Context().mazeState.lightStates.at(light) != before);
    fixture.Advance();
    CHECK(fixture.SawEvent("light_toggled"));
}

TEST_CASE("Possession can be released before it runs out", "[match][ghost]")
{
    MatchFixture fixture;
    MatchRoom& room = fixture.room;
    const std::string ghostId = fixture.FirstWithRole(Role::Crew);
    const std::string target = OtherCrew(fixture, ghostId);
    room.Context().HandleDeath(fixture.Player(ghostId), "cold", std::string{});

    CHECK(room.ReleasePossession(ghostId).reason == reason::kWrongState);
    CHECK(room.SetPossessInput(ghostId, PlayerInput{}).reason == reason::kWrongState);

    REQUIRE(room.Possess(ghostId, target).ok);
    REQUIRE(room.ReleasePossession(ghostId).ok);
    CHECK(fixture.Player(ghostId).possessTargetId.empty());
    CHECK_FALSE(fixture.Player(ghostId).possessInput.has_value());

    // The cooldown still runs from the original possession.
    CHECK(room.Possess(ghostId, target).reason == reason::kCooldown);
    fixture.Advance();
    CHECK(fixture.SawEvent("possess_ended"));
}

TEST_CASE("Pipes carry players between rooms underground", "[match][pipes]")
{
    MatchFixture fixture;
    MatchRoom& room = fixture.room;
    const maze::MazeLayout& layout = room.Context().layout;
    REQUIRE(layout.pipeNodes.size() >= 2);
    const maze::PipeNode& from = layout.pipeNodes[0];
    const maze::PipeNode& to = layout.pipeNodes[1];
    PlayerState& player = fixture.Player(fixture.ids[0]);

    CHECK(room.EnterPipe(player.playerId, "pipe_missing").reason == reason::kNotFound);
    player.position = from.surfacePosition + glm::vec3{5.0F, 0.0F, 0.0F};
    CHECK(room.EnterPipe(player.playerId, from.id).reason == reason::kTooFar);
    CHECK(room.TravelPipe(player.playerId, to.id).reason == reason::kWrongState);

    player.position = from.surfacePosition;
    REQUIRE(room.EnterPipe(player.playerId, from.id).ok);
    CHECK(player.isUnderground);
    CHECK(player.currentPipeNodeId == from.id);
    CHECK(player.position.y == Approx(maze::kUndergroundY));
    CHECK(room.EnterPipe(player.playerId, from.id).reason == reason::kWrongState);
    CHECK(room.InteractDoor(player.playerId, layout.doors.front().id).reason == reason::kWrongState);

    REQUIRE(room.TravelPipe(player.playerId, to.id).ok);
    CHECK(player.currentPipeNodeId == to.id);
    CHECK(player.position.x == Approx(to.undergroundPosition.x));
    CHECK(player.position.z == Approx(to.undergroundPosition.z));

    CHECK(room.ExitPipe(player.playerId, from.id).reason == reason::kTooFar);
    REQUIRE(room.ExitPipe(player.playerId, to.id).ok);
    CHECK_FALSE(player.isUnderground);
    CHECK(player.currentPipeNodeId.empty());
    CHECK(player.position.x == Approx(to.surfacePosition.x));
    CHECK(player.position.z == Approx(to.surfacePosition.z));
}

TEST_CASE("Hacked pipes refuse travellers until the sabotage ends", "[match][pipes][hacker]")
{
    MatchFixture fixture;
    MatchRoom& room = fixture.room;
    const maze::PipeNode& node = room.Context().layout.pipeNodes.front();
    PlayerState& hacker = fixture.Player(fixture.ids[0]);
    PlayerState& traveller = fixture.Player(fixture.ids[1]);

    GivePower(hacker, PowerType::Hacker);
    CHECK(room.HackerAction(hacker.playerId, "pipe", node.id).reason == reason::kNotAllowed);
    REQUIRE(room.ActivatePower(hacker.playerId, PowerRequest{}).ok);
    CHECK(room.HackerAction(hacker.playerId, "pipe", "pipe_missing").reason == reason::kNotFound);
    REQUIRE(room.HackerAction(hacker.playerId, "pipe", node.id).ok);

    traveller.position = node.surfacePosition;
    CHECK(room.EnterPipe(traveller.playerId, node.id).reason == reason::kLocked);

    fixture.Advance(room.Context().tuning.sabotagePipeMs / 50);
    CHECK(fixture.SawEvent("pipe_unlocked"));
    traveller.position = node.surfacePosition;
    CHECK(room.EnterPipe(traveller.playerId, node.id).ok);
}

TEST_CASE("Refills can be cancelled by hand or by sabotage", "[match][oxygen]")
{
    MatchFixture fixture;
    MatchRoom& room = fixture.room;
    const maze::OxygenGenerator& generator = room.Context().layout.oxygenGenerators.front();
    PlayerState& refiller = fixture.Player(fixture.ids[0]);
    room.Context().mazeState.shipOxygen = 50.0F;
    refiller.position = generator.position + glm::vec3{1.0F, 0.0F, 0.0F};

    CHECK(room.CancelRefill(refiller.playerId).reason == reason::kWrongState);

    SECTION("by hand")
    {
        REQUIRE(room.StartRefill(refiller.playerId, generator.id).ok);
        REQUIRE(room.CancelRefill(refiller.playerId).ok);
        CHECK(refiller.refillGeneratorId.empty());
        CHECK(room.CancelRefill(refiller.playerId).reason == reason::kWrongState);
        fixture.Advance();
        CHECK(fixture.SawEvent("refill_cancelled"));
    }

    SECTION("by a hacker disabling the generator")
    {
        PlayerState& hacker = fixture.Player(fixture.ids[1]);
        GivePower(hacker, PowerType::Hacker);
        REQUIRE(room.ActivatePower(hacker.playerId, PowerRequest{}).ok);

        REQUIRE(room.StartRefill(refiller.playerId, generator.id).ok);
        REQUIRE(room.HackerAction(hacker.playerId, "generator", generator.id).ok);
        CHECK(refiller.refillGeneratorId.empty());
        CHECK(room.Context().mazeState.IsGeneratorDisabled(generator.id));
        CHECK(room.StartRefill(refiller.playerId, generator.id).reason == reason::kNotAllowed);

        fixture.Advance();
        CHECK(fixture.SawEvent("refill_cancelled"));
        CHECK(fixture.SawEvent("generator_disabled"));
    }
}

TEST_CASE("Mind control steers the target and fires its power", "[match][powers]")
{
    MatchFixture fixture;
    MatchRoom& room = fixture.room;
    const std::string controllerId = fixture.FirstWithRole(Role::Crew);
    const std::string targetId = OtherCrew(fixture, controllerId);
    PlayerState& controller = fixture.Player(controllerId);
    PlayerState& target = fixture.Player(targetId);

    GivePower(controller, PowerType::MindController);
    GivePower(target, PowerType::Invisible);
    controller.position = target.position + glm::vec3{0.0F, 0.0F, 1.0F};

    PlayerInput input;
    input.right = true;
    CHECK(room.SetMindControlInput(controllerId, input).reason == reason::kNotAllowed);
    CHECK(room.ActivateControlledPower(controllerId).reason == reason::kNotAllowed);

    PowerRequest request;
    request.targetId = targetId;
    REQUIRE(room.ActivatePower(controllerId, request).ok);
    CHECK(controller.mindControlTargetId == targetId);

    REQUIRE(room.SetMindControlInput(controllerId, input).ok);
    const float before = target.position.x;
    fixture.Advance();
    CHECK(target.position.x > before);

    REQUIRE(room.ActivateControlledPower(controllerId).ok);
    CHECK(target.powerActive);
    CHECK(target.isInvisible);

    REQUIRE(room.DeactivatePower(controllerId).ok);
    CHECK_FALSE(controller.powerActive);
    CHECK(controller.mindControlTargetId.empty());
    CHECK(room.SetMindControlInput(controllerId, input).reason == reason::kNotAllowed);
    CHECK(room.DeactivatePower(controllerId).reason == reason::kWrongState);
}
