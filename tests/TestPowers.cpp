#include <catch2/catch.hpp>

#include <cmath>
#include <string>
#include <vector>

#include "game/gameplay/MatchContext.hpp"
#include "game/gameplay/PowerSystem.hpp"
#include "game/maze/MazeGenerator.hpp"

using namespace trisolar;
using namespace trisolar::gameplay;

namespace
{
/// Three living players a few metres apart on the open plaza.
struct PowerFixture
{
    MatchContext context;
    PowerSystem powers;

    PowerFixture()
    {
        context.layout = maze::GenerateMaze(1234, 3);
        context.mazeState = maze::CreateInitialMazeState(context.layout);
        context.collision.Build(context.layout);
        context.collision.Refresh(context.layout, context.mazeState);
        context.scenario = cosmos::DefaultCosmicScenario();
        context.era = context.scenario.EraAt(0.0);
        context.rng.seed(7);
        context.nowMs = 10000;

        const char* colors[] = {"#ff0000", "#00ff00", "#0000ff"};
        for (int i = 0; i < 3; ++i)
        {
            PlayerState player;
            player.playerId = "p" + std::to_string(i);
            player.name = player.playerId;
            player.color = colors[i];
            player.position = glm::vec3{static_cast<float>(i) * 2.0F, 0.0F, 0.0F};
            context.players.push_back(player);
        }
    }

    PlayerState& Give(int index, PowerType type)
    {
        PlayerState& player = context.players[static_cast<std::size_t>(index)];
        player.power = type;
        powers.InitializePlayer(player);
        return player;
    }

    ActionResult Use(PlayerState& player, const std::string& targetId = {})
    {
        PowerRequest request;
        request.targetId = targetId;
        return powers.Activate(context, player, request);
    }

    void AdvanceTo(std::int64_t nowMs)
    {
        context.nowMs = nowMs;
        powers.RechargeCharges(context);
        powers.ExpirePowers(context);
        powers.ExpireBarriers(context);
    }
};
} // namespace

TEST_CASE("Every dealt power maps to a variant alternative", "[powers]")
{
    for (const PowerType type : kAllPowers)
    {
        REQUIRE(MakePower(type).has_value());
        CHECK(MutatedFieldsOf(*MakePower(type)) != kFieldNone);
    }
    CHECK_FALSE(MakePower(PowerType::None).has_value());
    CHECK(KindOf(*MakePower(PowerType::Metamorph)) == PowerKind::Transform);
    CHECK(KindOf(*MakePower(PowerType::Flash)) == PowerKind::Duration);
    CHECK(KindOf(*MakePower(PowerType::Oracle)) == PowerKind::Instant);
}

TEST_CASE("Registry defaults", "[powers][registry]")
{
    const PowerRegistry registry;
    CHECK(registry.Size() == kAllPowers.size());
    CHECK(registry.Get(PowerType::Teleport).maxCharges == 2);
    CHECK(registry.Get(PowerType::Barrier).maxCharges == 3);
    CHECK(registry.Get(PowerType::Flash).durationMs == 10000);
    CHECK(registry.Get(PowerType::Necromancer).targetRange == Approx(3.0F));
    CHECK(registry.Find(PowerType::None) == nullptr);
    CHECK(registry.Get(PowerType::None).type == PowerType::None);
}

TEST_CASE("Powerless and dead players cannot activate", "[powers]")
{
    PowerFixture fixture;
    PlayerState& none = fixture.context.players[0];
    CHECK(fixture.Use(none).reason == reason::kNotAllowed);

    PlayerState& flash = fixture.Give(1, PowerType::Flash);
    flash.isAlive = false;
    flash.isGhost = true;
    CHECK(fixture.Use(flash).reason == reason::kWrongState);
}

TEST_CASE("Duration powers revert everything they set", "[powers][revert]")
{
    PowerFixture fixture;

    SECTION("flash")
    {
        PlayerState& player = fixture.Give(0, PowerType::Flash);
        REQUIRE(fixture.Use(player).ok);
        CHECK(player.powerActive);
        CHECK(player.speedMultiplier == Approx(3.0F));

        fixture.AdvanceTo(fixture.context.nowMs + 10000);
        CHECK_FALSE(player.powerActive);
        CHECK(player.speedMultiplier == Approx(1.0F));
        CHECK(player.powerCooldownEnd == fixture.context.nowMs + 40000);
    }
    SECTION("invisible and impermeable")
    {
        PlayerState& hidden = fixture.Give(0, PowerType::Invisible);
        PlayerState& ghostly = fixture.Give(1, PowerType::Impermeable);
        REQUIRE(fixture.Use(hidden).ok);
        REQUIRE(fixture.Use(ghostly).ok);
        CHECK(hidden.isInvisible);
        CHECK(ghostly.isImpermeable);

        fixture.AdvanceTo(fixture.context.nowMs + 15000);
        CHECK_FALSE(hidden.isInvisible);
        CHECK_FALSE(ghostly.isImpermeable);
    }
    SECTION("time controller")
    {
        PlayerState& caster = fixture.Give(0, PowerType::TimeController);
        REQUIRE(fixture.Use(caster).ok);
        CHECK(caster.frozenPlayers.size() == 2);
        CHECK(fixture.context.players[1].frozenBy == "p0");
        CHECK(fixture.context.players[2].speedMultiplier == 0.0F);
        CHECK(caster.speedMultiplier == Approx(1.0F));

        fixture.AdvanceTo(fixture.context.nowMs + 5000);
        CHECK(fixture.context.players[1].frozenBy.empty());
        CHECK(fixture.context.players[2].speedMultiplier == Approx(1.0F));
        CHECK(caster.frozenPlayers.empty());
    }
    SECTION("mind controller")
    {
        PlayerState& caster = fixture.Give(0, PowerType::MindController);
        REQUIRE(fixture.Use(caster, "p2").ok);
        CHECK(caster.mindControlTargetId == "p2");

        fixture.AdvanceTo(fixture.context.nowMs + 8000);
        CHECK(caster.mindControlTargetId.empty());
        CHECK_FALSE(caster.mindControlInput.has_value());
    }
}

TEST_CASE("Activating an active power toggles it off", "[powers]")
{
    PowerFixture fixture;
    PlayerState& player = fixture.Give(0, PowerType::Invisible);
    REQUIRE(fixture.Use(player).ok);
    REQUIRE(player.isInvisible);

    fixture.context.nowMs += 2000;
    CHECK(fixture.Use(player).ok);
    CHECK_FALSE(player.powerActive);
    CHECK_FALSE(player.isInvisible);
    CHECK(player.powerCooldownEnd == fixture.context.nowMs + 45000);
}

TEST_CASE("Cooldown is checked before uses", "[powers]")
{
    PowerFixture fixture;
    PlayerState& player = fixture.Give(0, PowerType::Medic);
    REQUIRE(fixture.Use(player, "p1").ok);
    CHECK(fixture.context.players[1].hasShield);
    CHECK(player.powerUsesLeft == 0);

    CHECK(fixture.Use(player, "p1").reason == reason::kCooldown);
    fixture.context.nowMs += 60000;
    CHECK(fixture.Use(player, "p1").reason == reason::kNoUses);
}

TEST_CASE("Failed activation spends nothing", "[powers]")
{
    PowerFixture fixture;
    PlayerState& player = fixture.Give(0, PowerType::Metamorph);

    CHECK(fixture.Use(player, "nobody").reason == reason::kNoTarget);
    CHECK(player.powerUsesLeft == 1);
    CHECK(player.powerCooldownEnd == 0);

    fixture.context.players[2].position = glm::vec3{50.0F, 0.0F, 0.0F};
    fixture.Give(2, PowerType::Flash);
    CHECK(fixture.Use(player, "p2").reason == reason::kTooFar);
    CHECK(player.powerUsesLeft == 1);
    CHECK_FALSE(player.isMetamorphed);
}

TEST_CASE("Charge powers spend and regain charges", "[powers][charges]")
{
    PowerFixture fixture;
    PlayerState& player = fixture.Give(0, PowerType::Teleport);
    REQUIRE(player.powerCharges == 2);
    const std::int64_t start = fixture.context.nowMs;

    PowerRequest request;
    request.point = glm::vec3{20.0F, 3.0F, -30.0F};
    REQUIRE(fixture.powers.Activate(fixture.context, player, request).ok);
    CHECK(player.position.x == Approx(20.0F));
    CHECK(player.position.y == 0.0F);
    CHECK(player.position.z == Approx(-30.0F));
    CHECK(player.powerCharges == 1);
    CHECK(player.nextChargeAtMs == start + 40000);
    CHECK_FALSE(player.powerActive);

    // No cooldown between charges.
    REQUIRE(fixture.powers.Activate(fixture.context, player, request).ok);
    CHECK(player.powerCharges == 0);
    CHECK(fixture.powers.Activate(fixture.context, player, request).reason == reason::kNoCharges);

    fixture.AdvanceTo(start + 39999);
    CHECK(player.powerCharges == 0);
    fixture.AdvanceTo(start + 40000);
    CHECK(player.powerCharges == 1);
    CHECK(player.nextChargeAtMs == start + 80000);
    fixture.AdvanceTo(start + 80000);
    CHECK(player.powerCharges == 2);
    CHECK(player.nextChargeAtMs == 0);
}

TEST_CASE("Metamorph copies a power on its own clock", "[powers][metamorph]")
{
    PowerFixture fixture;
    PlayerState& caster = fixture.Give(0, PowerType::Metamorph);
    fixture.Give(1, PowerType::Flash);
    const std::int64_t start = fixture.context.nowMs;

    REQUIRE(fixture.Use(caster, "p1").ok);
    CHECK(caster.isMetamorphed);
    CHECK_FALSE(caster.powerActive);
    CHECK(caster.color == "#00ff00");
    CHECK(caster.power == PowerType::Flash);
    CHECK(caster.powerUsesLeft == 1);

    // The copied power is usable while transformed.
    REQUIRE(fixture.Use(caster).ok);
    CHECK(caster.speedMultiplier == Approx(3.0F));

    fixture.AdvanceTo(start + 10000);
    CHECK(caster.isMetamorphed);
    CHECK(caster.speedMultiplier == Approx(1.0F));

    fixture.AdvanceTo(start + 30000);
    CHECK_FALSE(caster.isMetamorphed);
    CHECK(caster.color == "#ff0000");
    CHECK(caster.power == PowerType::Metamorph);
    CHECK(caster.powerUsesLeft == 0);
    CHECK(caster.powerCooldownEnd == start + 30000 + 60000);
}

TEST_CASE("A copied charge power does not recharge", "[powers][metamorph][charges]")
{
    PowerFixture fixture;
    PlayerState& caster = fixture.Give(0, PowerType::Metamorph);
    fixture.Give(1, PowerType::Barrier);
    const std::int64_t start = fixture.context.nowMs;

    REQUIRE(fixture.Use(caster, "p1").ok);
    REQUIRE(caster.power == PowerType::Barrier);
    REQUIRE(fixture.Use(caster).ok);
    CHECK(caster.powerCharges == 0);

    // Well past the Barrier cooldown but still inside the metamorph window.
    fixture.AdvanceTo(start + 16000);
    fixture.AdvanceTo(start + 29000);
    CHECK(caster.isMetamorphed);
    CHECK(caster.powerCharges == 0);
    CHECK(fixture.Use(caster).reason == reason::kNoCharges);

    fixture.AdvanceTo(start + 30000);
    CHECK_FALSE(caster.isMetamorphed);
    CHECK(caster.power == PowerType::Metamorph);
}

TEST_CASE("Metamorph cannot copy nothing or itself", "[powers][metamorph]")
{
    PowerFixture fixture;
    PlayerState& caster = fixture.Give(0, PowerType::Metamorph);
    CHECK(fixture.Use(caster, "p1").reason == reason::kNotAllowed);
    fixture.Give(1, PowerType::Metamorph);
    CHECK(fixture.Use(caster, "p1").reason == reason::kNotAllowed);
}

TEST_CASE("Hacker revert restores toggles but leaves sabotage", "[powers][hacker]")
{
    PowerFixture fixture;
    maze::MazeState& state = fixture.context.mazeState;
    REQUIRE(fixture.context.layout.doors.size() >= 2);
    REQUIRE_FALSE(state.lightStates.empty());

    const std::string toggled = fixture.context.layout.doors[0].id;
    const std::string sabotaged = fixture.context.layout.doors[1].id;
    const std::string light = state.lightStates.begin()->first;

    PlayerState& hacker = fixture.Give(0, PowerType::Hacker);
    CHECK(fixture.powers.HackerAction(fixture.context, hacker, "door", toggled).reason == reason::kNotAllowed);

    REQUIRE(fixture.Use(hacker).ok);
    REQUIRE(fixture.powers.HackerAction(fixture.context, hacker, "door", toggled).ok);
    REQUIRE(fixture.powers.HackerAction(fixture.context, hacker, "door_sabotage", sabotaged).ok);
    REQUIRE(fixture.powers.HackerAction(fixture.context, hacker, "light", light).ok);
    CHECK(fixture.powers.HackerAction(fixture.context, hacker, "door", "door_999").reason == reason::kNotFound);
    CHECK(fixture.powers.HackerAction(fixture.context, hacker, "satellite", light).reason == reason::kNotFound);

    CHECK(state.doorStates[toggled].isLocked);
    CHECK(state.doorStates[toggled].lockExpiresAtMs == 0);
    CHECK(state.doorStates[sabotaged].lockExpiresAtMs == fixture.context.nowMs + fixture.context.tuning.sabotageDoorMs);
    CHECK_FALSE(state.lightStates[light]);

    fixture.powers.Deactivate(fixture.context, hacker);
    CHECK_FALSE(state.doorStates[toggled].isLocked);
    CHECK(state.doorStates[toggled].lockedBy.empty());
    CHECK(state.doorStates[sabotaged].isLocked);
    CHECK(state.lightStates[light]);
    CHECK(hacker.hackerLockedDoors.empty());
}

TEST_CASE("Another hacker's lock cannot be taken over", "[powers][hacker]")
{
    PowerFixture fixture;
    const std::string door = fixture.context.layout.doors.front().id;
    PlayerState& first = fixture.Give(0, PowerType::Hacker);
    PlayerState& second = fixture.Give(1, PowerType::Hacker);
    REQUIRE(fixture.Use(first).ok);
    REQUIRE(fixture.Use(second).ok);

    REQUIRE(fixture.powers.HackerAction(fixture.context, first, "door", door).ok);
    CHECK(fixture.powers.HackerAction(fixture.context, second, "door", door).reason == reason::kLocked);
}

TEST_CASE("Medic revives a ghost and removes the body", "[powers]")
{
    PowerFixture fixture;
    PlayerState& medic = fixture.Give(0, PowerType::Medic);
    PlayerState& victim = fixture.context.players[1];
    fixture.context.HandleDeath(victim, "cold", std::string{});
    REQUIRE(fixture.context.deadBodies.size() == 1);

    REQUIRE(fixture.Use(medic, "p1").ok);
    CHECK(victim.isAlive);
    CHECK_FALSE(victim.isGhost);
    CHECK(victim.health == Approx(fixture.context.tuning.reviveHealth));
    CHECK(fixture.context.deadBodies.empty());
}

TEST_CASE("Necromancer consumes a nearby corpse", "[powers]")
{
    PowerFixture fixture;
    PlayerState& necromancer = fixture.Give(0, PowerType::Necromancer);
    necromancer.health = 30.0F;

    CHECK(fixture.Use(necromancer).reason == reason::kNoTarget);

    fixture.context.HandleDeath(fixture.context.players[1], "heat", std::string{});
    REQUIRE(fixture.Use(necromancer).ok);
    CHECK(necromancer.health == Approx(80.0F));
    CHECK(fixture.context.deadBodies.empty());
}

TEST_CASE("Barriers are capped per owner and expire", "[powers][barrier]")
{
    PowerFixture fixture;
    PlayerState& builder = fixture.Give(0, PowerType::Barrier);

    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(fixture.Use(builder).ok);
        fixture.context.nowMs += 15000;
        fixture.powers.RechargeCharges(fixture.context);
    }
    std::vector<maze::BarrierWall>& barriers = fixture.context.mazeState.barrierWalls;
    REQUIRE(barriers.size() == 3);
    CHECK(barriers.front().wallId == "barrier_p0_0");
    CHECK(fixture.context.collision.BarrierSegments().size() == 3);

    builder.powerCharges = 1;
    REQUIRE(fixture.Use(builder).ok);
    REQUIRE(barriers.size() == 3);
    CHECK(barriers.front().wallId == "barrier_p0_1");
    CHECK(barriers.back().wallId == "barrier_p0_3");

    fixture.context.nowMs = barriers.back().expiresAtMs;
    fixture.powers.ExpireBarriers(fixture.context);
    CHECK(barriers.empty());
    CHECK(fixture.context.collision.BarrierSegments().empty());
}

TEST_CASE("Barriers face the caster or the aim point", "[powers][barrier]")
{
    PowerFixture fixture;
    PlayerState& builder = fixture.Give(0, PowerType::Barrier);
    std::vector<maze::BarrierWall>& barriers = fixture.context.mazeState.barrierWalls;

    // Facing -Z, the wall spans X two metres ahead.
    REQUIRE(fixture.Use(builder).ok);
    REQUIRE(barriers.size() == 1);
    CHECK(barriers.back().start.y == Approx(-2.0F));
    CHECK(barriers.back().end.y == Approx(-2.0F));
    CHECK(std::abs(barriers.back().end.x - barriers.back().start.x) == Approx(4.0F));

    // Aiming along +X turns the wall to span Z, whatever the yaw.
    PowerRequest request;
    request.point = glm::vec3{5.0F, 0.0F, 0.0F};
    REQUIRE(fixture.powers.Activate(fixture.context, builder, request).ok);
    REQUIRE(barriers.size() == 2);
    const maze::BarrierWall& aimed = barriers.back();
    CHECK(aimed.start.x == Approx(5.0F));
    CHECK(aimed.end.x == Approx(5.0F));
    CHECK(std::abs(aimed.end.y - aimed.start.y) == Approx(4.0F));
    CHECK((aimed.start.y + aimed.end.y) * 0.5F == Approx(0.0F).margin(1e-5));
}

TEST_CASE("Oracle answers only its caster", "[powers]")
{
    PowerFixture fixture;
    PlayerState& oracle = fixture.Give(0, PowerType::Oracle);

    std::vector<core::Event> received;
    fixture.context.events.SubscribeAll([&](const core::Event& event) { received.push_back(event); });

    REQUIRE(fixture.Use(oracle).ok);
    fixture.context.events.DispatchQueued();

    bool found = false;
    for (const core::Event& event : received)
    {
        if (event.name == "oracle_prediction")
        {
            found = true;
            CHECK(event.recipient == "p0");
            CHECK(event.args.size() == 2 + 2);
        }
    }
    CHECK(found);
    CHECK(oracle.powerCharges == 2);
}

TEST_CASE("Dead players lose their active power", "[powers]")
{
    PowerFixture fixture;
    PlayerState& player = fixture.Give(0, PowerType::Invisible);
    REQUIRE(fixture.Use(player).ok);

    fixture.context.HandleDeath(player, "tidal", std::string{});
    fixture.AdvanceTo(fixture.context.nowMs + 1);
    CHECK_FALSE(player.powerActive);
    CHECK_FALSE(player.isInvisible);
}
