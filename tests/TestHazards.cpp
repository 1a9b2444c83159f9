#include <catch2/catch.hpp>

#include <string>

#include "game/cosmos/FirePositions.hpp"
#include "game/gameplay/HazardSystem.hpp"
#include "game/gameplay/MatchContext.hpp"
#include "game/maze/MazeGenerator.hpp"

using namespace trisolar;
using gameplay::HazardDamage;
using gameplay::HazardSystem;
using gameplay::MatchContext;
using gameplay::PlayerState;
using gameplay::ShelterStatus;

namespace
{
void PrepareContext(MatchContext& context)
{
    context.layout = maze::GenerateMaze(1234, 4);
    context.mazeState = maze::CreateInitialMazeState(context.layout);
    context.collision.Build(context.layout);
    context.collision.Refresh(context.layout, context.mazeState);
    context.scenario = cosmos::DefaultCosmicScenario();
    context.era = context.scenario.EraAt(0.0);
}

PlayerState MakePlayer(const std::string& id, const glm::vec3& position)
{
    PlayerState player;
    player.playerId = id;
    player.name = id;
    player.position = position;
    return player;
}

void FormBinary(cosmos::SunSimulation& simulation)
{
    simulation.SetBodies({{
        cosmos::Body{{-5.0, 100.0, 0.0}, {0.0, 0.0, 0.0}, 1.0},
        cosmos::Body{{5.0, 100.0, 0.0}, {0.0, 0.0, 0.0}, 1.0},
        cosmos::Body{{0.0, 100.0, 1000.0}, {0.0, 0.0, 0.0}, 1.0},
    }});
    for (int i = 0; i < simulation.Parameters().binaryTicks; ++i)
    {
        simulation.Advance(0.0);
    }
}

constexpr cosmos::Era kAllEras[] = {
    cosmos::Era::Stable,
    cosmos::Era::ChaosInferno,
    cosmos::Era::ChaosIce,
    cosmos::Era::ChaosGravity,
};
} // namespace

TEST_CASE("Sheltered players take no era damage in any era", "[hazard]")
{
    MatchContext context;
    PrepareContext(context);
    FormBinary(context.simulation);
    REQUIRE(context.simulation.Events().isBinary);

    const glm::vec3 fire = cosmos::FirePositions()[0];
    const PlayerState player = MakePlayer("p1", glm::vec3{fire.x, 0.0F, fire.z});
    ShelterStatus shelter;
    shelter.inShelter = true;

    for (const cosmos::Era era : kAllEras)
    {
        context.era.era = era;
        const HazardDamage damage = HazardSystem::ComputeDamage(context, player, shelter, 1.0F);
        INFO("era " << cosmos::EraToText(era));
        CHECK(damage.heat == 0.0F);
        CHECK(damage.fire == 0.0F);
        CHECK(damage.cold == 0.0F);
        CHECK(damage.tidal == 0.0F);
        CHECK(damage.oxygen == 0.0F);
    }
}

TEST_CASE("Suffocation ignores shelter", "[hazard][oxygen]")
{
    MatchContext context;
    PrepareContext(context);
    context.mazeState.shipOxygen = 0.0F;

    const PlayerState player = MakePlayer("p1", glm::vec3{0.0F});
    ShelterStatus shelter;
    shelter.inShelter = true;

    for (const cosmos::Era era : kAllEras)
    {
        context.era.era = era;
        const HazardDamage damage = HazardSystem::ComputeDamage(context, player, shelter, 0.0F);
        CHECK(damage.oxygen == Approx(context.tuning.suffocationDps));
        CHECK(damage.Total() == Approx(context.tuning.suffocationDps));
        CHECK(damage.Dominant() == gameplay::DamageSource::Oxygen);
    }
}

TEST_CASE("Exposed players take the era's damage", "[hazard]")
{
    MatchContext context;
    PrepareContext(context);
    const gameplay::MatchTuning& tuning = context.tuning;
    const ShelterStatus exposed;

    SECTION("inferno heat scales with exposure")
    {
        context.era.era = cosmos::Era::ChaosInferno;
        const PlayerState player = MakePlayer("p1", glm::vec3{85.0F, 0.0F, 85.0F});
        const HazardDamage none = HazardSystem::ComputeDamage(context, player, exposed, 0.0F);
        const HazardDamage full = HazardSystem::ComputeDamage(context, player, exposed, 1.0F);
        CHECK(none.heat == Approx(tuning.infernoAmbientDps));
        CHECK(full.heat == Approx(tuning.infernoAmbientDps + tuning.infernoExposureDps));
        CHECK(full.fire == 0.0F);
    }
    SECTION("inferno fire spots burn")
    {
        context.era.era = cosmos::Era::ChaosInferno;
        const glm::vec3 fire = cosmos::FirePositions()[3];
        const PlayerState player = MakePlayer("p1", glm::vec3{fire.x + 0.5F, 0.0F, fire.z});
        const HazardDamage damage = HazardSystem::ComputeDamage(context, player, exposed, 0.0F);
        CHECK(damage.fire == Approx(tuning.fireDps));
        CHECK(damage.Dominant() == gameplay::DamageSource::Fire);
    }
    SECTION("ice freezes")
    {
        context.era.era = cosmos::Era::ChaosIce;
        const HazardDamage damage = HazardSystem::ComputeDamage(context, MakePlayer("p1", glm::vec3{0.0F}), exposed, 1.0F);
        CHECK(damage.cold == Approx(tuning.iceDps));
        CHECK(damage.heat == 0.0F);
    }
    SECTION("tidal damage grows in a binary")
    {
        context.era.era = cosmos::Era::ChaosGravity;
        const PlayerState player = MakePlayer("p1", glm::vec3{0.0F});
        const float single = HazardSystem::ComputeDamage(context, player, exposed, 1.0F).tidal;
        CHECK(single == Approx(tuning.tidalDps));

        FormBinary(context.simulation);
        const float binary = HazardSystem::ComputeDamage(context, player, exposed, 1.0F).tidal;
        CHECK(binary == Approx(tuning.tidalDps * tuning.tidalBinaryMultiplier));
    }
    SECTION("stable era is harmless")
    {
        context.era.era = cosmos::Era::Stable;
        CHECK(HazardSystem::ComputeDamage(context, MakePlayer("p1", glm::vec3{0.0F}), exposed, 1.0F).Total() == 0.0F);
    }
}

TEST_CASE("Shelter comes from zones, sealed rooms and pipes", "[hazard]")
{
    MatchContext context;
    PrepareContext(context);
    REQUIRE_FALSE(context.layout.shelterZones.empty());

    SECTION("inside a shelter zone")
    {
        const PlayerState player = MakePlayer("p1", context.layout.shelterZones.front().position);
        const ShelterStatus status = HazardSystem::EvaluateShelter(context, player);
        CHECK(status.inZone);
        CHECK(status.inShelter);
    }
    SECTION("underground")
    {
        PlayerState player = MakePlayer("p1", glm::vec3{0.0F, maze::kUndergroundY, 0.0F});
        player.isUnderground = true;
        CHECK(HazardSystem::EvaluateShelter(context, player).inShelter);
    }
    SECTION("the open plaza gives no cover")
    {
        const ShelterStatus status = HazardSystem::EvaluateShelter(context, MakePlayer("p1", glm::vec3{0.0F}));
        CHECK_FALSE(status.inShelter);
        CHECK_FALSE(status.doorProtection);
    }
    SECTION("a room with its door shut protects until the door opens")
    {
        const maze::RoomInfo* doored = nullptr;
        for (const maze::RoomInfo& room : context.layout.rooms)
        {
            if (room.doorId.has_value())
            {
                doored = &room;
                break;
            }
        }
        REQUIRE(doored != nullptr);

        const PlayerState player = MakePlayer("p1", doored->position);
        CHECK(HazardSystem::EvaluateShelter(context, player).doorProtection);

        context.mazeState.doorStates[*doored->doorId].isOpen = true;
        CHECK_FALSE(HazardSystem::EvaluateShelter(context, player).doorProtection);
    }
}

TEST_CASE("Sheltered players see no suns", "[hazard]")
{
    MatchContext context;
    PrepareContext(context);
    const PlayerState player = MakePlayer("p1", glm::vec3{0.0F});

    CHECK(HazardSystem::ComputeExposure(context, player, true) == 0.0F);
    const float exposure = HazardSystem::ComputeExposure(context, player, false);
    CHECK(exposure >= 0.0F);
    CHECK(exposure <= 1.0F);
}

TEST_CASE("Stable era heals the wounded", "[hazard]")
{
    MatchContext context;
    PrepareContext(context);
    context.players.push_back(MakePlayer("p1", glm::vec3{0.0F}));
    context.players.back().health = 50.0F;

    HazardSystem hazards;
    hazards.Apply(context, 2.0F);
    CHECK(context.players.back().health == Approx(50.0F + 2.0F * context.tuning.healPerSecond));
    CHECK(context.players.back().damageSource == gameplay::DamageSource::None);

    context.players.back().health = context.players.back().maxHealth;
    hazards.Apply(context, 2.0F);
    CHECK(context.players.back().health == Approx(context.players.back().maxHealth));
}

TEST_CASE("Hazard damage kills and leaves a body", "[hazard]")
{
    MatchContext context;
    PrepareContext(context);
    context.era.era = cosmos::Era::ChaosIce;
    context.players.push_back(MakePlayer("p1", glm::vec3{0.0F}));
    context.players.back().health = 1.0F;

    std::vector<std::string> deaths;
    context.events.Subscribe("death", [&](const core::Event& event) { deaths.push_back(event.args.at(1)); });

    HazardSystem hazards;
    hazards.Apply(context, 1.0F);
    const PlayerState& victim = context.players.back();
    CHECK_FALSE(victim.isAlive);
    CHECK(victim.isGhost);
    CHECK(victim.health == 0.0F);
    REQUIRE(context.deadBodies.size() == 1);
    CHECK(context.deadBodies.front().victimId == "p1");

    context.events.DispatchQueued();
    REQUIRE(deaths.size() == 1);
    CHECK(deaths.front() == "cold");

    // Ghosts are skipped from then on.
    hazards.Apply(context, 1.0F);
    CHECK(context.deadBodies.size() == 1);
}
