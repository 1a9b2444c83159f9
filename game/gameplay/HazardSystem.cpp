#include "game/gameplay/HazardSystem.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "engine/physics/RayOcclusion.hpp"
#include "game/cosmos/FirePositions.hpp"

namespace trisolar::gameplay
{
DamageSource HazardDamage::Dominant() const
{
    const std::pair<float, DamageSource> sources[] = {
        {heat, DamageSource::Heat},
        {fire, DamageSource::Fire},
        {cold, DamageSource::Cold},
        {tidal, DamageSource::Tidal},
        {oxygen, DamageSource::Oxygen},
    };

    DamageSource dominant = DamageSource::None;
    float best = 0.0F;
    for (const auto& [amount, source] : sources)
    {
        if (amount > best)
        {
            best = amount;
            dominant = source;
        }
    }
    return dominant;
}

ShelterStatus HazardSystem::EvaluateShelter(const MatchContext& context, const PlayerState& player)
{
    ShelterStatus status;
    if (player.isUnderground)
    {
        status.inShelter = true;
        return status;
    }

    const auto [row, col] = maze::WorldToCell(player.position.x, player.position.z);
    if (const maze::RoomInfo* room = context.layout.RoomAtCell(row, col))
    {
        status.doorProtection = context.mazeState.IsRoomSealed(context.layout, *room);
    }

    for (const maze::ShelterZone& zone : context.layout.shelterZones)
    {
        if (DistanceXZ(player.position, zone.position) <= zone.radius)
        {
            status.inZone = true;
            break;
        }
    }

    status.inShelter = status.doorProtection || status.inZone;
    return status;
}

float HazardSystem::ComputeExposure(const MatchContext& context, const PlayerState& player, bool inShelter)
{
    int unblocked = 0;
    const glm::vec2 origin{player.position.x, player.position.z};

    for (const glm::dvec3& sun : context.simulation.SunPositions())
    {
        if (!cosmos::IsSunVisible(sun) || inShelter)
        {
            continue;
        }

        if (cosmos::SunElevation(sun) > cosmos::kOverheadElevation)
        {
            ++unblocked;
            continue;
        }

        const glm::vec2 direction = cosmos::SunDirection2D(player.position.x, player.position.z, sun);
        if (!physics::IsRayBlocked(origin, direction, context.collision.SolidSurfaceSegments()))
        {
            ++unblocked;
        }
    }

    return static_cast<float>(unblocked) / 3.0F;
}

HazardDamage HazardSystem::ComputeDamage(
    const MatchContext& context,
    const PlayerState& player,
    const ShelterStatus& shelter,
    float exposure
)
{
    const MatchTuning& t = context.tuning;
    HazardDamage damage;

    if (!shelter.inShelter)
    {
        switch (context.era.era)
        {
            case cosmos::Era::ChaosInferno:
                damage.heat = t.infernoAmbientDps + t.infernoExposureDps * exposure;
                if (cosmos::IsNearFire(player.position.x, player.position.z))
                {
                    damage.fire = t.fireDps;
                }
                break;
            case cosmos::Era::ChaosIce:
                damage.cold = t.iceDps;
                break;
            case cosmos::Era::ChaosGravity:
                damage.tidal = t.tidalDps * (context.simulation.Events().isBinary ? t.tidalBinaryMultiplier : 1.0F);
                break;
            case cosmos::Era::Stable:
            default:
                break;
        }
    }

    if (context.mazeState.shipOxygen <= 0.0F)
    {
        damage.oxygen = t.suffocationDps;
    }
    return damage;
}

void HazardSystem::Apply(MatchContext& context, float dtSeconds)
{
    for (PlayerState& player : context.players)
    {
        if (!player.isAlive || player.isGhost)
        {
            continue;
        }

        const ShelterStatus shelter = EvaluateShelter(context, player);
        player.doorProtection = shelter.doorProtection;
        player.inShelter = shelter.inShelter;

        const float exposure = ComputeExposure(context, player, shelter.inShelter);
        const HazardDamage damage = ComputeDamage(context, player, shelter, exposure);
        const float total = damage.Total();

        if (total > 0.0F)
        {
            player.health = std::max(0.0F, player.health - total * dtSeconds);
            player.damageSource = damage.Dominant();
        }
        else
        {
            player.damageSource = DamageSource::None;
            if (context.era.era == cosmos::Era::Stable)
            {
                player.health = std::min(player.maxHealth, player.health + context.tuning.healPerSecond * dtSeconds);
            }
        }

        if (player.health <= 0.0F)
        {
            context.HandleDeath(player, DamageSourceToText(player.damageSource), std::string{});
        }
    }
}
} // namespace trisolar::gameplay
