#pragma once

#include "game/gameplay/MatchContext.hpp"
#include "game/gameplay/PlayerState.hpp"

namespace trisolar::gameplay
{
struct ShelterStatus
{
    bool doorProtection = false;
    bool inZone = false;
    bool inShelter = false;
};

/// Per-second damage components for one player in one tick.
struct HazardDamage
{
    float heat = 0.0F;
    float fire = 0.0F;
    float cold = 0.0F;
    float tidal = 0.0F;
    float oxygen = 0.0F;

    [[nodiscard]] float Total() const { return heat + fire + cold + tidal + oxygen; }
    [[nodiscard]] DamageSource Dominant() const;
};

/// Applies era damage, suffocation and stable-era healing to every living
/// player, and kills those who reach zero health.
class HazardSystem
{
public:
    void Apply(MatchContext& context, float dtSeconds);

    [[nodiscard]] static ShelterStatus EvaluateShelter(const MatchContext& context, const PlayerState& player);

    /// Fraction of the three suns that currently reach the player, in [0, 1].
    [[nodiscard]] static float ComputeExposure(const MatchContext& context, const PlayerState& player, bool inShelter);

    [[nodiscard]] static HazardDamage ComputeDamage(
        const MatchContext& context,
        const PlayerState& player,
        const ShelterStatus& shelter,
        float exposure
    );
};
} // namespace trisolar::gameplay
