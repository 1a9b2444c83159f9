#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace trisolar::gameplay
{
/// Every power a player can be dealt at match start.
enum class PowerType : std::uint8_t
{
    None = 0,
    Metamorph,       ///< Copies another player's color and power
    Invisible,       ///< Hidden from other clients
    Teleport,        ///< Instant relocation, charge based
    Medic,           ///< Revives a ghost or grants a shield
    TimeController,  ///< Freezes every other living player
    Hacker,          ///< Remote door, light, wall and sabotage actions
    Flash,           ///< Triple speed
    Necromancer,     ///< Consumes a corpse to heal
    MindController,  ///< Steers another player
    Barrier,         ///< Places a temporary wall, charge based
    Impermeable,     ///< Walks through walls
    Oracle           ///< Predicts player positions and upcoming eras, charge based
};

constexpr std::array<PowerType, 12> kAllPowers{
    PowerType::Metamorph,
    PowerType::Invisible,
    PowerType::Teleport,
    PowerType::Medic,
    PowerType::TimeController,
    PowerType::Hacker,
    PowerType::Flash,
    PowerType::Necromancer,
    PowerType::MindController,
    PowerType::Barrier,
    PowerType::Impermeable,
    PowerType::Oracle,
};

/// Short id used on the wire and in config files.
[[nodiscard]] inline const char* PowerToId(PowerType type)
{
    switch (type)
    {
        case PowerType::Metamorph: return "metamorph";
        case PowerType::Invisible: return "invisible";
        case PowerType::Teleport: return "teleport";
        case PowerType::Medic: return "medic";
        case PowerType::TimeController: return "time_controller";
        case PowerType::Hacker: return "hacker";
        case PowerType::Flash: return "flash";
        case PowerType::Necromancer: return "necromancer";
        case PowerType::MindController: return "mind_controller";
        case PowerType::Barrier: return "barrier";
        case PowerType::Impermeable: return "impermeable";
        case PowerType::Oracle: return "oracle";
        case PowerType::None:
        default: return "none";
    }
}

[[nodiscard]] inline bool TryParsePower(const std::string& id, PowerType& outType)
{
    for (const PowerType type : kAllPowers)
    {
        if (id == PowerToId(type))
        {
            outType = type;
            return true;
        }
    }
    if (id == "none")
    {
        outType = PowerType::None;
        return true;
    }
    return false;
}

/// Tunable numbers of one power. maxCharges > 0 switches the power to the
/// charge model where cooldownMs is the per-charge recharge time.
struct PowerDefinition
{
    PowerType type = PowerType::None;
    std::string displayName;
    std::string description;
    int durationMs = 0;         ///< 0 = instant
    int cooldownMs = 0;
    int usesPerMatch = 1;
    int maxCharges = 0;
    float targetRange = 10.0F;
    bool requiresTarget = false;
    bool requiresLocation = false;

    [[nodiscard]] bool IsChargeBased() const { return maxCharges > 0; }
    [[nodiscard]] bool IsInstant() const { return durationMs <= 0; }
};
} // namespace trisolar::gameplay
