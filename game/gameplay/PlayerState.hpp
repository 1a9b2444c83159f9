#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>

#include "game/gameplay/Movement.hpp"
#include "game/gameplay/PowerTypes.hpp"

namespace trisolar::gameplay
{
enum class Role : std::uint8_t
{
    Crew,
    Shadow
};

[[nodiscard]] inline const char* RoleToText(Role role)
{
    return role == Role::Shadow ? "shadow" : "crew";
}

/// Dominant hazard of the last tick.
enum class DamageSource : std::uint8_t
{
    None,
    Heat,
    Fire,
    Cold,
    Tidal,
    Oxygen
};

[[nodiscard]] inline const char* DamageSourceToText(DamageSource source)
{
    switch (source)
    {
        case DamageSource::Heat: return "heat";
        case DamageSource::Fire: return "fire";
        case DamageSource::Cold: return "cold";
        case DamageSource::Tidal: return "tidal";
        case DamageSource::Oxygen: return "oxygen";
        case DamageSource::None:
        default: return "none";
    }
}

/// Server-side state of one participant. Keyed by the private session token;
/// playerId is the public handle other clients see.
struct PlayerState
{
    std::string playerId;
    std::string sessionToken;
    std::string name;
    Role role = Role::Crew;
    PowerType power = PowerType::None;
    std::string color;

    // --- Connection ---
    bool connected = true;
    std::int64_t disconnectedAtMs = 0;

    // --- Transform ---
    glm::vec3 position{0.0F};
    glm::quat rotation{1.0F, 0.0F, 0.0F, 0.0F};
    float yaw = 0.0F;

    // --- Status ---
    bool isAlive = true;
    bool isGhost = false;
    bool isHidden = false;
    bool isInvisible = false;
    bool hasShield = false;
    bool isImpermeable = false;
    float speedMultiplier = 1.0F;       ///< effective, 0 while frozen
    float baseSpeedMultiplier = 1.0F;   ///< before freezing
    std::string frozenBy;

    // --- Input ---
    std::deque<PlayerInput> inputQueue;
    std::uint32_t lastProcessedInput = 0;

    // --- Power bookkeeping ---
    bool powerActive = false;
    std::int64_t powerActiveEnd = 0;
    std::int64_t powerCooldownEnd = 0;
    int powerUsesLeft = 1;
    int powerCharges = 0;
    std::int64_t nextChargeAtMs = 0;
    float flashSavedSpeed = 1.0F;
    std::vector<std::string> frozenPlayers;
    std::vector<std::string> hackerLockedDoors;
    std::vector<std::string> hackerToggledLights;
    std::vector<std::string> hackerToggledWalls;
    int barrierNextId = 0;

    // --- Metamorph ---
    bool isMetamorphed = false;
    std::int64_t metamorphEndMs = 0;
    std::string originalColor;
    PowerType originalPower = PowerType::None;
    int originalUsesLeft = 0;
    int originalCharges = 0;

    // --- Mind control ---
    std::string mindControlTargetId;
    std::optional<PlayerInput> mindControlInput;

    // --- Health ---
    float health = 100.0F;
    float maxHealth = 100.0F;
    DamageSource damageSource = DamageSource::None;
    bool inShelter = false;
    bool doorProtection = false;

    // --- Pipes ---
    bool isUnderground = false;
    std::string currentPipeNodeId;

    // --- Ghost possession ---
    std::string possessTargetId;
    std::optional<PlayerInput> possessInput;
    std::int64_t possessEndMs = 0;
    std::int64_t possessCooldownEndMs = 0;

    // --- Oxygen refill ---
    std::string refillGeneratorId;
    std::int64_t refillStartMs = 0;

    // --- Shadow and meetings ---
    std::int64_t killCooldownEnd = 0;
    std::int64_t emergencyCooldownEnd = 0;
    int emergencyUsesLeft = 1;

    // --- Tasks ---
    std::vector<std::string> assignedTasks;
    std::string activeTaskId;

    [[nodiscard]] bool IsAssigned(const std::string& taskId) const;
    /// Recomputes speedMultiplier from baseSpeedMultiplier and the freeze.
    void RefreshSpeed();
};
} // namespace trisolar::gameplay
