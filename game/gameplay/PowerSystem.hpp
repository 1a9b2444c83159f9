#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/vec3.hpp>

#include "game/gameplay/ActionResult.hpp"
#include "game/gameplay/MatchContext.hpp"
#include "game/gameplay/PlayerState.hpp"
#include "game/gameplay/PowerRegistry.hpp"
#include "game/gameplay/PowerTypes.hpp"

namespace trisolar::gameplay
{
struct PowerRequest
{
    std::string targetId;
    std::optional<glm::vec3> point;
    std::string bodyId;
};

/// State a power may write. Each power declares what it mutates, what its
/// Revert restores and what it leaves in place on purpose.
enum PowerField : std::uint32_t
{
    kFieldNone = 0,
    kFieldColor = 1U << 0,
    kFieldPower = 1U << 1,
    kFieldPowerUses = 1U << 2,
    kFieldCooldown = 1U << 3,
    kFieldInvisible = 1U << 4,
    kFieldSpeed = 1U << 5,
    kFieldOthersFrozen = 1U << 6,
    kFieldHackerLists = 1U << 7,
    kFieldDoors = 1U << 8,
    kFieldLights = 1U << 9,
    kFieldWalls = 1U << 10,
    kFieldSabotage = 1U << 11,
    kFieldMindControl = 1U << 12,
    kFieldImpermeable = 1U << 13,
    kFieldPosition = 1U << 14,
    kFieldShield = 1U << 15,
    kFieldRevive = 1U << 16,
    kFieldHealth = 1U << 17,
    kFieldCorpses = 1U << 18,
    kFieldBarriers = 1U << 19,
    kFieldPrediction = 1U << 20
};

enum class PowerKind : std::uint8_t
{
    Duration,  ///< active until duration, toggle or revert
    Instant,   ///< applied once, never active
    Transform  ///< runs on its own clock without the active flag
};

struct PowerContext
{
    MatchContext& match;
    PlayerState& caster;
    const PowerRequest& request;
    const PowerDefinition& definition;
};

namespace powers
{
struct Metamorph
{
    static constexpr PowerType kType = PowerType::Metamorph;
    static constexpr PowerKind kKind = PowerKind::Transform;
    static constexpr std::uint32_t kMutates = kFieldColor | kFieldPower | kFieldPowerUses | kFieldCooldown;
    static constexpr std::uint32_t kReverts = kMutates;
    static constexpr std::uint32_t kNonReverting = kFieldNone;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct Invisible
{
    static constexpr PowerType kType = PowerType::Invisible;
    static constexpr PowerKind kKind = PowerKind::Duration;
    static constexpr std::uint32_t kMutates = kFieldInvisible;
    static constexpr std::uint32_t kReverts = kMutates;
    static constexpr std::uint32_t kNonReverting = kFieldNone;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct Teleport
{
    static constexpr PowerType kType = PowerType::Teleport;
    static constexpr PowerKind kKind = PowerKind::Instant;
    static constexpr std::uint32_t kMutates = kFieldPosition;
    static constexpr std::uint32_t kReverts = kFieldNone;
    static constexpr std::uint32_t kNonReverting = kFieldPosition;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct Medic
{
    static constexpr PowerType kType = PowerType::Medic;
    static constexpr PowerKind kKind = PowerKind::Instant;
    static constexpr std::uint32_t kMutates = kFieldShield | kFieldRevive | kFieldCorpses;
    static constexpr std::uint32_t kReverts = kFieldNone;
    static constexpr std::uint32_t kNonReverting = kMutates;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct TimeController
{
    static constexpr PowerType kType = PowerType::TimeController;
    static constexpr PowerKind kKind = PowerKind::Duration;
    static constexpr std::uint32_t kMutates = kFieldOthersFrozen;
    static constexpr std::uint32_t kReverts = kMutates;
    static constexpr std::uint32_t kNonReverting = kFieldNone;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

/// Hacker actions write doors, lights and walls through PowerSystem::HackerAction
/// while the power is active. Sabotage locks carry their own expiry.
struct Hacker
{
    static constexpr PowerType kType = PowerType::Hacker;
    static constexpr PowerKind kKind = PowerKind::Duration;
    static constexpr std::uint32_t kMutates = kFieldHackerLists | kFieldDoors | kFieldLights | kFieldWalls | kFieldSabotage;
    static constexpr std::uint32_t kReverts = kFieldHackerLists | kFieldDoors | kFieldLights | kFieldWalls;
    static constexpr std::uint32_t kNonReverting = kFieldSabotage;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct Flash
{
    static constexpr PowerType kType = PowerType::Flash;
    static constexpr PowerKind kKind = PowerKind::Duration;
    static constexpr std::uint32_t kMutates = kFieldSpeed;
    static constexpr std::uint32_t kReverts = kMutates;
    static constexpr std::uint32_t kNonReverting = kFieldNone;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct Necromancer
{
    static constexpr PowerType kType = PowerType::Necromancer;
    static constexpr PowerKind kKind = PowerKind::Instant;
    static constexpr std::uint32_t kMutates = kFieldCorpses | kFieldHealth;
    static constexpr std::uint32_t kReverts = kFieldNone;
    static constexpr std::uint32_t kNonReverting = kMutates;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct MindController
{
    static constexpr PowerType kType = PowerType::MindController;
    static constexpr PowerKind kKind = PowerKind::Duration;
    static constexpr std::uint32_t kMutates = kFieldMindControl;
    static constexpr std::uint32_t kReverts = kMutates;
    static constexpr std::uint32_t kNonReverting = kFieldNone;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct Barrier
{
    static constexpr PowerType kType = PowerType::Barrier;
    static constexpr PowerKind kKind = PowerKind::Instant;
    static constexpr std::uint32_t kMutates = kFieldBarriers;
    static constexpr std::uint32_t kReverts = kFieldNone;
    static constexpr std::uint32_t kNonReverting = kFieldBarriers;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct Impermeable
{
    static constexpr PowerType kType = PowerType::Impermeable;
    static constexpr PowerKind kKind = PowerKind::Duration;
    static constexpr std::uint32_t kMutates = kFieldImpermeable;
    static constexpr std::uint32_t kReverts = kMutates;
    static constexpr std::uint32_t kNonReverting = kFieldNone;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};

struct Oracle
{
    static constexpr PowerType kType = PowerType::Oracle;
    static constexpr PowerKind kKind = PowerKind::Instant;
    static constexpr std::uint32_t kMutates = kFieldPrediction;
    static constexpr std::uint32_t kReverts = kFieldNone;
    static constexpr std::uint32_t kNonReverting = kFieldPrediction;
    ActionResult Apply(PowerContext& context) const;
    void Revert(PowerContext& context) const;
};
} // namespace powers

using Power = std::variant<
    powers::Metamorph,
    powers::Invisible,
    powers::Teleport,
    powers::Medic,
    powers::TimeController,
    powers::Hacker,
    powers::Flash,
    powers::Necromancer,
    powers::MindController,
    powers::Barrier,
    powers::Impermeable,
    powers::Oracle>;

template <typename Variant>
struct RevertsEveryMutation;

template <typename... Alternatives>
struct RevertsEveryMutation<std::variant<Alternatives...>>
{
    static constexpr bool value =
        (((Alternatives::kMutates & ~(Alternatives::kReverts | Alternatives::kNonReverting)) == 0U) && ...);
};

static_assert(RevertsEveryMutation<Power>::value, "a power mutates a field it neither reverts nor declares non-reverting");
static_assert(std::variant_size_v<Power> == kAllPowers.size(), "every power type needs a variant alternative");

[[nodiscard]] std::optional<Power> MakePower(PowerType type);
[[nodiscard]] PowerKind KindOf(const Power& power);
[[nodiscard]] std::uint32_t MutatedFieldsOf(const Power& power);

struct OraclePrediction
{
    std::string playerId;
    glm::vec3 current{0.0F};
    glm::vec3 predicted{0.0F};
};

/// Linear extrapolation from the oldest history sample of each other living player.
[[nodiscard]] std::vector<OraclePrediction> PredictPositions(
    const MatchContext& context,
    const std::string& casterId,
    float horizonSeconds
);

/// Activation, expiry, recharge and revert of player powers.
class PowerSystem
{
public:
    explicit PowerSystem(PowerRegistry registry = PowerRegistry{});

    /// Resets uses and charges for the player's dealt power.
    void InitializePlayer(PlayerState& player) const;

    /// Activating an active power toggles it off. Resources are only spent
    /// when the power applies successfully.
    [[nodiscard]] ActionResult Activate(MatchContext& context, PlayerState& player, const PowerRequest& request);

    /// Ends the active power, or the metamorph clock when nothing is active.
    void Deactivate(MatchContext& context, PlayerState& player);
    void EndMetamorph(MatchContext& context, PlayerState& player);

    /// Drops barriers past their lifetime and refreshes collision when any went.
    void ExpireBarriers(MatchContext& context) const;
    /// One charge per cooldown interval, up to the definition's maxCharges.
    void RechargeCharges(MatchContext& context) const;
    /// Ends elapsed durations and metamorphs. Dead players lose everything active.
    void ExpirePowers(MatchContext& context);

    /// targetType is one of door, light, wall, door_sabotage, pipe, generator.
    [[nodiscard]] ActionResult HackerAction(
        MatchContext& context,
        PlayerState& player,
        const std::string& targetType,
        const std::string& targetId
    );

    [[nodiscard]] const PowerRegistry& Registry() const { return m_registry; }

private:
    PowerRegistry m_registry;
};
} // namespace trisolar::gameplay
