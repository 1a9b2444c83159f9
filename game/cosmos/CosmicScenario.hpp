#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "game/cosmos/SunSimulation.hpp"

namespace trisolar::cosmos
{
enum class Era : std::uint8_t
{
    Stable = 0,
    ChaosInferno,
    ChaosIce,
    ChaosGravity
};

[[nodiscard]] const char* EraToText(Era era);
[[nodiscard]] bool TryParseEra(const std::string& text, Era& outEra);

struct SunConfig
{
    std::string name;
    std::string color = "#ffffff";
    float radius = 30.0F;
    float intensity = 0.35F;
    float pulseSpeed = 1.0F;
    double mass = 1.0;
};

struct CosmicPhase
{
    double startSec = 0.0;
    double endSec = 0.0;
    Era era = Era::Stable;
    float gravity = 1.0F;
    std::string description;
};

struct EraInfo
{
    Era era = Era::Stable;
    float gravity = 1.0F;
    std::string description;
    std::size_t phaseIndex = 0;
    double secondsRemaining = 0.0; ///< until the current phase ends
};

struct CosmicScenario
{
    int assetVersion = 1;
    std::string theme;
    InitialConfig initialConfig = InitialConfig::Triangle;
    std::array<SunConfig, 3> suns{};
    std::vector<CosmicPhase> phases;

    [[nodiscard]] double TotalDurationSec() const;
    /// Pure lookup; elapsed time wraps modulo the last phase end.
    [[nodiscard]] EraInfo EraAt(double elapsedSec) const;
    /// The next `count` phases after the one active at elapsedSec.
    [[nodiscard]] std::vector<CosmicPhase> UpcomingPhases(double elapsedSec, std::size_t count) const;
    [[nodiscard]] SunSimulation::Masses Masses() const;
};

[[nodiscard]] CosmicScenario DefaultCosmicScenario();

/// Contiguous phases starting at 0, 4-12 of them, gravity within [0.2, 3.0].
[[nodiscard]] bool ValidateScenario(const CosmicScenario& scenario, std::string& outError);

[[nodiscard]] nlohmann::json ScenarioToJson(const CosmicScenario& scenario);
[[nodiscard]] bool ScenarioFromJson(const nlohmann::json& root, CosmicScenario& outScenario, std::string& outError);

/// Missing or invalid files are rewritten with the default scenario.
bool LoadCosmicScenario(const std::filesystem::path& path, CosmicScenario& outScenario, std::string& outStatus);
bool SaveCosmicScenario(const std::filesystem::path& path, const CosmicScenario& scenario);
} // namespace trisolar::cosmos
