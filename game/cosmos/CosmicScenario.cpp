#include "game/cosmos/CosmicScenario.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace trisolar::cosmos
{
namespace
{
using json = nlohmann::json;

constexpr std::size_t kMinPhases = 4;
constexpr std::size_t kMaxPhases = 12;
constexpr float kMinGravity = 0.2F;
constexpr float kMaxGravity = 3.0F;

bool IsHexColor(const std::string& text)
{
    if (text.size() != 7 || text[0] != '#')
    {
        return false;
    }
    for (std::size_t i = 1; i < text.size(); ++i)
    {
        const char c = text[i];
        const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex)
        {
            return false;
        }
    }
    return true;
}
} // namespace

const char* EraToText(Era era)
{
    switch (era)
    {
        case Era::Stable: return "stable";
        case Era::ChaosInferno: return "chaosInferno";
        case Era::ChaosIce: return "chaosIce";
        case Era::ChaosGravity: return "chaosGravity";
        default: return "stable";
    }
}

bool TryParseEra(const std::string& text, Era& outEra)
{
    if (text == "stable") { outEra = Era::Stable; return true; }
    if (text == "chaosInferno") { outEra = Era::ChaosInferno; return true; }
    if (text == "chaosIce") { outEra = Era::ChaosIce; return true; }
    if (text == "chaosGravity") { outEra = Era::ChaosGravity; return true; }
    return false;
}

double CosmicScenario::TotalDurationSec() const
{
    return phases.empty() ? 0.0 : phases.back().endSec;
}

EraInfo CosmicScenario::EraAt(double elapsedSec) const
{
    EraInfo info;
    if (phases.empty())
    {
        return info;
    }

    const double total = TotalDurationSec();
    double t = total > 0.0 ? std::fmod(std::max(0.0, elapsedSec), total) : 0.0;

    std::size_t index = phases.size() - 1;
    for (std::size_t i = 0; i < phases.size(); ++i)
    {
        if (t >= phases[i].startSec && t < phases[i].endSec)
        {
            index = i;
            break;
        }
    }

    const CosmicPhase& phase = phases[index];
    info.era = phase.era;
    info.gravity = phase.gravity;
    info.description = phase.description;
    info.phaseIndex = index;
    info.secondsRemaining = std::max(0.0, phase.endSec - t);
    return info;
}

std::vector<CosmicPhase> CosmicScenario::UpcomingPhases(double elapsedSec, std::size_t count) const
{
    std::vector<CosmicPhase> upcoming;
    if (phases.empty())
    {
        return upcoming;
    }

    const std::size_t current = EraAt(elapsedSec).phaseIndex;
    for (std::size_t i = 1; i <= count; ++i)
    {
        upcoming.push_back(phases[(current + i) % phases.size()]);
    }
    return upcoming;
}

SunSimulation::Masses CosmicScenario::Masses() const
{
    return SunSimulation::Masses{suns[0].mass, suns[1].mass, suns[2].mass};
}

CosmicScenario DefaultCosmicScenario()
{
    CosmicScenario scenario;
    scenario.theme = "Classic Orbit";
    scenario.initialConfig = InitialConfig::Triangle;
    scenario.suns = {{
        SunConfig{"Ignis", "#ff6600", 35.0F, 0.4F, 0.8F, 1.0},
        SunConfig{"Glacius", "#4488ff", 24.0F, 0.3F, 1.1F, 0.8},
        SunConfig{"Lumen", "#ffffee", 30.0F, 0.35F, 0.9F, 1.2},
    }};
    scenario.phases = {
        CosmicPhase{0.0, 80.0, Era::Stable, 1.0F, "The three suns orbit in harmony."},
        CosmicPhase{80.0, 120.0, Era::ChaosInferno, 2.0F, "The suns approach dangerously!"},
        CosmicPhase{120.0, 180.0, Era::Stable, 1.0F, "A temporary calm returns."},
        CosmicPhase{180.0, 220.0, Era::ChaosGravity, 2.8F, "Binary formation. Tidal forces rip through the station."},
        CosmicPhase{220.0, 290.0, Era::Stable, 1.0F, "Gravitational equilibrium restored."},
        CosmicPhase{290.0, 335.0, Era::ChaosIce, 0.3F, "All suns vanish beyond the horizon."},
        CosmicPhase{335.0, 390.0, Era::Stable, 1.0F, "The suns slowly return."},
        CosmicPhase{390.0, 430.0, Era::ChaosInferno, 1.8F, "Triple alignment imminent!"},
        CosmicPhase{430.0, 480.0, Era::ChaosIce, 0.3F, "Eternal night approaches."},
    };
    return scenario;
}

bool ValidateScenario(const CosmicScenario& scenario, std::string& outError)
{
    if (scenario.phases.size() < kMinPhases || scenario.phases.size() > kMaxPhases)
    {
        outError = "Scenario needs between 4 and 12 phases, got " + std::to_string(scenario.phases.size());
        return false;
    }
    if (scenario.phases.front().startSec != 0.0)
    {
        outError = "First phase must start at 0";
        return false;
    }

    for (std::size_t i = 0; i < scenario.phases.size(); ++i)
    {
        const CosmicPhase& phase = scenario.phases[i];
        if (phase.endSec <= phase.startSec)
        {
            outError = "Phase " + std::to_string(i) + " has no duration";
            return false;
        }
        if (i > 0 && phase.startSec != scenario.phases[i - 1].endSec)
        {
            outError = "Phase gap at index " + std::to_string(i);
            return false;
        }
        if (phase.gravity < kMinGravity || phase.gravity > kMaxGravity)
        {
            outError = "Phase " + std::to_string(i) + " gravity out of range";
            return false;
        }
    }

    for (const SunConfig& sun : scenario.suns)
    {
        if (sun.name.empty() || !IsHexColor(sun.color) || sun.mass <= 0.0)
        {
            outError = "Invalid sun '" + sun.name + "'";
            return false;
        }
    }
    return true;
}

json ScenarioToJson(const CosmicScenario& scenario)
{
    json root;
    root["asset_version"] = scenario.assetVersion;
    root["theme"] = scenario.theme;
    root["initial_config"] = InitialConfigToText(scenario.initialConfig);

    json suns = json::array();
    for (const SunConfig& sun : scenario.suns)
    {
        json sunJson;
        sunJson["name"] = sun.name;
        sunJson["color"] = sun.color;
        sunJson["radius"] = sun.radius;
        sunJson["intensity"] = sun.intensity;
        sunJson["pulse_speed"] = sun.pulseSpeed;
        sunJson["mass"] = sun.mass;
        suns.push_back(sunJson);
    }
    root["suns"] = suns;

    json phases = json::array();
    for (const CosmicPhase& phase : scenario.phases)
    {
        json phaseJson;
        phaseJson["start_sec"] = phase.startSec;
        phaseJson["end_sec"] = phase.endSec;
        phaseJson["era"] = EraToText(phase.era);
        phaseJson["gravity"] = phase.gravity;
        phaseJson["description"] = phase.description;
        phases.push_back(phaseJson);
    }
    root["phases"] = phases;
    return root;
}

bool ScenarioFromJson(const json& root, CosmicScenario& outScenario, std::string& outError)
{
    CosmicScenario scenario;
    scenario.assetVersion = root.value("asset_version", 1);
    scenario.theme = root.value("theme", std::string{"Untitled"});

    const std::string configText = root.value("initial_config", std::string{"triangle"});
    if (!TryParseInitialConfig(configText, scenario.initialConfig))
    {
        outError = "Unknown initial_config '" + configText + "'";
        return false;
    }

    if (!root.contains("suns") || !root["suns"].is_array() || root["suns"].size() != 3)
    {
        outError = "Scenario must define exactly 3 suns";
        return false;
    }
    for (std::size_t i = 0; i < 3; ++i)
    {
        const json& sunJson = root["suns"][i];
        SunConfig& sun = scenario.suns[i];
        sun.name = sunJson.value("name", std::string{});
        sun.color = sunJson.value("color", std::string{"#ffffff"});
        sun.radius = sunJson.value("radius", 30.0F);
        sun.intensity = sunJson.value("intensity", 0.35F);
        sun.pulseSpeed = sunJson.value("pulse_speed", 1.0F);
        sun.mass = sunJson.value("mass", 1.0);
    }

    if (!root.contains("phases") || !root["phases"].is_array())
    {
        outError = "Scenario has no phases array";
        return false;
    }
    for (const json& phaseJson : root["phases"])
    {
        CosmicPhase phase;
        phase.startSec = phaseJson.value("start_sec", 0.0);
        phase.endSec = phaseJson.value("end_sec", 0.0);
        phase.gravity = phaseJson.value("gravity", 1.0F);
        phase.description = phaseJson.value("description", std::string{});
        const std::string eraText = phaseJson.value("era", std::string{"stable"});
        if (!TryParseEra(eraText, phase.era))
        {
            outError = "Unknown era '" + eraText + "'";
            return false;
        }
        scenario.phases.push_back(std::move(phase));
    }

    if (!ValidateScenario(scenario, outError))
    {
        return false;
    }

    outScenario = std::move(scenario);
    return true;
}

bool LoadCosmicScenario(const std::filesystem::path& path, CosmicScenario& outScenario, std::string& outStatus)
{
    outScenario = DefaultCosmicScenario();

    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }
    if (!std::filesystem::exists(path))
    {
        outStatus = "Cosmic scenario missing. Wrote defaults.";
        return SaveCosmicScenario(path, outScenario);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        outStatus = "Failed to open cosmic scenario.";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception&)
    {
        outStatus = "Invalid cosmic scenario. Using defaults.";
        return SaveCosmicScenario(path, outScenario);
    }

    std::string error;
    CosmicScenario loaded;
    bool parsed = false;
    try
    {
        parsed = ScenarioFromJson(root, loaded, error);
    }
    catch (const std::exception& e)
    {
        error = e.what();
    }
    if (!parsed)
    {
        outStatus = "Rejected cosmic scenario (" + error + "). Using defaults.";
        std::cerr << "[Config] " << outStatus << "\n";
        return false;
    }

    outScenario = std::move(loaded);
    outStatus = "Loaded cosmic scenario '" + outScenario.theme + "'.";
    std::cout << "[Config] " << outStatus << " phases=" << outScenario.phases.size() << "\n";
    return true;
}

bool SaveCosmicScenario(const std::filesystem::path& path, const CosmicScenario& scenario)
{
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "[Config] Could not write " << path.string() << "\n";
        return false;
    }

    stream << ScenarioToJson(scenario).dump(2) << "\n";
    return true;
}
} // namespace trisolar::cosmos
