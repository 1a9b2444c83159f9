#include "game/gameplay/PowerRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace trisolar::gameplay
{
namespace
{
PowerDefinition MakeDefinition(
    PowerType type,
    const char* name,
    const char* description,
    int durationMs,
    int cooldownMs,
    int maxCharges,
    bool requiresTarget,
    bool requiresLocation
)
{
    PowerDefinition definition;
    definition.type = type;
    definition.displayName = name;
    definition.description = description;
    definition.durationMs = durationMs;
    definition.cooldownMs = cooldownMs;
    definition.usesPerMatch = 1;
    definition.maxCharges = maxCharges;
    definition.requiresTarget = requiresTarget;
    definition.requiresLocation = requiresLocation;
    return definition;
}
} // namespace

PowerRegistry::PowerRegistry()
{
    InitializeDefaultPowers();
}

void PowerRegistry::InitializeDefaultPowers()
{
    m_definitions.clear();

    RegisterPower(MakeDefinition(PowerType::Metamorph, "Metamorph", "Copy another player's appearance and power for 30 seconds.", 30000, 60000, 0, true, false));
    RegisterPower(MakeDefinition(PowerType::Invisible, "Invisible", "Become invisible for 15 seconds.", 15000, 45000, 0, false, false));
    RegisterPower(MakeDefinition(PowerType::Teleport, "Teleport", "Instantly teleport to a chosen point.", 0, 40000, 2, false, true));
    RegisterPower(MakeDefinition(PowerType::Medic, "Medic", "Revive a ghost or grant a protective shield.", 0, 60000, 0, true, false));
    RegisterPower(MakeDefinition(PowerType::TimeController, "Time Controller", "Freeze all other players for 5 seconds.", 5000, 60000, 0, false, false));
    RegisterPower(MakeDefinition(PowerType::Hacker, "Hacker", "Lock doors, cut lights and sabotage the station remotely.", 20000, 45000, 0, false, false));
    RegisterPower(MakeDefinition(PowerType::Flash, "Flash", "Triple your speed for 10 seconds.", 10000, 40000, 0, false, false));
    RegisterPower(MakeDefinition(PowerType::Necromancer, "Necromancer", "Consume a dead body to restore health.", 0, 60000, 0, true, false));
    RegisterPower(MakeDefinition(PowerType::MindController, "Mind Controller", "Take over another player's movement for 8 seconds.", 8000, 60000, 0, true, false));
    RegisterPower(MakeDefinition(PowerType::Barrier, "Barrier", "Raise a temporary wall in front of you.", 0, 15000, 3, false, false));
    RegisterPower(MakeDefinition(PowerType::Impermeable, "Impermeable", "Walk through walls for 6 seconds.", 6000, 45000, 0, false, false));
    RegisterPower(MakeDefinition(PowerType::Oracle, "Oracle", "Foresee where everyone will be and what the suns will do.", 0, 30000, 3, false, false));

    m_definitions[PowerType::Necromancer].targetRange = 3.0F;

    std::cout << "[Power] Registered " << m_definitions.size() << " default powers\n";
}

void PowerRegistry::RegisterPower(const PowerDefinition& definition)
{
    if (m_definitions.contains(definition.type))
    {
        std::cout << "[Power] WARNING - power '" << PowerToId(definition.type) << "' already registered, overwriting\n";
    }
    m_definitions[definition.type] = definition;
}

void PowerRegistry::Override(const PowerDefinition& definition)
{
    m_definitions[definition.type] = definition;
}

const PowerDefinition* PowerRegistry::Find(PowerType type) const
{
    const auto it = m_definitions.find(type);
    if (it == m_definitions.end())
    {
        return nullptr;
    }
    return &it->second;
}

const PowerDefinition& PowerRegistry::Get(PowerType type) const
{
    const PowerDefinition* definition = Find(type);
    return definition != nullptr ? *definition : m_none;
}

std::vector<PowerType> PowerRegistry::ListPowers() const
{
    std::vector<PowerType> powers;
    for (const PowerType type : kAllPowers)
    {
        if (m_definitions.contains(type))
        {
            powers.push_back(type);
        }
    }
    return powers;
}

bool PowerRegistry::LoadFromJson(const std::string& jsonPath)
{
    if (!std::filesystem::exists(jsonPath))
    {
        std::cout << "[Power] No overrides at '" << jsonPath << "', writing defaults\n";
        return SaveToJson(jsonPath);
    }

    std::ifstream file(jsonPath);
    if (!file.is_open())
    {
        std::cerr << "[Power] WARNING - Could not open '" << jsonPath << "'\n";
        return false;
    }

    try
    {
        nlohmann::json root;
        file >> root;

        const int assetVersion = root.value("asset_version", 0);
        if (assetVersion != 1)
        {
            std::cout << "[Power] WARNING - Unexpected asset version " << assetVersion << ", expected 1\n";
        }

        if (!root.contains("powers") || !root["powers"].is_array())
        {
            std::cerr << "[Power] WARNING - No 'powers' array found in " << jsonPath << "\n";
            return false;
        }

        int loaded = 0;
        for (const auto& powerJson : root["powers"])
        {
            PowerType type = PowerType::None;
            const std::string id = powerJson.value("id", std::string{});
            if (!TryParsePower(id, type) || type == PowerType::None)
            {
                std::cout << "[Power] WARNING - Unknown power id '" << id << "' skipped\n";
                continue;
            }

            PowerDefinition definition = Get(type);
            definition.type = type;
            definition.durationMs = std::max(0, powerJson.value("duration_ms", definition.durationMs));
            definition.cooldownMs = std::max(0, powerJson.value("cooldown_ms", definition.cooldownMs));
            definition.usesPerMatch = std::max(0, powerJson.value("uses_per_match", definition.usesPerMatch));
            definition.maxCharges = std::max(0, powerJson.value("max_charges", definition.maxCharges));
            definition.targetRange = std::max(0.0F, powerJson.value("target_range", definition.targetRange));
            Override(definition);
            ++loaded;
        }

        std::cout << "[Power] Loaded " << loaded << " power overrides from " << jsonPath << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[Power] ERROR - Failed to load " << jsonPath << ": " << e.what() << "\n";
        return false;
    }
}

bool PowerRegistry::SaveToJson(const std::string& jsonPath) const
{
    try
    {
        nlohmann::json root;
        root["asset_version"] = 1;

        nlohmann::json powersArray = nlohmann::json::array();
        for (const PowerType type : ListPowers())
        {
            const PowerDefinition& definition = Get(type);
            nlohmann::json powerJson;
            powerJson["id"] = PowerToId(type);
            powerJson["duration_ms"] = definition.durationMs;
            powerJson["cooldown_ms"] = definition.cooldownMs;
            powerJson["uses_per_match"] = definition.usesPerMatch;
            powerJson["max_charges"] = definition.maxCharges;
            powerJson["target_range"] = definition.targetRange;
            powersArray.push_back(powerJson);
        }
        root["powers"] = powersArray;

        const std::filesystem::path path(jsonPath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(jsonPath);
        if (!file.is_open())
        {
            std::cerr << "[Power] ERROR - Could not open '" << jsonPath << "' for writing\n";
            return false;
        }

        file << root.dump(2) << "\n";
        return true;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[Power] ERROR - Failed to save " << jsonPath << ": " << e.what() << "\n";
        return false;
    }
}
} // namespace trisolar::gameplay
