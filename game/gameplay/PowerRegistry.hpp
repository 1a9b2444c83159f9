#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "game/gameplay/PowerTypes.hpp"

namespace trisolar::gameplay
{
/// Definitions of all powers. Built-in values can be overridden per power
/// from config/powers.json.
class PowerRegistry
{
public:
    PowerRegistry();

    void InitializeDefaultPowers();

    [[nodiscard]] const PowerDefinition* Find(PowerType type) const;
    [[nodiscard]] const PowerDefinition& Get(PowerType type) const;
    [[nodiscard]] std::vector<PowerType> ListPowers() const;
    [[nodiscard]] std::size_t Size() const { return m_definitions.size(); }

    void Override(const PowerDefinition& definition);

    bool LoadFromJson(const std::string& jsonPath);
    bool SaveToJson(const std::string& jsonPath) const;

private:
    void RegisterPower(const PowerDefinition& definition);

    std::unordered_map<PowerType, PowerDefinition> m_definitions;
    PowerDefinition m_none;
};
} // namespace trisolar::gameplay
