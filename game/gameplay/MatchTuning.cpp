#include "game/gameplay/MatchTuning.hpp"

#include <fstream>
#include <iostream>

#include <glm/common.hpp>
#include <nlohmann/json.hpp>

namespace trisolar::gameplay
{
namespace
{
using json = nlohmann::json;

void ClampTuning(MatchTuning& t)
{
    t.playerSpeed = glm::clamp(t.playerSpeed, 0.5F, 20.0F);
    t.playerRadius = glm::clamp(t.playerRadius, 0.1F, 2.0F);
    t.tickRate = glm::clamp(t.tickRate, 10, 60);
    t.tasksPerPlayer = glm::clamp(t.tasksPerPlayer, 1, 20);
    t.emergencyUses = glm::clamp(t.emergencyUses, 0, 10);
    t.maxHealth = glm::clamp(t.maxHealth, 1.0F, 1000.0F);
    t.reviveHealth = glm::clamp(t.reviveHealth, 1.0F, t.maxHealth);
    t.wallClosedFraction = glm::clamp(t.wallClosedFraction, 0.0F, 1.0F);
    t.oracleHistorySize = glm::clamp(t.oracleHistorySize, 2, 120);
    t.oracleSampleIntervalMs = glm::clamp(t.oracleSampleIntervalMs, 50, 10000);
    t.wallPeriodStableMs = glm::max(t.wallPeriodStableMs, 1000);
    t.wallPeriodInfernoMs = glm::max(t.wallPeriodInfernoMs, 1000);
    t.wallPeriodIceMs = glm::max(t.wallPeriodIceMs, 1000);
    t.wallPeriodGravityMs = glm::max(t.wallPeriodGravityMs, 1000);
}
} // namespace

int MatchTuning::WallPeriodMs(cosmos::Era era) const
{
    switch (era)
    {
        case cosmos::Era::ChaosInferno: return wallPeriodInfernoMs;
        case cosmos::Era::ChaosIce: return wallPeriodIceMs;
        case cosmos::Era::ChaosGravity: return wallPeriodGravityMs;
        case cosmos::Era::Stable:
        default: return wallPeriodStableMs;
    }
}

bool LoadMatchTuning(const std::filesystem::path& path, MatchTuning& outTuning, std::string& outStatus)
{
    outTuning = MatchTuning{};

    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }
    if (!std::filesystem::exists(path))
    {
        outStatus = "Gameplay tuning missing. Wrote defaults.";
        return SaveMatchTuning(path, outTuning);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        outStatus = "Failed to open gameplay tuning config.";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception&)
    {
        outStatus = "Invalid gameplay tuning JSON. Using defaults.";
        return SaveMatchTuning(path, outTuning);
    }

    MatchTuning& t = outTuning;
    auto readFloat = [&](const char* key, float& target) {
        if (root.contains(key) && root[key].is_number())
        {
            target = root[key].get<float>();
        }
    };
    auto readInt = [&](const char* key, int& target) {
        if (root.contains(key) && root[key].is_number_integer())
        {
            target = root[key].get<int>();
        }
    };

    readInt("asset_version", t.assetVersion);
    readFloat("player_speed", t.playerSpeed);
    readFloat("player_radius", t.playerRadius);
    readInt("tick_rate", t.tickRate);
    readFloat("door_interact_range", t.doorInteractRange);
    readFloat("task_interact_range", t.taskInteractRange);
    readFloat("kill_range", t.killRange);
    readFloat("report_range", t.reportRange);
    readFloat("emergency_button_range", t.emergencyButtonRange);
    readFloat("generator_range", t.generatorRange);
    readFloat("pipe_range", t.pipeRange);
    readInt("tasks_per_player", t.tasksPerPlayer);
    readFloat("spawn_radius", t.spawnRadius);
    readFloat("meeting_radius", t.meetingRadius);
    readInt("kill_cooldown_ms", t.killCooldownMs);
    readInt("discussion_ms", t.discussionMs);
    readInt("voting_ms", t.votingMs);
    readInt("result_display_ms", t.resultDisplayMs);
    readInt("emergency_cooldown_ms", t.emergencyCooldownMs);
    readInt("emergency_uses", t.emergencyUses);
    readInt("possession_duration_ms", t.possessionDurationMs);
    readInt("possession_cooldown_ms", t.possessionCooldownMs);
    readInt("door_lock_ms", t.doorLockMs);
    readInt("sabotage_door_ms", t.sabotageDoorMs);
    readInt("sabotage_pipe_ms", t.sabotagePipeMs);
    readInt("sabotage_generator_ms", t.sabotageGeneratorMs);
    readInt("reconnect_grace_ms", t.reconnectGraceMs);
    readFloat("max_health", t.maxHealth);
    readFloat("inferno_ambient_dps", t.infernoAmbientDps);
    readFloat("inferno_exposure_dps", t.infernoExposureDps);
    readFloat("fire_dps", t.fireDps);
    readFloat("ice_dps", t.iceDps);
    readFloat("tidal_dps", t.tidalDps);
    readFloat("tidal_binary_multiplier", t.tidalBinaryMultiplier);
    readFloat("suffocation_dps", t.suffocationDps);
    readFloat("heal_per_second", t.healPerSecond);
    readFloat("revive_health", t.reviveHealth);
    readFloat("oxygen_drain_per_second", t.oxygenDrainPerSecond);
    readInt("oxygen_refill_ms", t.oxygenRefillMs);
    readInt("wall_period_stable_ms", t.wallPeriodStableMs);
    readInt("wall_period_inferno_ms", t.wallPeriodInfernoMs);
    readInt("wall_period_ice_ms", t.wallPeriodIceMs);
    readInt("wall_period_gravity_ms", t.wallPeriodGravityMs);
    readFloat("wall_closed_fraction", t.wallClosedFraction);
    readInt("oracle_sample_interval_ms", t.oracleSampleIntervalMs);
    readInt("oracle_history_size", t.oracleHistorySize);
    readFloat("oracle_predict_seconds", t.oraclePredictSeconds);

    ClampTuning(t);
    outStatus = "Loaded gameplay tuning.";
    std::cout << "[Config] " << outStatus << " tick_rate=" << t.tickRate << "\n";
    return true;
}

bool SaveMatchTuning(const std::filesystem::path& path, const MatchTuning& t)
{
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    json root;
    root["asset_version"] = t.assetVersion;
    root["player_speed"] = t.playerSpeed;
    root["player_radius"] = t.playerRadius;
    root["tick_rate"] = t.tickRate;
    root["door_interact_range"] = t.doorInteractRange;
    root["task_interact_range"] = t.taskInteractRange;
    root["kill_range"] = t.killRange;
    root["report_range"] = t.reportRange;
    root["emergency_button_range"] = t.emergencyButtonRange;
    root["generator_range"] = t.generatorRange;
    root["pipe_range"] = t.pipeRange;
    root["tasks_per_player"] = t.tasksPerPlayer;
    root["spawn_radius"] = t.spawnRadius;
    root["meeting_radius"] = t.meetingRadius;
    root["kill_cooldown_ms"] = t.killCooldownMs;
    root["discussion_ms"] = t.discussionMs;
    root["voting_ms"] = t.votingMs;
    root["result_display_ms"] = t.resultDisplayMs;
    root["emergency_cooldown_ms"] = t.emergencyCooldownMs;
    root["emergency_uses"] = t.emergencyUses;
    root["possession_duration_ms"] = t.possessionDurationMs;
    root["possession_cooldown_ms"] = t.possessionCooldownMs;
    root["door_lock_ms"] = t.doorLockMs;
    root["sabotage_door_ms"] = t.sabotageDoorMs;
    root["sabotage_pipe_ms"] = t.sabotagePipeMs;
    root["sabotage_generator_ms"] = t.sabotageGeneratorMs;
    root["reconnect_grace_ms"] = t.reconnectGraceMs;
    root["max_health"] = t.maxHealth;
    root["inferno_ambient_dps"] = t.infernoAmbientDps;
    root["inferno_exposure_dps"] = t.infernoExposureDps;
    root["fire_dps"] = t.fireDps;
    root["ice_dps"] = t.iceDps;
    root["tidal_dps"] = t.tidalDps;
    root["tidal_binary_multiplier"] = t.tidalBinaryMultiplier;
    root["suffocation_dps"] = t.suffocationDps;
    root["heal_per_second"] = t.healPerSecond;
    root["revive_health"] = t.reviveHealth;
    root["oxygen_drain_per_second"] = t.oxygenDrainPerSecond;
    root["oxygen_refill_ms"] = t.oxygenRefillMs;
    root["wall_period_stable_ms"] = t.wallPeriodStableMs;
    root["wall_period_inferno_ms"] = t.wallPeriodInfernoMs;
    root["wall_period_ice_ms"] = t.wallPeriodIceMs;
    root["wall_period_gravity_ms"] = t.wallPeriodGravityMs;
    root["wall_closed_fraction"] = t.wallClosedFraction;
    root["oracle_sample_interval_ms"] = t.oracleSampleIntervalMs;
    root["oracle_history_size"] = t.oracleHistorySize;
    root["oracle_predict_seconds"] = t.oraclePredictSeconds;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "[Config] Could not write " << path.string() << "\n";
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}
} // namespace trisolar::gameplay
