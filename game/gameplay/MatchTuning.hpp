#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "game/cosmos/CosmicScenario.hpp"

namespace trisolar::gameplay
{
/// Gameplay constants loaded from config/gameplay.json. Times are in
/// milliseconds, damage and healing in health points per second.
struct MatchTuning
{
    int assetVersion = 1;

    // --- Movement ---
    float playerSpeed = 5.0F;
    float playerRadius = 0.4F;
    int tickRate = 20;

    // --- Interaction ranges ---
    float doorInteractRange = 3.0F;
    float taskInteractRange = 3.0F;
    float killRange = 2.5F;
    float reportRange = 3.0F;
    float emergencyButtonRange = 3.5F;
    float generatorRange = 3.5F;
    float pipeRange = 4.0F;

    // --- Match setup ---
    int tasksPerPlayer = 5;
    float spawnRadius = 3.0F;
    float meetingRadius = 4.0F;

    // --- Timers ---
    int killCooldownMs = 25000;
    int discussionMs = 30000;
    int votingMs = 30000;
    int resultDisplayMs = 5000;
    int emergencyCooldownMs = 30000;
    int emergencyUses = 1;
    int possessionDurationMs = 20000;
    int possessionCooldownMs = 30000;
    int doorLockMs = 15000;
    int sabotageDoorMs = 15000;
    int sabotagePipeMs = 15000;
    int sabotageGeneratorMs = 30000;
    int reconnectGraceMs = 30000;

    // --- Hazards ---
    float maxHealth = 100.0F;
    float infernoAmbientDps = 2.0F;
    float infernoExposureDps = 6.0F;
    float fireDps = 10.0F;
    float iceDps = 3.0F;
    float tidalDps = 4.0F;
    float tidalBinaryMultiplier = 1.5F;
    float suffocationDps = 5.0F;
    float healPerSecond = 1.0F;
    float reviveHealth = 50.0F;

    // --- Oxygen ---
    float oxygenDrainPerSecond = 0.4F;
    int oxygenRefillMs = 5000;

    // --- Dynamic walls ---
    int wallPeriodStableMs = 20000;
    int wallPeriodInfernoMs = 12000;
    int wallPeriodIceMs = 30000;
    int wallPeriodGravityMs = 8000;
    float wallClosedFraction = 0.6F;

    // --- Oracle ---
    int oracleSampleIntervalMs = 1000;
    int oracleHistorySize = 10;
    float oraclePredictSeconds = 5.0F;

    [[nodiscard]] int WallPeriodMs(cosmos::Era era) const;
};

/// Missing or unreadable files are rewritten with defaults. Out-of-range
/// values are clamped rather than rejected.
bool LoadMatchTuning(const std::filesystem::path& path, MatchTuning& outTuning, std::string& outStatus);
bool SaveMatchTuning(const std::filesystem::path& path, const MatchTuning& tuning);
} // namespace trisolar::gameplay
