#pragma once

#include <cstdint>

#include "game/maze/MazeTypes.hpp"

namespace trisolar::maze
{
class MazeGenerator
{
public:
    struct GenerationSettings
    {
        // --- Carving ---
        float wallKeepRatio = 0.55F;  // share of internal edges that stay walls
        float dynamicRatio = 0.25F;   // chance a corridor-only wall is dynamic
        float doorWidth = 2.5F;

        // --- Tasks ---
        int tasksPerPlayer = 5;
        int minTasks = 10;

        // --- Pipes ---
        float pipeMaxEdgeDistance = 35.0F;
        float pipeCornerInset = 3.5F;
        float pipeTunnelRadius = 3.0F;
        float pipeExtraEdgeRatio = 0.1F;

        // --- Zones ---
        float shelterRadius = 4.5F;
        float taskOffset = 2.5F;
        float generatorOffset = 2.0F;
        float lightHeight = 3.8F;
    };

    /// Same seed and player count always give the same layout.
    [[nodiscard]] MazeLayout Generate(std::uint32_t seed, int playerCount) const;
    [[nodiscard]] MazeLayout Generate(std::uint32_t seed, int playerCount, const GenerationSettings& settings) const;
};

[[nodiscard]] MazeLayout GenerateMaze(std::uint32_t seed, int playerCount = 4);

/// Tunnel side walls and junction closures for an underground pipe network.
[[nodiscard]] std::vector<PipeWall> GeneratePipeWalls(
    const std::vector<PipeNode>& nodes,
    const std::vector<PipeConnection>& connections,
    float tunnelRadius);
} // namespace trisolar::maze
