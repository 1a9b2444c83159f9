#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace trisolar::server
{
/// Process-level settings from config/server.json.
struct ServerConfig
{
    int assetVersion = 1;
    std::uint16_t port = 7777;
    int maxPeers = 64;
    int tickRate = 20;
    int disconnectGraceMs = 30000;
    int minPlayers = 2;
    int maxPlayersPerRoom = 10;
};

bool LoadServerConfig(const std::filesystem::path& path, ServerConfig& outConfig, std::string& outStatus);
bool SaveServerConfig(const std::filesystem::path& path, const ServerConfig& config);
} // namespace trisolar::server
