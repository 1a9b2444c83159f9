#include "server/ServerConfig.hpp"

#include <fstream>
#include <iostream>

#include <glm/common.hpp>
#include <nlohmann/json.hpp>

namespace trisolar::server
{
namespace
{
using json = nlohmann::json;

constexpr int kMaxPlayersCap = 15;
} // namespace

bool LoadServerConfig(const std::filesystem::path& path, ServerConfig& outConfig, std::string& outStatus)
{
    outConfig = ServerConfig{};

    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }
    if (!std::filesystem::exists(path))
    {
        outStatus = "Server config missing. Wrote defaults.";
        return SaveServerConfig(path, outConfig);
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        outStatus = "Failed to open server config.";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception&)
    {
        outStatus = "Invalid server config JSON. Using defaults.";
        return SaveServerConfig(path, outConfig);
    }

    ServerConfig& c = outConfig;
    auto readInt = [&](const char* key, int& target) {
        if (root.contains(key) && root[key].is_number_integer())
        {
            target = root[key].get<int>();
        }
    };

    int port = c.port;
    readInt("asset_version", c.assetVersion);
    readInt("port", port);
    readInt("max_peers", c.maxPeers);
    readInt("tick_rate", c.tickRate);
    readInt("disconnect_grace_ms", c.disconnectGraceMs);
    readInt("min_players", c.minPlayers);
    readInt("max_players_per_room", c.maxPlayersPerRoom);

    c.port = static_cast<std::uint16_t>(glm::clamp(port, 1, 65535));
    c.maxPeers = glm::clamp(c.maxPeers, 1, 4095);
    c.tickRate = glm::clamp(c.tickRate, 10, 60);
    c.disconnectGraceMs = glm::max(c.disconnectGraceMs, 0);
    c.maxPlayersPerRoom = glm::clamp(c.maxPlayersPerRoom, 1, kMaxPlayersCap);
    c.minPlayers = glm::clamp(c.minPlayers, 1, c.maxPlayersPerRoom);

    outStatus = "Loaded server config.";
    std::cout << "[Config] " << outStatus << " port=" << c.port << " tick_rate=" << c.tickRate << "\n";
    return true;
}

bool SaveServerConfig(const std::filesystem::path& path, const ServerConfig& c)
{
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    json root;
    root["asset_version"] = c.assetVersion;
    root["port"] = c.port;
    root["max_peers"] = c.maxPeers;
    root["tick_rate"] = c.tickRate;
    root["disconnect_grace_ms"] = c.disconnectGraceMs;
    root["min_players"] = c.minPlayers;
    root["max_players_per_room"] = c.maxPlayersPerRoom;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "[Config] Failed to write " << path.string() << "\n";
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}
} // namespace trisolar::server
