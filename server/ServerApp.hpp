#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "engine/core/Time.hpp"
#include "engine/net/NetworkSession.hpp"
#include "server/RoomManager.hpp"
#include "server/ServerConfig.hpp"

namespace trisolar::server
{
/// Process shell: loads config, hosts ENet and drives every room at the fixed tick.
class ServerApp final : public PacketSink
{
public:
    ServerApp() = default;
    ~ServerApp() override;

    ServerApp(const ServerApp&) = delete;
    ServerApp& operator=(const ServerApp&) = delete;

    bool Initialize(const std::filesystem::path& configDirectory);
    /// Blocks until RequestStop().
    void Run();
    void RequestStop() { m_running = false; }

    void Send(net::PeerId peer, const std::vector<std::uint8_t>& payload, bool reliable) override;

private:
    void PumpNetwork(std::int64_t nowMs);
    [[nodiscard]] std::int64_t NowMs() const;

    ServerConfig m_config;
    net::NetworkSession m_network;
    core::Time m_time;
    std::unique_ptr<RoomManager> m_rooms;
    std::atomic<bool> m_running{false};
    double m_startSeconds = 0.0;
};
} // namespace trisolar::server
