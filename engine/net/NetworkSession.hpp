#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

struct _ENetHost;
struct _ENetPeer;

namespace trisolar::net
{
using PeerId = std::uint32_t;

/// ENet host serving many peers. Each connection gets a PeerId that stays
/// valid until its disconnect event has been popped.
class NetworkSession
{
public:
    struct PollEvent
    {
        PeerId peer = 0;
        bool connected = false;
        bool disconnected = false;
        std::vector<std::uint8_t> payload;
    };

    NetworkSession() = default;
    ~NetworkSession();

    NetworkSession(const NetworkSession&) = delete;
    NetworkSession& operator=(const NetworkSession&) = delete;

    bool Initialize();
    void Shutdown();

    bool StartHost(std::uint16_t port, std::size_t maxPeers);
    /// Politely disconnects every peer and destroys the host.
    void Stop();

    void Poll(int timeoutMs = 0);
    [[nodiscard]] std::optional<PollEvent> PopEvent();

    /// Reliable on channel 0 for state changes, unreliable on channel 1 for snapshots.
    bool SendReliable(PeerId peer, const std::vector<std::uint8_t>& payload);
    bool SendUnreliable(PeerId peer, const std::vector<std::uint8_t>& payload);
    void Flush();

    [[nodiscard]] std::size_t ConnectedPeerCount() const { return m_peers.size(); }

private:
    bool Send(PeerId peer, const std::vector<std::uint8_t>& payload, std::uint8_t channel, bool reliable);
    void ResetTransport();

    bool m_initialized = false;
    _ENetHost* m_host = nullptr;
    std::unordered_map<PeerId, _ENetPeer*> m_peers;
    PeerId m_nextPeerId = 1;
    std::deque<PollEvent> m_events;
};
} // namespace trisolar::net
