#include "engine/net/NetworkSession.hpp"

#include <cstring>
#include <iostream>

#include <enet/enet.h>

namespace trisolar::net
{
namespace
{
constexpr std::size_t kChannelCount = 2;
constexpr std::uint8_t kReliableChannel = 0;
constexpr std::uint8_t kUnreliableChannel = 1;

PeerId PeerIdOf(const ENetPeer* peer)
{
    return static_cast<PeerId>(reinterpret_cast<std::uintptr_t>(peer->data));
}
} // namespace

NetworkSession::~NetworkSession()
{
    Shutdown();
}

bool NetworkSession::Initialize()
{
    if (m_initialized)
    {
        return true;
    }

    if (enet_initialize() != 0)
    {
        std::cerr << "[Net] ENet initialization failed.\n";
        return false;
    }

    m_initialized = true;
    return true;
}

void NetworkSession::Shutdown()
{
    Stop();

    if (m_initialized)
    {
        enet_deinitialize();
        m_initialized = false;
    }
}

bool NetworkSession::StartHost(std::uint16_t port, std::size_t maxPeers)
{
    if (!Initialize())
    {
        return false;
    }

    ResetTransport();

    ENetAddress address{};
    address.host = ENET_HOST_ANY;
    address.port = port;

    m_host = enet_host_create(&address, maxPeers, kChannelCount, 0, 0);
    if (m_host == nullptr)
    {
        std::cerr << "[Net] Failed to create ENet host on port " << port << ".\n";
        return false;
    }

    std::cout << "[Net] Listening on port " << port << " (max " << maxPeers << " peers)\n";
    return true;
}

void NetworkSession::Stop()
{
    if (m_host == nullptr)
    {
        return;
    }

    for (const auto& [peerId, peer] : m_peers)
    {
        enet_peer_disconnect(peer, 0);
    }

    ENetEvent event{};
    while (!m_peers.empty() && enet_host_service(m_host, &event, 50) > 0)
    {
        if (event.type == ENET_EVENT_TYPE_RECEIVE)
        {
            enet_packet_destroy(event.packet);
        }
        else if (event.type == ENET_EVENT_TYPE_DISCONNECT)
        {
            m_peers.erase(PeerIdOf(event.peer));
        }
    }

    ResetTransport();
    m_events.clear();
}

void NetworkSession::Poll(int timeoutMs)
{
    if (m_host == nullptr)
    {
        return;
    }

    ENetEvent event{};
    while (enet_host_service(m_host, &event, timeoutMs) > 0)
    {
        timeoutMs = 0;

        switch (event.type)
        {
            case ENET_EVENT_TYPE_CONNECT:
            {
                const PeerId peerId = m_nextPeerId++;
                event.peer->data = reinterpret_cast<void*>(static_cast<std::uintptr_t>(peerId));
                m_peers[peerId] = event.peer;
                PollEvent pollEvent;
                pollEvent.peer = peerId;
                pollEvent.connected = true;
                m_events.push_back(std::move(pollEvent));
                break;
            }
            case ENET_EVENT_TYPE_RECEIVE:
            {
                PollEvent pollEvent;
                pollEvent.peer = PeerIdOf(event.peer);
                pollEvent.payload.resize(event.packet->dataLength);
                if (event.packet->dataLength > 0)
                {
                    std::memcpy(pollEvent.payload.data(), event.packet->data, event.packet->dataLength);
                }
                m_events.push_back(std::move(pollEvent));
                enet_packet_destroy(event.packet);
                break;
            }
            case ENET_EVENT_TYPE_DISCONNECT:
            {
                const PeerId peerId = PeerIdOf(event.peer);
                m_peers.erase(peerId);
                event.peer->data = nullptr;
                PollEvent pollEvent;
                pollEvent.peer = peerId;
                pollEvent.disconnected = true;
                m_events.push_back(std::move(pollEvent));
                break;
            }
            case ENET_EVENT_TYPE_NONE:
            default:
                break;
        }
    }
}

std::optional<NetworkSession::PollEvent> NetworkSession::PopEvent()
{
    if (m_events.empty())
    {
        return std::nullopt;
    }

    PollEvent event = std::move(m_events.front());
    m_events.pop_front();
    return event;
}

bool NetworkSession::SendReliable(PeerId peer, const std::vector<std::uint8_t>& payload)
{
    return Send(peer, payload, kReliableChannel, true);
}

bool NetworkSession::SendUnreliable(PeerId peer, const std::vector<std::uint8_t>& payload)
{
    return Send(peer, payload, kUnreliableChannel, false);
}

void NetworkSession::Flush()
{
    if (m_host != nullptr)
    {
        enet_host_flush(m_host);
    }
}

bool NetworkSession::Send(PeerId peer, const std::vector<std::uint8_t>& payload, std::uint8_t channel, bool reliable)
{
    const auto it = m_peers.find(peer);
    if (it == m_peers.end() || payload.empty())
    {
        return false;
    }

    const enet_uint32 flags = reliable ? ENET_PACKET_FLAG_RELIABLE : 0;
    ENetPacket* packet = enet_packet_create(payload.data(), payload.size(), flags);
    if (packet == nullptr)
    {
        return false;
    }

    if (enet_peer_send(it->second, channel, packet) != 0)
    {
        enet_packet_destroy(packet);
        return false;
    }
    return true;
}

void NetworkSession::ResetTransport()
{
    if (m_host != nullptr)
    {
        enet_host_destroy(m_host);
        m_host = nullptr;
    }
    m_peers.clear();
}
} // namespace trisolar::net
