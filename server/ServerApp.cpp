#include "server/ServerApp.hpp"

#include <chrono>
#include <iostream>
#include <random>
#include <string>

#include "game/cosmos/CosmicScenario.hpp"
#include "game/gameplay/MatchTuning.hpp"
#include "game/gameplay/PowerRegistry.hpp"

namespace trisolar::server
{
namespace
{
constexpr int kPollTimeoutMs = 1;
constexpr unsigned long long kStatusIntervalTicks = 20ULL * 60ULL;

double MonotonicSeconds()
{
    using Clock = std::chrono::steady_clock;
    return std::chrono::duration<double>(Clock::now().time_since_epoch()).count();
}
} // namespace

ServerApp::~ServerApp()
{
    m_network.Shutdown();
}

bool ServerApp::Initialize(const std::filesystem::path& configDirectory)
{
    std::string status;
    if (!LoadServerConfig(configDirectory / "server.json", m_config, status))
    {
        std::cerr << "[Config] " << status << "\n";
        return false;
    }

    gameplay::MatchTuning tuning;
    if (!gameplay::LoadMatchTuning(configDirectory / "gameplay.json", tuning, status))
    {
        std::cerr << "[Config] " << status << "\n";
        return false;
    }

    gameplay::PowerRegistry registry;
    if (!registry.LoadFromJson((configDirectory / "powers.json").string()))
    {
        std::cerr << "[Config] Power overrides unavailable, using built-in values\n";
    }

    cosmos::CosmicScenario scenario;
    if (!cosmos::LoadCosmicScenario(configDirectory / "cosmic_scenario.json", scenario, status))
    {
        std::cerr << "[Config] " << status << " Using built-in scenario.\n";
        scenario = cosmos::DefaultCosmicScenario();
    }

    if (!m_network.StartHost(m_config.port, static_cast<std::size_t>(m_config.maxPeers)))
    {
        return false;
    }

    m_time.SetTickRate(m_config.tickRate);
    m_startSeconds = MonotonicSeconds();
    m_rooms = std::make_unique<RoomManager>(m_config, tuning, registry, scenario, *this, std::random_device{}());
    std::cout << "[Server] Ready at " << m_config.tickRate << " Hz\n";
    return true;
}

void ServerApp::Run()
{
    if (m_rooms == nullptr)
    {
        return;
    }

    m_running = true;
    while (m_running)
    {
        const std::int64_t nowMs = NowMs();
        PumpNetwork(nowMs);

        const double droppedBefore = m_time.DroppedSeconds();
        m_time.BeginFrame(MonotonicSeconds() - m_startSeconds);
        if (m_time.DroppedSeconds() > droppedBefore)
        {
            std::cerr << "[Server] Tick loop fell behind, skipped "
                      << static_cast<int>((m_time.DroppedSeconds() - droppedBefore) * 1000.0) << " ms\n";
        }
        while (m_time.ShouldRunFixedStep())
        {
            m_rooms->Tick(NowMs());
            m_time.ConsumeFixedStep();
            if (m_time.TickIndex() % kStatusIntervalTicks == 0)
            {
                std::cout << "[Server] " << m_network.ConnectedPeerCount() << " peers, " << m_rooms->RoomCount()
                          << " rooms\n";
            }
        }
        m_network.Flush();
    }

    std::cout << "[Server] Stopping\n";
    m_network.Stop();
}

void ServerApp::Send(net::PeerId peer, const std::vector<std::uint8_t>& payload, bool reliable)
{
    const bool sent = reliable ? m_network.SendReliable(peer, payload) : m_network.SendUnreliable(peer, payload);
    if (!sent && reliable)
    {
        std::cerr << "[Net] Failed to send " << payload.size() << " bytes to peer " << peer << "\n";
    }
}

void ServerApp::PumpNetwork(std::int64_t nowMs)
{
    m_network.Poll(kPollTimeoutMs);
    while (std::optional<net::NetworkSession::PollEvent> event = m_network.PopEvent())
    {
        if (event->connected)
        {
            m_rooms->OnConnect(event->peer);
        }
        else if (event->disconnected)
        {
            m_rooms->OnDisconnect(event->peer, nowMs);
        }
        else if (!event->payload.empty())
        {
            m_rooms->OnPacket(event->peer, event->payload, nowMs);
        }
    }
}

std::int64_t ServerApp::NowMs() const
{
    return static_cast<std::int64_t>((MonotonicSeconds() - m_startSeconds) * 1000.0);
}
} // namespace trisolar::server
