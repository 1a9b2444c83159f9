#include <csignal>
#include <filesystem>
#include <iostream>

#include "server/ServerApp.hpp"

namespace
{
trisolar::server::ServerApp* g_app = nullptr;

void HandleSignal(int)
{
    if (g_app != nullptr)
    {
        g_app->RequestStop();
    }
}
} // namespace

int main(int argc, char** argv)
{
    const std::filesystem::path configDirectory = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path("config");

    trisolar::server::ServerApp app;
    if (!app.Initialize(configDirectory))
    {
        std::cerr << "[Server] Initialization failed\n";
        return 1;
    }

    g_app = &app;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Run();
    g_app = nullptr;
    return 0;
}
