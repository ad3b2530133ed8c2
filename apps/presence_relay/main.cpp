#include <atomic>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "presence/core/Log.hpp"
#include "presence/core/Time.hpp"
#include "presence/net/RelayServer.hpp"

namespace
{
std::atomic<bool> g_stopRequested{false};

void HandleStopSignal(int /*signal*/)
{
    g_stopRequested.store(true);
}

bool ParseNumber(const std::string& text, unsigned long maxValue, unsigned long& outValue)
{
    try
    {
        std::size_t consumed = 0;
        const unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value == 0 || value > maxValue)
        {
            return false;
        }
        outValue = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

void PrintUsage()
{
    std::cerr << "Usage: presence_relay [--port <n>] [--max-peers <n>] [--key <text>]\n";
}
} // namespace

int main(int argc, char** argv)
{
    presence::net::RelayServer::Settings settings;
    if (const char* key = std::getenv("PRESENCE_RELAY_KEY"))
    {
        settings.key = key;
    }

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        unsigned long number = 0;
        if (arg == "--port" && hasValue && ParseNumber(argv[i + 1], 65535UL, number))
        {
            settings.port = static_cast<std::uint16_t>(number);
            ++i;
        }
        else if (arg == "--max-peers" && hasValue && ParseNumber(argv[i + 1], 4095UL, number))
        {
            settings.maxPeers = static_cast<std::size_t>(number);
            ++i;
        }
        else if (arg == "--key" && hasValue)
        {
            settings.key = argv[++i];
        }
        else
        {
            std::cerr << "Invalid argument: " << arg << "\n";
            PrintUsage();
            return 2;
        }
    }

    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    presence::net::RelayServer server(settings);
    std::string error;
    if (!server.Start(&error))
    {
        presence::core::Log::Error("RelayServer", error);
        return 1;
    }

    double lastStatsSeconds = presence::core::Time::MonotonicSeconds();
    while (!g_stopRequested.load())
    {
        server.Poll(50);

        const double now = presence::core::Time::MonotonicSeconds();
        if (now - lastStatsSeconds >= 30.0)
        {
            const auto stats = server.GetStats();
            presence::core::Log::Info(
                "RelayServer",
                std::to_string(stats.peers) + " peers, " + std::to_string(stats.rooms) + " rooms, " +
                    std::to_string(stats.forwardedPackets) + " packets forwarded"
            );
            lastStatsSeconds = now;
        }
    }

    server.Stop();
    presence::core::Log::Info("RelayServer", "Stopped.");
    return 0;
}
