#include "presence/core/App.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

#include "presence/core/Log.hpp"
#include "presence/core/Time.hpp"
#include "presence/net/TransportRegistry.hpp"
#include "presence/room/MediaDevices.hpp"
#include "presence/room/RoomSession.hpp"

namespace presence::core
{
namespace
{
constexpr const char* kTag = "App";

std::atomic<bool> g_stopRequested{false};

void HandleStopSignal(int /*signal*/)
{
    g_stopRequested.store(true);
}

bool ParseSeconds(const std::string& text, double& outSeconds)
{
    try
    {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size() || value < 0.0)
        {
            return false;
        }
        outSeconds = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}
} // namespace

App::App(Options options)
    : m_options(std::move(options))
    , m_rng(std::random_device{}())
{
}

bool App::Run()
{
    LoadConfig();

    scene::AvatarProfile profile = scene::MakeDefaultProfile(static_cast<unsigned int>(m_rng()));
    if (!m_options.name.empty())
    {
        profile.name = m_options.name;
    }
    if (!m_options.color.empty())
    {
        profile.color = m_options.color;
    }

    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    net::TransportRegistry registry(m_config);
    room::HeadlessMediaDevices devices;
    room::RoomSession session(registry, m_options.room, profile, devices, m_config);

    if (!session.RoomChannel().IsOpen())
    {
        Log::Error(kTag, "No transport could be opened; exiting.");
        return false;
    }

    session.RoomChannel().StartPumpThread();
    session.Join();
    if (m_options.speak && !session.SetMicrophoneEnabled(true))
    {
        Log::Warn(kTag, "Continuing without microphone.");
    }

    const auto transport = session.ActiveTransport();
    Log::Info(kTag, "Room " + m_options.room + " via " + (transport ? net::TransportKindToText(*transport) : "none") +
        "; press Ctrl+C to leave.");

    const double startSeconds = Time::MonotonicSeconds();
    double lastTableSeconds = startSeconds;
    const auto frameDuration = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / static_cast<double>(kTickHz))
    );
    auto nextFrame = std::chrono::steady_clock::now();

    while (!StopRequested())
    {
        const double now = Time::MonotonicSeconds();
        if (m_options.seconds > 0.0 && now - startSeconds >= m_options.seconds)
        {
            break;
        }

        if (m_options.wander)
        {
            UpdateAutopilot(session, now);
        }
        session.Tick(m_options.speak ? SyntheticAudioLevel(now - startSeconds) : 0.0F);

        if (now - lastTableSeconds >= kPeerTableIntervalSeconds)
        {
            PrintPeerTable(session.Frame());
            lastTableSeconds = now;
        }

        nextFrame += frameDuration;
        std::this_thread::sleep_until(nextFrame);
    }

    session.Leave();
    session.RoomChannel().StopPumpThread();
    Log::Instance().CloseFile();
    return true;
}

bool App::ParseArguments(int argc, char** argv, Options& outOptions, std::string* outError)
{
    Options options;
    auto fail = [&](const std::string& message) {
        if (outError != nullptr)
        {
            *outError = message;
        }
        return false;
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        auto nextValue = [&](std::string& outValue) {
            if (i + 1 >= argc)
            {
                return false;
            }
            outValue = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--room")
        {
            if (!nextValue(value) || value.empty())
            {
                return fail("--room needs a room id");
            }
            options.room = value;
        }
        else if (arg == "--name")
        {
            if (!nextValue(value))
            {
                return fail("--name needs a value");
            }
            options.name = value;
        }
        else if (arg == "--color")
        {
            if (!nextValue(value) || value.empty() || value[0] != '#')
            {
                return fail("--color needs a hex color like #22c55e");
            }
            options.color = value;
        }
        else if (arg == "--config")
        {
            if (!nextValue(value) || value.empty())
            {
                return fail("--config needs a path");
            }
            options.configPath = value;
        }
        else if (arg == "--seconds")
        {
            if (!nextValue(value) || !ParseSeconds(value, options.seconds))
            {
                return fail("--seconds needs a non-negative number");
            }
        }
        else if (arg == "--wander")
        {
            options.wander = true;
        }
        else if (arg == "--speak")
        {
            options.speak = true;
        }
        else
        {
            return fail("Unknown argument: " + arg);
        }
    }

    outOptions = std::move(options);
    return true;
}

std::string App::Usage()
{
    return "Usage: presence_node [--room <id>] [--name <text>] [--color <hex>] [--config <path>]\n"
           "                     [--seconds <n>] [--wander] [--speak]\n";
}

void App::RequestStop()
{
    g_stopRequested.store(true);
}

bool App::StopRequested()
{
    return g_stopRequested.load();
}

void App::LoadConfig()
{
    std::string error;
    if (!LoadPresenceConfig(m_options.configPath, m_config, &error))
    {
        std::cerr << "[Config] " << error << "\n";
    }
    ApplyEnvironmentOverrides(m_config);

    Log& log = Log::Instance();
    log.SetLevel(Log::ParseLevel(m_config.log.level, LogLevel::Info));
    if (!m_config.log.filePath.empty() && !log.OpenFile(m_config.log.filePath))
    {
        Log::Warn(kTag, "Unable to open log file " + m_config.log.filePath);
    }
    Log::Info(kTag, "Config loaded from " + m_options.configPath);
}

void App::UpdateAutopilot(room::RoomSession& session, double nowSeconds)
{
    if (nowSeconds < m_nextWanderSeconds && session.Simulation().Target().has_value())
    {
        return;
    }

    std::uniform_real_distribution<float> xDist(0.0F, m_config.WorldWidth());
    std::uniform_real_distribution<float> yDist(0.0F, m_config.WorldHeight());
    std::uniform_real_distribution<double> pauseDist(2.0, 6.0);

    session.PointAt(glm::vec2{xDist(m_rng), yDist(m_rng)});
    m_nextWanderSeconds = nowSeconds + pauseDist(m_rng);
}

float App::SyntheticAudioLevel(double nowSeconds) const
{
    // Two seconds of speech every five seconds.
    const double phase = std::fmod(nowSeconds, 5.0);
    if (phase > 2.0)
    {
        return 0.0F;
    }
    const double syllables = 0.5 + 0.5 * std::sin(nowSeconds * 11.0) * std::sin(nowSeconds * 3.7);
    return static_cast<float>(std::clamp(syllables * 0.45, 0.0, 1.0));
}

void App::PrintPeerTable(const room::RoomFrame& frame) const
{
    std::ostringstream table;
    table << "[Peers] " << frame.participants.size() << " in room " << m_options.room << "\n";
    for (const scene::Participant& participant : frame.participants)
    {
        glm::vec2 shown = participant.position;
        const auto display = frame.display.find(participant.id);
        if (display != frame.display.end())
        {
            shown = display->second.position;
        }

        table << "  " << (participant.id == frame.localId ? '*' : ' ') << ' '
              << std::left << std::setw(14) << participant.profile.name.substr(0, 14)
              << std::right << std::fixed << std::setprecision(1)
              << std::setw(8) << shown.x << std::setw(8) << shown.y << "  "
              << std::left << std::setw(6) << scene::DirectionToText(participant.direction)
              << (participant.micEnabled ? " mic " : "     ")
              << std::setprecision(2) << participant.speakingLevel;
        if (participant.profile.caption)
        {
            table << "  \"" << *participant.profile.caption << "\"";
        }
        table << "\n";
    }
    std::cout << table.str() << std::flush;
}
} // namespace presence::core
