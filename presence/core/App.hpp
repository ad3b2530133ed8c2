#pragma once

#include <random>
#include <string>

#include "presence/core/Config.hpp"

namespace presence::room
{
class RoomSession;
struct RoomFrame;
} // namespace presence::room

namespace presence::core
{
// Headless presence peer: joins one room and runs the tick loop until interrupted.
class App
{
public:
    struct Options
    {
        std::string room = "lobby";
        std::string name;
        std::string color;
        std::string configPath = "config/presence.json";
        double seconds = 0.0;
        bool wander = false;
        bool speak = false;
    };

    static constexpr int kTickHz = 60;
    static constexpr double kPeerTableIntervalSeconds = 2.0;

    explicit App(Options options);

    bool Run();

    [[nodiscard]] static bool ParseArguments(int argc, char** argv, Options& outOptions, std::string* outError);
    [[nodiscard]] static std::string Usage();

    static void RequestStop();
    [[nodiscard]] static bool StopRequested();

private:
    void LoadConfig();
    void UpdateAutopilot(room::RoomSession& session, double nowSeconds);
    [[nodiscard]] float SyntheticAudioLevel(double nowSeconds) const;
    void PrintPeerTable(const room::RoomFrame& frame) const;

    Options m_options;
    PresenceConfig m_config;
    std::mt19937 m_rng;
    double m_nextWanderSeconds = 0.0;
};
} // namespace presence::core
