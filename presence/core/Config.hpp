#pragma once

#include <cstdint>
#include <string>

namespace presence::core
{
struct WorldSettings
{
    float tileSize = 64.0F;
    int widthTiles = 16;
    int heightTiles = 10;
};

struct MovementSettings
{
    float baseSpeed = 180.0F;
    float accelerateGain = 8.0F;
    float decelerateGain = 10.0F;
    float arrivalDistance = 3.0F;
    double maxTickSeconds = 0.05;
};

struct InterpolationSettings
{
    float remoteLerp = 12.0F;
    float referenceRate = 60.0F;
    float voiceGain = 10.0F;
};

struct BroadcastSettings
{
    double positionIntervalSeconds = 0.060;
    double voiceIntervalSeconds = 0.140;
    float voiceHysteresis = 0.03F;
    float voiceOutputGain = 2.2F;
    float moveEpsilon = 0.5F;
    // Full snapshot rebroadcast; lets peers that evicted us re-create our entry.
    double announceIntervalSeconds = 2.0;
};

struct LivenessSettings
{
    double staleTimeoutSeconds = 5.0;
};

struct RelaySettings
{
    std::string host;
    std::uint16_t port = 0;
    std::string key;
    double connectTimeoutSeconds = 5.0;
};

struct LocalBroadcastSettings
{
    bool enabled = true;
    std::string group = "239.255.77.77";
    std::uint16_t port = 47777;
};

struct StorageSettings
{
    std::string root;
    double pollIntervalSeconds = 0.05;
    double retentionSeconds = 3.0;
};

struct LogSettings
{
    std::string filePath = "logs/presence.log";
    std::string level = "info";
};

struct PresenceConfig
{
    int assetVersion = 1;
    WorldSettings world;
    MovementSettings movement;
    InterpolationSettings interpolation;
    BroadcastSettings broadcast;
    LivenessSettings liveness;
    RelaySettings relay;
    LocalBroadcastSettings localBroadcast;
    StorageSettings storage;
    LogSettings log;

    [[nodiscard]] bool HasRelayConfiguration() const { return !relay.host.empty() && relay.port != 0; }
    [[nodiscard]] float WorldWidth() const { return world.tileSize * static_cast<float>(world.widthTiles); }
    [[nodiscard]] float WorldHeight() const { return world.tileSize * static_cast<float>(world.heightTiles); }
};

// Lenient parse: keys are read only when present with the right type, then clamped.
[[nodiscard]] bool ParsePresenceConfig(const std::string& jsonContent, PresenceConfig& outConfig, std::string* outError = nullptr);
[[nodiscard]] std::string SerializePresenceConfig(const PresenceConfig& config);

// Missing file writes defaults; invalid JSON falls back to defaults and rewrites the file.
bool LoadPresenceConfig(const std::string& path, PresenceConfig& outConfig, std::string* outError = nullptr);
bool SavePresenceConfig(const std::string& path, const PresenceConfig& config, std::string* outError = nullptr);

void ApplyEnvironmentOverrides(PresenceConfig& config);

[[nodiscard]] std::string DefaultStorageRoot();
} // namespace presence::core
