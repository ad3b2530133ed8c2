#include "presence/core/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace presence::core
{
namespace
{
using json = nlohmann::json;

void ReadFloat(const json& node, const char* key, float& target)
{
    if (node.contains(key) && node[key].is_number())
    {
        target = node[key].get<float>();
    }
}

void ReadDouble(const json& node, const char* key, double& target)
{
    if (node.contains(key) && node[key].is_number())
    {
        target = node[key].get<double>();
    }
}

void ReadInt(const json& node, const char* key, int& target)
{
    if (node.contains(key) && node[key].is_number_integer())
    {
        target = node[key].get<int>();
    }
}

void ReadPort(const json& node, const char* key, std::uint16_t& target)
{
    if (node.contains(key) && node[key].is_number_integer())
    {
        target = static_cast<std::uint16_t>(std::clamp(node[key].get<int>(), 0, 65535));
    }
}

void ReadBool(const json& node, const char* key, bool& target)
{
    if (node.contains(key) && node[key].is_boolean())
    {
        target = node[key].get<bool>();
    }
}

void ReadString(const json& node, const char* key, std::string& target)
{
    if (node.contains(key) && node[key].is_string())
    {
        target = node[key].get<std::string>();
    }
}

const json* Section(const json& root, const char* key)
{
    if (root.contains(key) && root[key].is_object())
    {
        return &root[key];
    }
    return nullptr;
}

void ClampConfig(PresenceConfig& config)
{
    config.world.tileSize = std::clamp(config.world.tileSize, 8.0F, 512.0F);
    config.world.widthTiles = std::clamp(config.world.widthTiles, 1, 1024);
    config.world.heightTiles = std::clamp(config.world.heightTiles, 1, 1024);

    config.movement.baseSpeed = std::clamp(config.movement.baseSpeed, 1.0F, 10000.0F);
    config.movement.accelerateGain = std::clamp(config.movement.accelerateGain, 0.1F, 100.0F);
    config.movement.decelerateGain = std::clamp(config.movement.decelerateGain, 0.1F, 100.0F);
    config.movement.arrivalDistance = std::clamp(config.movement.arrivalDistance, 0.1F, 100.0F);
    config.movement.maxTickSeconds = std::clamp(config.movement.maxTickSeconds, 1.0 / 240.0, 0.25);

    config.interpolation.referenceRate = std::clamp(config.interpolation.referenceRate, 1.0F, 1000.0F);
    config.interpolation.remoteLerp = std::clamp(config.interpolation.remoteLerp, 0.01F, config.interpolation.referenceRate);
    config.interpolation.voiceGain = std::clamp(config.interpolation.voiceGain, 0.01F, 1000.0F);

    config.broadcast.positionIntervalSeconds = std::clamp(config.broadcast.positionIntervalSeconds, 0.005, 5.0);
    config.broadcast.voiceIntervalSeconds = std::clamp(config.broadcast.voiceIntervalSeconds, 0.005, 5.0);
    config.broadcast.voiceHysteresis = std::clamp(config.broadcast.voiceHysteresis, 0.0F, 1.0F);
    config.broadcast.voiceOutputGain = std::clamp(config.broadcast.voiceOutputGain, 0.0F, 100.0F);
    config.broadcast.moveEpsilon = std::clamp(config.broadcast.moveEpsilon, 0.0F, 64.0F);
    config.broadcast.announceIntervalSeconds = std::clamp(config.broadcast.announceIntervalSeconds, 0.1, 60.0);

    config.liveness.staleTimeoutSeconds = std::max(0.0, config.liveness.staleTimeoutSeconds);
    config.relay.connectTimeoutSeconds = std::clamp(config.relay.connectTimeoutSeconds, 0.1, 60.0);

    config.storage.pollIntervalSeconds = std::clamp(config.storage.pollIntervalSeconds, 0.001, 5.0);
    config.storage.retentionSeconds = std::clamp(config.storage.retentionSeconds, 0.1, 600.0);
    if (config.storage.root.empty())
    {
        config.storage.root = DefaultStorageRoot();
    }
}
} // namespace

std::string DefaultStorageRoot()
{
    std::error_code error;
    std::filesystem::path base = std::filesystem::temp_directory_path(error);
    if (error)
    {
        base = ".";
    }
    return (base / "presence_rooms").string();
}

bool ParsePresenceConfig(const std::string& jsonContent, PresenceConfig& outConfig, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(jsonContent);
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Invalid presence config JSON: "} + ex.what();
        }
        return false;
    }

    if (!root.is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Presence config root must be an object";
        }
        return false;
    }

    PresenceConfig config = outConfig;
    ReadInt(root, "asset_version", config.assetVersion);

    if (const json* world = Section(root, "world"))
    {
        ReadFloat(*world, "tile_size", config.world.tileSize);
        ReadInt(*world, "width_tiles", config.world.widthTiles);
        ReadInt(*world, "height_tiles", config.world.heightTiles);
    }
    if (const json* movement = Section(root, "movement"))
    {
        ReadFloat(*movement, "base_speed", config.movement.baseSpeed);
        ReadFloat(*movement, "accelerate_gain", config.movement.accelerateGain);
        ReadFloat(*movement, "decelerate_gain", config.movement.decelerateGain);
        ReadFloat(*movement, "arrival_distance", config.movement.arrivalDistance);
        ReadDouble(*movement, "max_tick_seconds", config.movement.maxTickSeconds);
    }
    if (const json* interpolation = Section(root, "interpolation"))
    {
        ReadFloat(*interpolation, "remote_lerp", config.interpolation.remoteLerp);
        ReadFloat(*interpolation, "reference_rate", config.interpolation.referenceRate);
        ReadFloat(*interpolation, "voice_gain", config.interpolation.voiceGain);
    }
    if (const json* broadcast = Section(root, "broadcast"))
    {
        ReadDouble(*broadcast, "position_interval_seconds", config.broadcast.positionIntervalSeconds);
        ReadDouble(*broadcast, "voice_interval_seconds", config.broadcast.voiceIntervalSeconds);
        ReadFloat(*broadcast, "voice_hysteresis", config.broadcast.voiceHysteresis);
        ReadFloat(*broadcast, "voice_output_gain", config.broadcast.voiceOutputGain);
        ReadFloat(*broadcast, "move_epsilon", config.broadcast.moveEpsilon);
        ReadDouble(*broadcast, "announce_interval_seconds", config.broadcast.announceIntervalSeconds);
    }
    if (const json* liveness = Section(root, "liveness"))
    {
        ReadDouble(*liveness, "stale_timeout_seconds", config.liveness.staleTimeoutSeconds);
    }
    if (const json* relay = Section(root, "relay"))
    {
        ReadString(*relay, "host", config.relay.host);
        ReadPort(*relay, "port", config.relay.port);
        ReadString(*relay, "key", config.relay.key);
        ReadDouble(*relay, "connect_timeout_seconds", config.relay.connectTimeoutSeconds);
    }
    if (const json* localBroadcast = Section(root, "local_broadcast"))
    {
        ReadBool(*localBroadcast, "enabled", config.localBroadcast.enabled);
        ReadString(*localBroadcast, "group", config.localBroadcast.group);
        ReadPort(*localBroadcast, "port", config.localBroadcast.port);
    }
    if (const json* storage = Section(root, "storage"))
    {
        ReadString(*storage, "root", config.storage.root);
        ReadDouble(*storage, "poll_interval_seconds", config.storage.pollIntervalSeconds);
        ReadDouble(*storage, "retention_seconds", config.storage.retentionSeconds);
    }
    if (const json* log = Section(root, "log"))
    {
        ReadString(*log, "file", config.log.filePath);
        ReadString(*log, "level", config.log.level);
    }

    ClampConfig(config);
    outConfig = std::move(config);
    return true;
}

std::string SerializePresenceConfig(const PresenceConfig& config)
{
    json root;
    root["asset_version"] = config.assetVersion;
    root["world"] = {
        {"tile_size", config.world.tileSize},
        {"width_tiles", config.world.widthTiles},
        {"height_tiles", config.world.heightTiles},
    };
    root["movement"] = {
        {"base_speed", config.movement.baseSpeed},
        {"accelerate_gain", config.movement.accelerateGain},
        {"decelerate_gain", config.movement.decelerateGain},
        {"arrival_distance", config.movement.arrivalDistance},
        {"max_tick_seconds", config.movement.maxTickSeconds},
    };
    root["interpolation"] = {
        {"remote_lerp", config.interpolation.remoteLerp},
        {"reference_rate", config.interpolation.referenceRate},
        {"voice_gain", config.interpolation.voiceGain},
    };
    root["broadcast"] = {
        {"position_interval_seconds", config.broadcast.positionIntervalSeconds},
        {"voice_interval_seconds", config.broadcast.voiceIntervalSeconds},
        {"voice_hysteresis", config.broadcast.voiceHysteresis},
        {"voice_output_gain", config.broadcast.voiceOutputGain},
        {"move_epsilon", config.broadcast.moveEpsilon},
        {"announce_interval_seconds", config.broadcast.announceIntervalSeconds},
    };
    root["liveness"] = {
        {"stale_timeout_seconds", config.liveness.staleTimeoutSeconds},
    };
    root["relay"] = {
        {"host", config.relay.host},
        {"port", config.relay.port},
        {"key", config.relay.key},
        {"connect_timeout_seconds", config.relay.connectTimeoutSeconds},
    };
    root["local_broadcast"] = {
        {"enabled", config.localBroadcast.enabled},
        {"group", config.localBroadcast.group},
        {"port", config.localBroadcast.port},
    };
    root["storage"] = {
        {"root", config.storage.root},
        {"poll_interval_seconds", config.storage.pollIntervalSeconds},
        {"retention_seconds", config.storage.retentionSeconds},
    };
    root["log"] = {
        {"file", config.log.filePath},
        {"level", config.log.level},
    };
    return root.dump(2);
}

bool LoadPresenceConfig(const std::string& path, PresenceConfig& outConfig, std::string* outError)
{
    outConfig = PresenceConfig{};
    outConfig.storage.root = DefaultStorageRoot();

    const std::filesystem::path filePath(path);
    if (!std::filesystem::exists(filePath))
    {
        return SavePresenceConfig(path, outConfig, outError);
    }

    std::ifstream stream(filePath);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot open presence config: " + path;
        }
        return false;
    }

    const std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (!ParsePresenceConfig(content, outConfig, outError))
    {
        outConfig = PresenceConfig{};
        outConfig.storage.root = DefaultStorageRoot();
        SavePresenceConfig(path, outConfig, nullptr);
        return false;
    }
    return true;
}

bool SavePresenceConfig(const std::string& path, const PresenceConfig& config, std::string* outError)
{
    const std::filesystem::path filePath(path);
    std::error_code error;
    if (filePath.has_parent_path())
    {
        std::filesystem::create_directories(filePath.parent_path(), error);
    }

    std::ofstream stream(filePath);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot write presence config: " + path;
        }
        return false;
    }
    stream << SerializePresenceConfig(config) << "\n";
    return true;
}

void ApplyEnvironmentOverrides(PresenceConfig& config)
{
    if (const char* host = std::getenv("PRESENCE_RELAY_HOST"); host != nullptr && host[0] != '\0')
    {
        config.relay.host = host;
    }
    if (const char* port = std::getenv("PRESENCE_RELAY_PORT"); port != nullptr && port[0] != '\0')
    {
        try
        {
            config.relay.port = static_cast<std::uint16_t>(std::clamp(std::stoi(port), 0, 65535));
        }
        catch (const std::exception&)
        {
            config.relay.port = 0;
        }
    }
    if (const char* key = std::getenv("PRESENCE_RELAY_KEY"); key != nullptr)
    {
        config.relay.key = key;
    }
    if (const char* disable = std::getenv("PRESENCE_DISABLE_LOCAL_BROADCAST"); disable != nullptr && disable[0] != '\0' && disable[0] != '0')
    {
        config.localBroadcast.enabled = false;
    }
    if (const char* root = std::getenv("PRESENCE_STORAGE_ROOT"); root != nullptr && root[0] != '\0')
    {
        config.storage.root = root;
    }
}
} // namespace presence::core
