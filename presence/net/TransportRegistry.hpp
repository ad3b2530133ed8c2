#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "presence/core/Config.hpp"
#include "presence/net/TransportProvider.hpp"

namespace presence::net
{
// Owns transport selection for one process. The capability probe runs on the first
// Acquire and the chosen tier is reused afterwards. Local broadcast providers are
// shared between every channel bound to the same room key.
class TransportRegistry
{
public:
    explicit TransportRegistry(core::PresenceConfig config);
    TransportRegistry(core::PresenceConfig config, std::string instanceId);

    TransportRegistry(const TransportRegistry&) = delete;
    TransportRegistry& operator=(const TransportRegistry&) = delete;

    // Returns nullptr when no tier could be opened for the key.
    [[nodiscard]] std::shared_ptr<TransportProvider> Acquire(const std::string& roomKey);

    [[nodiscard]] std::optional<TransportKind> SelectedKind() const;
    [[nodiscard]] const std::string& InstanceId() const { return m_instanceId; }
    [[nodiscard]] const core::PresenceConfig& Config() const { return m_config; }
    [[nodiscard]] std::size_t SharedProviderCount() const;

private:
    std::shared_ptr<TransportProvider> Open(TransportKind kind, const std::string& roomKey, std::string* outError);

    const core::PresenceConfig m_config;
    const std::string m_instanceId;

    mutable std::mutex m_mutex;
    std::optional<TransportKind> m_selected;
    std::unordered_map<std::string, std::weak_ptr<TransportProvider>> m_sharedProviders;
};
} // namespace presence::net
