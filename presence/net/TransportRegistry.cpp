#include "presence/net/TransportRegistry.hpp"

#include <array>

#include "presence/core/Log.hpp"
#include "presence/net/LocalBroadcastTransport.hpp"
#include "presence/net/RelayTransport.hpp"
#include "presence/net/StorageTransport.hpp"
#include "presence/scene/Participant.hpp"

namespace presence::net
{
namespace
{
constexpr const char* kTag = "Transport";
constexpr std::array<TransportKind, 3> kTierOrder{
    TransportKind::Relay,
    TransportKind::LocalBroadcast,
    TransportKind::SharedStorage,
};
} // namespace

TransportRegistry::TransportRegistry(core::PresenceConfig config)
    : TransportRegistry(std::move(config), scene::GeneratePeerId())
{
}

TransportRegistry::TransportRegistry(core::PresenceConfig config, std::string instanceId)
    : m_config(std::move(config))
    , m_instanceId(std::move(instanceId))
{
}

std::shared_ptr<TransportProvider> TransportRegistry::Acquire(const std::string& roomKey)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto shared = m_sharedProviders.find(roomKey);
    if (shared != m_sharedProviders.end())
    {
        if (std::shared_ptr<TransportProvider> provider = shared->second.lock())
        {
            return provider;
        }
        m_sharedProviders.erase(shared);
    }

    // Later acquisitions start at the probed tier and only fall further down.
    std::size_t firstTier = 0;
    if (m_selected)
    {
        while (firstTier < kTierOrder.size() && kTierOrder[firstTier] != *m_selected)
        {
            ++firstTier;
        }
    }

    for (std::size_t tier = firstTier; tier < kTierOrder.size(); ++tier)
    {
        const TransportKind kind = kTierOrder[tier];
        std::string error;
        std::shared_ptr<TransportProvider> provider = Open(kind, roomKey, &error);
        if (!provider)
        {
            if (!error.empty())
            {
                core::Log::Debug(kTag, std::string(TransportKindToText(kind)) + " unavailable: " + error);
            }
            continue;
        }

        if (!m_selected)
        {
            m_selected = kind;
            core::Log::Info(kTag, std::string("Selected ") + TransportKindToText(kind) + " transport.");
        }
        else if (kind != *m_selected)
        {
            core::Log::Warn(kTag, std::string("Room ") + roomKey + " fell back to " + TransportKindToText(kind) + ".");
        }

        if (kind == TransportKind::LocalBroadcast)
        {
            m_sharedProviders[roomKey] = provider;
        }
        return provider;
    }

    core::Log::Error(kTag, "No transport available for " + roomKey);
    return nullptr;
}

std::optional<TransportKind> TransportRegistry::SelectedKind() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_selected;
}

std::size_t TransportRegistry::SharedProviderCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t count = 0;
    for (const auto& entry : m_sharedProviders)
    {
        if (!entry.second.expired())
        {
            ++count;
        }
    }
    return count;
}

std::shared_ptr<TransportProvider> TransportRegistry::Open(
    TransportKind kind,
    const std::string& roomKey,
    std::string* outError
)
{
    switch (kind)
    {
        case TransportKind::Relay:
            if (!m_config.HasRelayConfiguration())
            {
                return nullptr;
            }
            return RelayTransport::Create(m_config.relay, roomKey, outError);
        case TransportKind::LocalBroadcast:
            return LocalBroadcastTransport::Open(m_config.localBroadcast, roomKey, m_instanceId, outError);
        case TransportKind::SharedStorage:
            return StorageTransport::Open(m_config.storage, roomKey, m_instanceId, outError);
    }
    return nullptr;
}
} // namespace presence::net
