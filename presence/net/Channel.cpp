#include "presence/net/Channel.hpp"

#include <algorithm>

#include "presence/core/Log.hpp"
#include "presence/protocol/MessageCodec.hpp"

namespace presence::net
{
namespace
{
constexpr const char* kTag = "Channel";
constexpr const char* kRoomKeyPrefix = "vm_room_";
} // namespace

Channel::Channel(TransportRegistry& registry, std::string roomId)
    : m_roomId(std::move(roomId))
    , m_roomKey(RoomKeyFor(m_roomId))
{
    m_provider = registry.Acquire(m_roomKey);
    if (m_provider == nullptr)
    {
        core::Log::Error(kTag, "Channel for " + m_roomId + " has no transport; messages will be dropped.");
        return;
    }

    m_receiverId = m_provider->AddReceiver([this](const std::string& payload) { OnPayload(payload); });
    core::Log::Info(kTag, "Opened " + m_roomKey + " over " + TransportKindToText(m_provider->Kind()));
}

Channel::~Channel()
{
    Close();
}

void Channel::Post(const protocol::Message& message)
{
    std::shared_ptr<TransportProvider> provider;
    {
        std::lock_guard<std::mutex> lock(m_providerMutex);
        provider = m_provider;
    }
    if (provider == nullptr)
    {
        ++m_postFailures;
        return;
    }

    const std::string payload = protocol::EncodeMessage(message);
    if (!provider->Send(payload))
    {
        ++m_postFailures;
        core::Log::Debug(kTag, std::string("Dropped outbound ") + protocol::MessageTypeToText(protocol::TypeOf(message)));
        return;
    }
    ++m_posted;
}

Channel::SubscriptionId Channel::Subscribe(Handler handler)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    const SubscriptionId id = m_nextSubscriptionId++;
    m_handlers.emplace_back(id, std::make_shared<Handler>(std::move(handler)));
    return id;
}

void Channel::Unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_handlers.erase(
        std::remove_if(m_handlers.begin(), m_handlers.end(), [id](const auto& entry) { return entry.first == id; }),
        m_handlers.end()
    );
}

std::size_t Channel::Pump()
{
    std::shared_ptr<TransportProvider> provider;
    {
        std::lock_guard<std::mutex> lock(m_providerMutex);
        provider = m_provider;
    }
    if (provider == nullptr)
    {
        return 0;
    }

    const std::uint64_t before = m_received.load();
    provider->Poll();
    return static_cast<std::size_t>(m_received.load() - before);
}

bool Channel::StartPumpThread(std::chrono::milliseconds interval)
{
    if (m_pumpRunning.exchange(true))
    {
        return false;
    }

    m_pumpThread = std::thread([this, interval]() {
        while (m_pumpRunning.load())
        {
            Pump();
            std::this_thread::sleep_for(interval);
        }
    });
    return true;
}

void Channel::StopPumpThread()
{
    m_pumpRunning.store(false);
    if (m_pumpThread.joinable())
    {
        m_pumpThread.join();
    }
}

void Channel::Close()
{
    StopPumpThread();

    std::shared_ptr<TransportProvider> provider;
    {
        std::lock_guard<std::mutex> lock(m_providerMutex);
        provider = std::move(m_provider);
        m_provider.reset();
    }
    if (provider != nullptr)
    {
        provider->RemoveReceiver(m_receiverId);
        core::Log::Debug(kTag, "Closed " + m_roomKey);
    }

    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_handlers.clear();
}

bool Channel::IsOpen() const
{
    std::lock_guard<std::mutex> lock(m_providerMutex);
    return m_provider != nullptr;
}

std::optional<TransportKind> Channel::Kind() const
{
    std::lock_guard<std::mutex> lock(m_providerMutex);
    if (m_provider == nullptr)
    {
        return std::nullopt;
    }
    return m_provider->Kind();
}

Channel::Stats Channel::GetStats() const
{
    Stats stats;
    stats.posted = m_posted.load();
    stats.postFailures = m_postFailures.load();
    stats.received = m_received.load();
    stats.malformed = m_malformed.load();
    stats.handlerErrors = m_handlerErrors.load();
    return stats;
}

std::string Channel::RoomKeyFor(const std::string& roomId)
{
    return kRoomKeyPrefix + roomId;
}

void Channel::OnPayload(const std::string& payload)
{
    std::string error;
    const std::optional<protocol::Message> message = protocol::DecodeMessage(payload, &error);
    if (!message)
    {
        ++m_malformed;
        core::Log::Debug(kTag, "Ignored inbound payload: " + error);
        return;
    }
    ++m_received;

    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handlers.reserve(m_handlers.size());
        for (const auto& entry : m_handlers)
        {
            handlers.push_back(entry.second);
        }
    }

    for (const auto& handler : handlers)
    {
        try
        {
            (*handler)(*message);
        }
        catch (const std::exception& exception)
        {
            ++m_handlerErrors;
            core::Log::Error(kTag, std::string("Handler failed: ") + exception.what());
        }
    }
}
} // namespace presence::net
