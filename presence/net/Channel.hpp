#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "presence/net/TransportProvider.hpp"
#include "presence/net/TransportRegistry.hpp"
#include "presence/protocol/Message.hpp"

namespace presence::net
{
// Room-scoped message pipe. Post is fire-and-forget; failures are logged and dropped.
// Handlers run on whichever thread pumps the channel, outside any channel lock.
class Channel
{
public:
    using Handler = std::function<void(const protocol::Message&)>;
    using SubscriptionId = std::uint64_t;

    struct Stats
    {
        std::uint64_t posted = 0;
        std::uint64_t postFailures = 0;
        std::uint64_t received = 0;
        std::uint64_t malformed = 0;
        std::uint64_t handlerErrors = 0;
    };

    Channel(TransportRegistry& registry, std::string roomId);
    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void Post(const protocol::Message& message);

    SubscriptionId Subscribe(Handler handler);
    void Unsubscribe(SubscriptionId id);

    // Delivers everything the provider has buffered. Returns the number of messages dispatched.
    std::size_t Pump();

    bool StartPumpThread(std::chrono::milliseconds interval = std::chrono::milliseconds(5));
    void StopPumpThread();

    // Unregisters every handler; later posts are dropped. Must not be called from a handler.
    void Close();

    [[nodiscard]] bool IsOpen() const;
    [[nodiscard]] std::optional<TransportKind> Kind() const;
    [[nodiscard]] const std::string& RoomId() const { return m_roomId; }
    [[nodiscard]] const std::string& RoomKey() const { return m_roomKey; }
    [[nodiscard]] Stats GetStats() const;

    [[nodiscard]] static std::string RoomKeyFor(const std::string& roomId);

private:
    void OnPayload(const std::string& payload);

    const std::string m_roomId;
    const std::string m_roomKey;

    mutable std::mutex m_providerMutex;
    std::shared_ptr<TransportProvider> m_provider;
    TransportProvider::ReceiverId m_receiverId = 0;

    mutable std::mutex m_handlerMutex;
    std::vector<std::pair<SubscriptionId, std::shared_ptr<Handler>>> m_handlers;
    SubscriptionId m_nextSubscriptionId = 1;

    std::thread m_pumpThread;
    std::atomic<bool> m_pumpRunning{false};

    std::atomic<std::uint64_t> m_posted{0};
    std::atomic<std::uint64_t> m_postFailures{0};
    std::atomic<std::uint64_t> m_received{0};
    std::atomic<std::uint64_t> m_malformed{0};
    std::atomic<std::uint64_t> m_handlerErrors{0};
};
} // namespace presence::net
