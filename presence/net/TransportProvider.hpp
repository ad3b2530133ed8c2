#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace presence::net
{
enum class TransportKind
{
    Relay,
    LocalBroadcast,
    SharedStorage
};

[[nodiscard]] const char* TransportKindToText(TransportKind kind);

// One concrete channel technology moving serialized messages between peers.
// Send never blocks; Poll drains whatever arrived and hands each payload to every receiver.
class TransportProvider
{
public:
    using ReceiverId = std::uint64_t;
    using Receiver = std::function<void(const std::string& payload)>;

    explicit TransportProvider(std::string roomKey);
    virtual ~TransportProvider() = default;

    TransportProvider(const TransportProvider&) = delete;
    TransportProvider& operator=(const TransportProvider&) = delete;

    [[nodiscard]] virtual TransportKind Kind() const = 0;
    virtual bool Send(const std::string& payload) = 0;

    // Returns the number of payloads delivered.
    std::size_t Poll();

    ReceiverId AddReceiver(Receiver receiver);
    void RemoveReceiver(ReceiverId id);
    [[nodiscard]] std::size_t ReceiverCount() const;

    [[nodiscard]] const std::string& RoomKey() const { return m_roomKey; }

protected:
    virtual void CollectIncoming(std::vector<std::string>& outPayloads) = 0;

private:
    const std::string m_roomKey;

    // Serializes polls so payloads keep provider arrival order; recursive so a receiver may detach itself.
    std::recursive_mutex m_pollMutex;
    mutable std::mutex m_receiverMutex;
    std::vector<std::pair<ReceiverId, std::shared_ptr<Receiver>>> m_receivers;
    ReceiverId m_nextReceiverId = 1;
};
} // namespace presence::net
