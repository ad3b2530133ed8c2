#include "presence/net/TransportProvider.hpp"

#include <algorithm>

namespace presence::net
{
const char* TransportKindToText(TransportKind kind)
{
    switch (kind)
    {
        case TransportKind::Relay: return "relay";
        case TransportKind::LocalBroadcast: return "local-broadcast";
        case TransportKind::SharedStorage: return "shared-storage";
    }
    return "unknown";
}

TransportProvider::TransportProvider(std::string roomKey)
    : m_roomKey(std::move(roomKey))
{
}

std::size_t TransportProvider::Poll()
{
    std::lock_guard<std::recursive_mutex> pollLock(m_pollMutex);

    std::vector<std::string> payloads;
    CollectIncoming(payloads);
    if (payloads.empty())
    {
        return 0;
    }

    std::vector<std::shared_ptr<Receiver>> receivers;
    {
        std::lock_guard<std::mutex> lock(m_receiverMutex);
        receivers.reserve(m_receivers.size());
        for (const auto& entry : m_receivers)
        {
            receivers.push_back(entry.second);
        }
    }

    for (const std::string& payload : payloads)
    {
        for (const auto& receiver : receivers)
        {
            (*receiver)(payload);
        }
    }
    return payloads.size();
}

TransportProvider::ReceiverId TransportProvider::AddReceiver(Receiver receiver)
{
    std::lock_guard<std::mutex> lock(m_receiverMutex);
    const ReceiverId id = m_nextReceiverId++;
    m_receivers.emplace_back(id, std::make_shared<Receiver>(std::move(receiver)));
    return id;
}

void TransportProvider::RemoveReceiver(ReceiverId id)
{
    // Waits out a dispatch running on another thread.
    std::lock_guard<std::recursive_mutex> pollLock(m_pollMutex);
    std::lock_guard<std::mutex> lock(m_receiverMutex);
    m_receivers.erase(
        std::remove_if(m_receivers.begin(), m_receivers.end(), [id](const auto& entry) { return entry.first == id; }),
        m_receivers.end()
    );
}

std::size_t TransportProvider::ReceiverCount() const
{
    std::lock_guard<std::mutex> lock(m_receiverMutex);
    return m_receivers.size();
}
} // namespace presence::net
