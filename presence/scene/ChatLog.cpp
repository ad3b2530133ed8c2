#include "presence/scene/ChatLog.hpp"

#include <algorithm>

namespace presence::scene
{
ChatLog::ChatLog(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(1, capacity))
{
}

void ChatLog::Append(const protocol::ChatMessage& entry)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.push_back(entry);
    while (m_entries.size() > m_capacity)
    {
        m_entries.pop_front();
    }
}

void ChatLog::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

std::vector<protocol::ChatMessage> ChatLog::Entries() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_entries.begin(), m_entries.end()};
}

std::vector<protocol::ChatMessage> ChatLog::Tail(std::size_t count) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::size_t take = std::min(count, m_entries.size());
    return {m_entries.end() - static_cast<std::ptrdiff_t>(take), m_entries.end()};
}

std::size_t ChatLog::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}
} // namespace presence::scene
