#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "presence/protocol/Message.hpp"

namespace presence::scene
{
class ChatLog
{
public:
    static constexpr std::size_t kDefaultCapacity = 200;

    explicit ChatLog(std::size_t capacity = kDefaultCapacity);

    void Append(const protocol::ChatMessage& entry);
    void Clear();

    [[nodiscard]] std::vector<protocol::ChatMessage> Entries() const;
    [[nodiscard]] std::vector<protocol::ChatMessage> Tail(std::size_t count) const;
    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] std::size_t Capacity() const { return m_capacity; }

private:
    mutable std::mutex m_mutex;
    std::deque<protocol::ChatMessage> m_entries;
    std::size_t m_capacity;
};
} // namespace presence::scene
