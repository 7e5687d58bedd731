// /////////////////////////////////////////////////////////////////////////////
/// @file PacketQueue.cpp
/// @brief PacketQueue implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/net/PacketQueue.hpp>

#include <iterator>

namespace sbr::net {

void PacketQueue::push(QueuedPacket packet)
{
    std::lock_guard<std::mutex> lock{mutex_};
    queue_.push_back(std::move(packet));
}

bool PacketQueue::pop(QueuedPacket& out)
{
    std::lock_guard<std::mutex> lock{mutex_};
    if (queue_.empty())
    {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::vector<QueuedPacket> PacketQueue::drain()
{
    std::lock_guard<std::mutex> lock{mutex_};
    std::vector<QueuedPacket> out{std::make_move_iterator(queue_.begin()),
                                  std::make_move_iterator(queue_.end())};
    queue_.clear();
    return out;
}

bool PacketQueue::empty() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return queue_.empty();
}

core::u32 PacketQueue::size() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return static_cast<core::u32>(queue_.size());
}

void PacketQueue::clear()
{
    std::lock_guard<std::mutex> lock{mutex_};
    queue_.clear();
}

} // namespace sbr::net
