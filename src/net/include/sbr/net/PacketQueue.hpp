// /////////////////////////////////////////////////////////////////////////////
/// @file PacketQueue.hpp
/// @brief Thread-safe, order-preserving outbound packet queue.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/net/protocol/Protocol.hpp>
#include <sbr/core/Types.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <deque>
#include <mutex>
#include <vector>

namespace sbr::net {

// /////////////////////////////////////////////////////////////////////////////
/// @struct QueuedPacket
/// @brief A packet awaiting transmission.
// /////////////////////////////////////////////////////////////////////////////
struct QueuedPacket
{
    protocol::PacketHeader  header;
    std::vector<core::byte> payload;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class PacketQueue
/// @brief Thread-safe FIFO of outbound packets.
///
/// Scoreboard packets depend on each other (objective before rows, removals
/// before additions), so the queue never reorders.
// /////////////////////////////////////////////////////////////////////////////
class PacketQueue final : public core::NonCopyable<PacketQueue>
{
public:
    PacketQueue() = default;
    ~PacketQueue() = default;

    /// @brief Appends a packet.
    void push(QueuedPacket packet);

    /// @brief Pops the oldest packet.
    /// @param[out] out Filled with the packet if available.
    /// @return @c true if a packet was dequeued.
    bool pop(QueuedPacket& out);

    /// @brief Moves every queued packet out, oldest first.
    [[nodiscard]] std::vector<QueuedPacket> drain();

    [[nodiscard]] bool empty() const;
    [[nodiscard]] core::u32 size() const;

    /// @brief Discards all queued packets.
    void clear();

private:
    mutable std::mutex       mutex_;
    std::deque<QueuedPacket> queue_;
};

} // namespace sbr::net
