// /////////////////////////////////////////////////////////////////////////////
/// @file SidebarChannel.cpp
/// @brief SidebarChannel implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/net/session/SidebarChannel.hpp>
#include <sbr/net/protocol/ScorePackets.hpp>
#include <sbr/core/Log.hpp>

namespace sbr::net::session {

SidebarChannel::SidebarChannel(PacketQueue& queue)
    : queue_{queue}
{}

SidebarChannel::~SidebarChannel() = default;

void SidebarChannel::emitDestroySidebar(const std::string& objectiveId)
{
    enqueue(protocol::PacketType::RemoveObjective,
            protocol::encodeRemoveObjective({objectiveId}));
}

void SidebarChannel::emitCreateOrShowSidebar(const std::string& objectiveId,
                                             const std::string& title,
                                             display::ScoreboardPosition position,
                                             display::SortOrder sortOrder)
{
    protocol::SetDisplayObjectivePacket packet;
    packet.slot        = std::string{display::slotName(position)};
    packet.objectiveId = objectiveId;
    packet.displayName = title;
    packet.criteria    = protocol::kDummyCriteria;
    packet.sortOrder   = sortOrder;

    enqueue(protocol::PacketType::SetDisplayObjective,
            protocol::encodeSetDisplayObjective(packet));
}

core::u32 SidebarChannel::transmit(const display::RenderResult& result)
{
    core::u32 sent = 0;

    if (!result.remove.empty())
    {
        enqueue(protocol::PacketType::SetScore,
                protocol::encodeSetScore(protocol::ScoreAction::kRemove, result.remove));
        ++sent;
    }

    if (!result.add.empty())
    {
        enqueue(protocol::PacketType::SetScore,
                protocol::encodeSetScore(protocol::ScoreAction::kSet, result.add));
        ++sent;
    }

    return sent;
}

core::u32 SidebarChannel::nextSequence() const noexcept
{
    return sequence_.load(std::memory_order_relaxed);
}

void SidebarChannel::enqueue(protocol::PacketType type, std::vector<core::byte> payload)
{
    QueuedPacket packet;
    packet.header.type        = type;
    packet.header.sequence    = sequence_.fetch_add(1, std::memory_order_relaxed);
    packet.header.payloadSize = static_cast<core::u32>(payload.size());
    packet.payload            = std::move(payload);

    if (core::Log::enabled(core::LogLevel::kDebug))
    {
        core::Log::debug("NET", "SidebarChannel: queued packet type="
                                + std::to_string(static_cast<unsigned>(type))
                                + " bytes=" + std::to_string(packet.header.payloadSize));
    }

    queue_.push(std::move(packet));
}

} // namespace sbr::net::session
