// /////////////////////////////////////////////////////////////////////////////
/// @file SidebarChannel.hpp
/// @brief Turns sidebar render output into queued client packets.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/net/PacketQueue.hpp>
#include <sbr/net/protocol/Protocol.hpp>
#include <sbr/display/ISidebarSink.hpp>
#include <sbr/display/ScoreInfo.hpp>
#include <sbr/core/Types.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <atomic>
#include <span>
#include <string>
#include <vector>

namespace sbr::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class SidebarChannel
/// @brief Per-session packet writer for one sidebar.
///
/// Directives are queued the moment the slot emits them, which is before
/// the render returns; @ref transmit then queues the removals followed by
/// the additions.  The resulting order on the wire is destroy, create,
/// remove rows, add rows.
// /////////////////////////////////////////////////////////////////////////////
class SidebarChannel final : public display::ISidebarSink, public core::NonMovable<SidebarChannel>
{
public:
    /// @param queue Outbound queue of the session.
    explicit SidebarChannel(PacketQueue& queue);
    ~SidebarChannel() override;

    void emitDestroySidebar(const std::string& objectiveId) override;

    void emitCreateOrShowSidebar(const std::string& objectiveId,
                                 const std::string& title,
                                 display::ScoreboardPosition position,
                                 display::SortOrder sortOrder) override;

    /// @brief Queues one SetScore packet per non-empty batch.
    /// @return Number of packets queued (0 to 2).
    core::u32 transmit(const display::RenderResult& result);

    /// @brief Sequence number the next packet will carry.
    [[nodiscard]] core::u32 nextSequence() const noexcept;

private:
    void enqueue(protocol::PacketType type, std::vector<core::byte> payload);

    PacketQueue&           queue_;
    std::atomic<core::u32> sequence_{0};
};

} // namespace sbr::net::session
