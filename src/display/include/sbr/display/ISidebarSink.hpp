// /////////////////////////////////////////////////////////////////////////////
/// @file ISidebarSink.hpp
/// @brief Objective-level directives emitted by a sidebar render.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/display/SidebarConfig.hpp>

#include <string>

namespace sbr::display {

// /////////////////////////////////////////////////////////////////////////////
/// @class ISidebarSink
/// @brief Receiver of whole-sidebar lifecycle directives.
///
/// Invoked from the render thread before the render returns its batches,
/// so implementations that queue packets keep the directives ahead of the
/// rows.  Fire-and-forget: nothing is reported back to the slot.
///
/// Concrete implementations:
///   - @c net::session::SidebarChannel: encodes them into packets.
// /////////////////////////////////////////////////////////////////////////////
class ISidebarSink
{
public:
    virtual ~ISidebarSink() = default;

    /// @brief The client must drop the objective and every row it shows.
    virtual void emitDestroySidebar(const std::string& objectiveId) = 0;

    /// @brief The client must (re)create the objective in @p position.
    virtual void emitCreateOrShowSidebar(const std::string& objectiveId,
                                         const std::string& title,
                                         ScoreboardPosition position,
                                         SortOrder sortOrder) = 0;
};

} // namespace sbr::display
