// /////////////////////////////////////////////////////////////////////////////
/// @file SidebarSlot.hpp
/// @brief Reconciles an objective's scores with a client's sidebar.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/display/ISidebarSink.hpp>
#include <sbr/display/ScoreInfo.hpp>
#include <sbr/display/SidebarConfig.hpp>
#include <sbr/display/SidebarDisplayScore.hpp>
#include <sbr/scoreboard/IScoreSource.hpp>
#include <sbr/scoreboard/ITeamStore.hpp>
#include <sbr/scoreboard/ScoreEntry.hpp>
#include <sbr/core/Types.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace sbr::display {

/// @brief Ordered rows as shown on the client.
using DisplayList = std::vector<std::shared_ptr<SidebarDisplayScore>>;

// /////////////////////////////////////////////////////////////////////////////
/// @class SidebarSlot
/// @brief Per-session sidebar state and the render pass computing the
///        add/remove batches that bring the client in sync.
///
/// The client shows at most @c displayLimit rows, has no secondary sort key
/// and does not reorder a row whose text changed unless it is removed and
/// added again.  The render pass works around all three.
///
/// Threading: @ref render is serialised by the caller.  @ref setTeamFor and
/// @ref displayScores may be called from any thread at any time.  The live
/// list is replaced as a whole through an atomic shared pointer, so readers
/// see either the previous or the new list; the working copy used while
/// matching is private to the render thread.  Off the render thread only
/// @c id(), @c name() and the spin-locked @c team() / @c team(team) of a
/// published row may be used; @c score(), @c order(), @c exists(),
/// @c onlyScoreValueChanged() and @c cachedInfo() are written by
/// @ref render without synchronisation.
// /////////////////////////////////////////////////////////////////////////////
class SidebarSlot final : public core::NonMovable<SidebarSlot>
{
public:
    /// @param config Row limit, position and work-around switch.
    /// @param teams  Team lookup and identity allocation of the session.
    /// @param sink   Receiver of objective create/destroy directives.
    SidebarSlot(SidebarConfig config, scoreboard::ITeamStore& teams, ISidebarSink& sink);
    ~SidebarSlot();

    /// @brief Runs one reconciliation pass.
    /// @param source     Scores of the displayed objective.
    /// @param updateType Objective transition since the previous render;
    ///                   the caller resets its own copy afterwards.
    /// @return Rows to remove then add, in transmission order.
    [[nodiscard]] RenderResult render(const scoreboard::IScoreSource& source,
                                      scoreboard::UpdateType updateType);

    /// @brief Associates @p team with every displayed row named in
    ///        @p entities.  Rows not on the sidebar are left alone: they
    ///        look their team up when they get displayed.
    void setTeamFor(const std::shared_ptr<scoreboard::Team>& team,
                    const std::unordered_set<std::string>& entities);

    /// @brief Currently published rows, in display order.
    /// @note Callable from any thread, but other threads may only read the
    ///       identity, name and team of the returned rows.
    [[nodiscard]] std::shared_ptr<const DisplayList> displayScores() const noexcept;

    [[nodiscard]] const SidebarConfig& config() const noexcept;

private:
    [[nodiscard]] std::vector<scoreboard::ScoreEntry> selectCandidates(
        const scoreboard::IScoreSource& source) const;

    [[nodiscard]] std::shared_ptr<SidebarDisplayScore> takeOrCreate(
        const scoreboard::ScoreEntry& candidate);

    void mirrorSnapshot(const DisplayList& rows);

    void publish(std::shared_ptr<const DisplayList> rows) noexcept;

    SidebarConfig           config_;
    scoreboard::ITeamStore& teams_;
    ISidebarSink&           sink_;

    std::atomic<std::shared_ptr<const DisplayList>> displayScores_;
    DisplayList                                     workingCopy_;
};

/// @brief Assigns rank markers to every run of two or more equal scores
///        and clears them everywhere else.
void assignOrderMarkers(const DisplayList& rows);

} // namespace sbr::display
