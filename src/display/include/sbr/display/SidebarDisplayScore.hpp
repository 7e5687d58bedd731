// /////////////////////////////////////////////////////////////////////////////
/// @file SidebarDisplayScore.hpp
/// @brief One row currently shown on a client's sidebar.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/display/ScoreInfo.hpp>
#include <sbr/scoreboard/ScoreEntry.hpp>
#include <sbr/scoreboard/Team.hpp>
#include <sbr/concurrency/SpinLock.hpp>
#include <sbr/core/Types.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <string>

namespace sbr::display {

// /////////////////////////////////////////////////////////////////////////////
/// @class SidebarDisplayScore
/// @brief Displayed row with a stable identity and a cached outbound record.
///
/// Owned by a SidebarSlot and reused across renders for as long as its name
/// stays on the sidebar.  Everything except the team association is touched
/// by the render thread only; the team, its last seen decoration revision
/// and the dirty flags sit behind @c lock_ because SidebarSlot::setTeamFor
/// may run on any thread.
// /////////////////////////////////////////////////////////////////////////////
class SidebarDisplayScore final : public core::NonMovable<SidebarDisplayScore>
{
public:
    /// @brief Reasons a row has to be sent again.
    enum Dirty : core::u8
    {
        kClean  = 0,
        kNew    = 1 << 0,
        kScore  = 1 << 1,
        kMarker = 1 << 2,
        kTeam   = 1 << 3,
    };

    /// @brief Creates a row that has never been sent.
    /// @param id    Identity allocated by the team store.
    /// @param entry Score row this display score shows.
    /// @param team  Team currently listing the entry, or nullptr.
    SidebarDisplayScore(core::u64 id, const scoreboard::ScoreEntry& entry,
                        std::shared_ptr<scoreboard::Team> team);
    ~SidebarDisplayScore();

    [[nodiscard]] core::u64          id() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] core::i64          score() const noexcept;

    /// @brief Takes the latest value of the backing row.
    void refresh(const scoreboard::ScoreEntry& entry) noexcept;

    /// @brief Rank within a tie run, or nullopt outside of one.
    [[nodiscard]] std::optional<core::u32> order() const noexcept;
    void order(std::optional<core::u32> rank) noexcept;

    [[nodiscard]] std::shared_ptr<scoreboard::Team> team() const;

    /// @brief Associates @p team; a no-op if it is already the current one.
    void team(std::shared_ptr<scoreboard::Team> team);

    /// @brief Drops the team if it is being removed or no longer lists this
    ///        row's name.
    /// @return @c true if the association was cleared.
    bool clearStaleTeam();

    /// @brief @c true if the cached record is out of date.
    [[nodiscard]] bool shouldUpdate() const;

    /// @brief Rebuilds the cached record and consumes the dirty flags.
    void update(const std::string& objectiveId);

    /// @brief @c true once the row has been sent at least once.
    [[nodiscard]] bool exists() const noexcept;

    /// @brief @c true if the last update changed nothing but the value.
    [[nodiscard]] bool onlyScoreValueChanged() const noexcept;

    [[nodiscard]] const ScoreInfo& cachedInfo() const noexcept;

private:
    void markDirty(Dirty reason) noexcept;

    const core::u64          id_;
    const std::string        name_;
    core::i64                score_;
    std::optional<core::u32> order_;
    ScoreInfo                cachedInfo_;
    bool                     exists_{false};
    bool                     onlyScoreValueChanged_{false};

    mutable concurrency::SpinLock     lock_;
    std::shared_ptr<scoreboard::Team> team_;
    core::u64                         teamRevision_{0};
    core::u8                          dirty_{kNew};
};

} // namespace sbr::display
