// /////////////////////////////////////////////////////////////////////////////
/// @file SidebarDisplayScore.cpp
/// @brief SidebarDisplayScore implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/display/SidebarDisplayScore.hpp>
#include <sbr/display/OrderMarker.hpp>

#include <utility>

namespace sbr::display {

SidebarDisplayScore::SidebarDisplayScore(core::u64 id, const scoreboard::ScoreEntry& entry,
                                         std::shared_ptr<scoreboard::Team> team)
    : id_{id}
    , name_{entry.name}
    , score_{entry.score}
    , team_{std::move(team)}
{}

SidebarDisplayScore::~SidebarDisplayScore() = default;

core::u64          SidebarDisplayScore::id() const noexcept    { return id_; }
const std::string& SidebarDisplayScore::name() const noexcept  { return name_; }
core::i64          SidebarDisplayScore::score() const noexcept { return score_; }

void SidebarDisplayScore::refresh(const scoreboard::ScoreEntry& entry) noexcept
{
    if (entry.score == score_)
    {
        return;
    }
    score_ = entry.score;
    markDirty(kScore);
}

std::optional<core::u32> SidebarDisplayScore::order() const noexcept { return order_; }

void SidebarDisplayScore::order(std::optional<core::u32> rank) noexcept
{
    if (order_ == rank)
    {
        return;
    }
    order_ = rank;
    markDirty(kMarker);
}

std::shared_ptr<scoreboard::Team> SidebarDisplayScore::team() const
{
    concurrency::SpinLockGuard guard{lock_};
    return team_;
}

void SidebarDisplayScore::team(std::shared_ptr<scoreboard::Team> team)
{
    // the previous team may be the last reference; release it outside the lock
    std::shared_ptr<scoreboard::Team> previous;
    {
        concurrency::SpinLockGuard guard{lock_};
        if (team_ == team)
        {
            return;
        }
        previous = std::exchange(team_, std::move(team));
        dirty_ |= kTeam;
    }
}

bool SidebarDisplayScore::clearStaleTeam()
{
    const auto current = team();
    if (!current)
    {
        return false;
    }

    // entities mostly leave teams without the rows being told
    if (!current->shouldRemove() && current->hasEntity(name_))
    {
        return false;
    }

    std::shared_ptr<scoreboard::Team> previous;
    {
        concurrency::SpinLockGuard guard{lock_};
        if (team_ != current)
        {
            // a concurrent setTeamFor won; its team gets checked next render
            return false;
        }
        previous = std::exchange(team_, nullptr);
        dirty_ |= kTeam;
    }
    return true;
}

bool SidebarDisplayScore::shouldUpdate() const
{
    concurrency::SpinLockGuard guard{lock_};
    if (dirty_ != kClean)
    {
        return true;
    }
    return team_ && team_->revision() != teamRevision_;
}

void SidebarDisplayScore::update(const std::string& objectiveId)
{
    std::shared_ptr<scoreboard::Team> team;
    core::u8 reasons = kClean;
    {
        concurrency::SpinLockGuard guard{lock_};
        team    = team_;
        reasons = dirty_;
        dirty_  = kClean;

        const core::u64 revision = team ? team->revision() : 0;
        if (team && revision != teamRevision_)
        {
            reasons |= kTeam;
        }
        teamRevision_ = revision;
    }

    std::string finalName;
    if (order_)
    {
        finalName += OrderMarker::forIndex(*order_);
        finalName += OrderMarker::kReset;
    }
    finalName += team ? team->displayName(name_) : name_;

    onlyScoreValueChanged_ = (reasons == kScore);
    exists_                = true;

    cachedInfo_.scoreboardId = id_;
    cachedInfo_.objectiveId  = objectiveId;
    cachedInfo_.score        = score_;
    cachedInfo_.name         = std::move(finalName);
}

bool SidebarDisplayScore::exists() const noexcept                { return exists_; }
bool SidebarDisplayScore::onlyScoreValueChanged() const noexcept { return onlyScoreValueChanged_; }
const ScoreInfo& SidebarDisplayScore::cachedInfo() const noexcept { return cachedInfo_; }

void SidebarDisplayScore::markDirty(Dirty reason) noexcept
{
    concurrency::SpinLockGuard guard{lock_};
    dirty_ |= reason;
}

} // namespace sbr::display
