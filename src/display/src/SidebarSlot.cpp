// /////////////////////////////////////////////////////////////////////////////
/// @file SidebarSlot.cpp
/// @brief SidebarSlot implementation: candidate selection, identity reuse,
///        tie-break markers and batch emission.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/display/SidebarSlot.hpp>
#include <sbr/display/OrderMarker.hpp>
#include <sbr/core/Assert.hpp>
#include <sbr/core/CaseInsensitive.hpp>
#include <sbr/core/Log.hpp>

#include <algorithm>

namespace sbr::display {

namespace {

// value descending, then name ascending ignoring case
[[nodiscard]] bool displayOrder(const scoreboard::ScoreEntry& lhs,
                                const scoreboard::ScoreEntry& rhs) noexcept
{
    if (lhs.score != rhs.score)
    {
        return lhs.score > rhs.score;
    }
    return core::lessIgnoreCase(lhs.name, rhs.name);
}

} // anonymous namespace

SidebarSlot::SidebarSlot(SidebarConfig config, scoreboard::ITeamStore& teams, ISidebarSink& sink)
    : config_{config}
    , teams_{teams}
    , sink_{sink}
    , displayScores_{std::make_shared<const DisplayList>()}
{
    SBR_VERIFY(config_.displayLimit() > 0);
    SBR_VERIFY(config_.displayLimit() <= OrderMarker::kPaletteSize);
    workingCopy_.reserve(config_.displayLimit());
}

SidebarSlot::~SidebarSlot() = default;

const SidebarConfig& SidebarSlot::config() const noexcept { return config_; }

std::shared_ptr<const DisplayList> SidebarSlot::displayScores() const noexcept
{
    return displayScores_.load(std::memory_order_acquire);
}

void SidebarSlot::publish(std::shared_ptr<const DisplayList> rows) noexcept
{
    displayScores_.store(std::move(rows), std::memory_order_release);
}

RenderResult SidebarSlot::render(const scoreboard::IScoreSource& source,
                                 scoreboard::UpdateType updateType)
{
    RenderResult result;
    const std::string objectiveId = source.objectiveId();

    if (updateType == scoreboard::UpdateType::kRemove)
    {
        // the client drops every row together with the objective
        sink_.emitDestroySidebar(objectiveId);
        publish(std::make_shared<const DisplayList>());
        workingCopy_.clear();
        core::Log::info("SIDEBAR", "SidebarSlot: objective removed");
        return result;
    }

    const auto candidates = selectCandidates(source);

    auto rows = std::make_shared<DisplayList>();
    rows->reserve(candidates.size());
    for (const auto& candidate : candidates)
    {
        rows->push_back(takeOrCreate(candidate));
    }

    // publish before anything else: setTeamFor must see the new order as
    // soon as possible, even when no row was added or removed
    publish(rows);

    // rows still in the working copy were not matched, so they left the
    // sidebar; every snapshot row has been sent at least once
    for (const auto& stale : workingCopy_)
    {
        result.remove.push_back(stale->cachedInfo());
    }

    mirrorSnapshot(*rows);
    assignOrderMarkers(*rows);

    const bool objectiveAdd    = updateType == scoreboard::UpdateType::kAdd;
    const bool objectiveUpdate = updateType == scoreboard::UpdateType::kUpdate;
    const bool transition      = objectiveAdd || objectiveUpdate;

    for (const auto& score : *rows)
    {
        bool add = transition;
        const bool exists = score->exists();

        if (score->clearStaleTeam())
        {
            add = true;
        }

        if (score->shouldUpdate())
        {
            score->update(objectiveId);
            add = true;
        }

        if (add)
        {
            result.add.push_back(score->cachedInfo());
        }

        // The client does not move a row whose text changed in place; only a
        // remove followed by an add puts it back in order.  Pure value
        // changes are redrawn correctly, and rows about to be (re)created
        // with the objective need no removal.
        if (add && exists && !transition && config_.reorderWorkaround()
            && !score->onlyScoreValueChanged())
        {
            result.remove.push_back(score->cachedInfo());
        }
    }

    if (objectiveUpdate)
    {
        sink_.emitDestroySidebar(objectiveId);
    }

    if (transition)
    {
        sink_.emitCreateOrShowSidebar(objectiveId, source.displayName(),
                                      config_.position(), config_.sortOrder());
        core::Log::info("SIDEBAR", objectiveAdd ? "SidebarSlot: objective shown"
                                                : "SidebarSlot: objective redrawn");
    }

    if (!result.empty() && core::Log::enabled(core::LogLevel::kDebug))
    {
        core::Log::debug("SIDEBAR", "SidebarSlot: render rows=" + std::to_string(rows->size())
                                    + " add=" + std::to_string(result.add.size())
                                    + " remove=" + std::to_string(result.remove.size()));
    }

    return result;
}

void SidebarSlot::setTeamFor(const std::shared_ptr<scoreboard::Team>& team,
                             const std::unordered_set<std::string>& entities)
{
    const auto rows = displayScores();
    for (const auto& score : *rows)
    {
        if (entities.contains(score->name()))
        {
            score->team(team);
        }
    }
}

std::vector<scoreboard::ScoreEntry> SidebarSlot::selectCandidates(
    const scoreboard::IScoreSource& source) const
{
    auto candidates = source.listScores();

    std::erase_if(candidates, [](const scoreboard::ScoreEntry& entry) { return entry.hidden; });

    // stable, so rows comparing equal keep the source order
    std::ranges::stable_sort(candidates, displayOrder);

    if (candidates.size() > config_.displayLimit())
    {
        candidates.resize(config_.displayLimit());
    }
    return candidates;
}

std::shared_ptr<SidebarDisplayScore> SidebarSlot::takeOrCreate(
    const scoreboard::ScoreEntry& candidate)
{
    // first match wins should the source ever yield a name twice
    auto it = std::ranges::find_if(workingCopy_, [&](const auto& score) {
        return score->name() == candidate.name;
    });

    if (it != workingCopy_.end())
    {
        auto score = std::move(*it);
        workingCopy_.erase(it);
        score->refresh(candidate);
        return score;
    }

    return std::make_shared<SidebarDisplayScore>(teams_.nextScoreId(), candidate,
                                                 teams_.teamFor(candidate.name));
}

void SidebarSlot::mirrorSnapshot(const DisplayList& rows)
{
    for (core::usize i = 0; i < rows.size(); ++i)
    {
        if (i < workingCopy_.size())
        {
            workingCopy_[i] = rows[i];
        }
        else
        {
            workingCopy_.push_back(rows[i]);
        }
    }

    // leftovers beyond the new row count were already queued for removal
    workingCopy_.resize(rows.size());
}

void assignOrderMarkers(const DisplayList& rows)
{
    core::usize runStart = 0;
    for (core::usize i = 1; i <= rows.size(); ++i)
    {
        if (i < rows.size() && rows[i]->score() == rows[runStart]->score())
        {
            continue;
        }

        const core::usize runLength = i - runStart;
        for (core::usize j = runStart; j < i; ++j)
        {
            rows[j]->order(runLength > 1
                               ? std::optional<core::u32>{static_cast<core::u32>(j - runStart)}
                               : std::nullopt);
        }
        runStart = i;
    }
}

} // namespace sbr::display
