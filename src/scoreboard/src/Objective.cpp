// /////////////////////////////////////////////////////////////////////////////
/// @file Objective.cpp
/// @brief Objective implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/scoreboard/Objective.hpp>
#include <sbr/core/Log.hpp>

namespace sbr::scoreboard {

Objective::Objective(std::string id, std::string displayName)
    : id_{std::move(id)}
    , displayName_{std::move(displayName)}
{}

Objective::~Objective() = default;

std::string Objective::objectiveId() const { return id_; }

std::string Objective::displayName() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return displayName_;
}

void Objective::setDisplayName(std::string displayName)
{
    std::lock_guard<std::mutex> lock{mutex_};
    displayName_ = std::move(displayName);
}

core::Expected<void> Objective::setScore(const std::string& name, core::i64 score)
{
    if (name.empty())
    {
        core::Log::warn("SCOREBOARD", "Objective: rejected score with empty name");
        return core::makeError(core::ErrorCode::kInvalidArgument, "Score name must not be empty");
    }

    std::lock_guard<std::mutex> lock{mutex_};
    auto [it, inserted] = scores_.try_emplace(name, ScoreEntry{name, score, false});
    if (!inserted)
    {
        it->second.score = score;
    }
    return {};
}

core::Expected<void> Objective::setHidden(const std::string& name, bool hidden)
{
    std::lock_guard<std::mutex> lock{mutex_};
    auto it = scores_.find(name);
    if (it == scores_.end())
    {
        return core::makeError(core::ErrorCode::kNotFound, "No score for " + name);
    }
    it->second.hidden = hidden;
    return {};
}

core::Expected<void> Objective::resetScore(const std::string& name)
{
    std::lock_guard<std::mutex> lock{mutex_};
    if (scores_.erase(name) == 0)
    {
        return core::makeError(core::ErrorCode::kNotFound, "No score for " + name);
    }
    return {};
}

std::optional<ScoreEntry> Objective::score(const std::string& name) const
{
    std::lock_guard<std::mutex> lock{mutex_};
    auto it = scores_.find(name);
    if (it == scores_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ScoreEntry> Objective::listScores() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    std::vector<ScoreEntry> out;
    out.reserve(scores_.size());
    for (const auto& [name, entry] : scores_)
    {
        out.push_back(entry);
    }
    return out;
}

core::u32 Objective::size() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return static_cast<core::u32>(scores_.size());
}

} // namespace sbr::scoreboard
