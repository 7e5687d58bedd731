// /////////////////////////////////////////////////////////////////////////////
/// @file Scoreboard.cpp
/// @brief Scoreboard implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/scoreboard/Scoreboard.hpp>
#include <sbr/core/Constants.hpp>
#include <sbr/core/Log.hpp>

#include <atomic>
#include <map>
#include <mutex>

namespace sbr::scoreboard {

struct Scoreboard::Impl
{
    mutable std::mutex                                 mutex;
    std::map<std::string, std::shared_ptr<Objective>> objectives;
    std::map<std::string, std::shared_ptr<Team>>      teams;
    std::atomic<core::u64>                             nextId{core::kFirstScoreId};
};

Scoreboard::Scoreboard()
    : impl_{std::make_unique<Impl>()}
{}

Scoreboard::~Scoreboard() = default;

core::Expected<std::shared_ptr<Objective>> Scoreboard::registerObjective(
    const std::string& id, std::string displayName)
{
    if (id.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Objective id must not be empty");
    }

    std::lock_guard<std::mutex> lock{impl_->mutex};
    if (impl_->objectives.contains(id))
    {
        core::Log::warn("SCOREBOARD", "Scoreboard: objective registered twice");
        return core::makeError(core::ErrorCode::kAlreadyExists, "Objective already exists: " + id);
    }

    auto objective = std::make_shared<Objective>(id, std::move(displayName));
    impl_->objectives.emplace(id, objective);
    return objective;
}

core::Expected<void> Scoreboard::removeObjective(const std::string& id)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    if (impl_->objectives.erase(id) == 0)
    {
        return core::makeError(core::ErrorCode::kNotFound, "Objective not found: " + id);
    }
    return {};
}

std::shared_ptr<Objective> Scoreboard::objective(const std::string& id) const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    auto it = impl_->objectives.find(id);
    return (it != impl_->objectives.end()) ? it->second : nullptr;
}

core::Expected<std::shared_ptr<Team>> Scoreboard::registerTeam(const std::string& name)
{
    if (name.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Team name must not be empty");
    }

    std::lock_guard<std::mutex> lock{impl_->mutex};
    if (impl_->teams.contains(name))
    {
        core::Log::warn("SCOREBOARD", "Scoreboard: team registered twice");
        return core::makeError(core::ErrorCode::kAlreadyExists, "Team already exists: " + name);
    }

    auto team = std::make_shared<Team>(name);
    impl_->teams.emplace(name, team);
    return team;
}

core::Expected<void> Scoreboard::removeTeam(const std::string& name)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    auto it = impl_->teams.find(name);
    if (it == impl_->teams.end())
    {
        return core::makeError(core::ErrorCode::kNotFound, "Team not found: " + name);
    }

    it->second->flagForRemoval();
    impl_->teams.erase(it);
    return {};
}

std::shared_ptr<Team> Scoreboard::team(const std::string& name) const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    auto it = impl_->teams.find(name);
    return (it != impl_->teams.end()) ? it->second : nullptr;
}

std::shared_ptr<Team> Scoreboard::teamFor(const std::string& entity) const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    for (const auto& [name, team] : impl_->teams)
    {
        if (!team->shouldRemove() && team->hasEntity(entity))
        {
            return team;
        }
    }
    return nullptr;
}

core::u64 Scoreboard::nextScoreId()
{
    return impl_->nextId.fetch_add(1, std::memory_order_relaxed);
}

core::u32 Scoreboard::objectiveCount() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return static_cast<core::u32>(impl_->objectives.size());
}

core::u32 Scoreboard::teamCount() const
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return static_cast<core::u32>(impl_->teams.size());
}

} // namespace sbr::scoreboard
