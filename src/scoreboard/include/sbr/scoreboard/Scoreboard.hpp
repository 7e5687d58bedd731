// /////////////////////////////////////////////////////////////////////////////
/// @file Scoreboard.hpp
/// @brief Per-session registry of objectives and teams.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/scoreboard/ITeamStore.hpp>
#include <sbr/scoreboard/Objective.hpp>
#include <sbr/scoreboard/Team.hpp>
#include <sbr/core/Types.hpp>
#include <sbr/core/Expected.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <memory>
#include <string>

namespace sbr::scoreboard {

// /////////////////////////////////////////////////////////////////////////////
/// @class Scoreboard
/// @brief Objective/team registry and score identity allocator.
///
/// Objectives and teams are handed out as shared pointers: a display slot
/// may keep a team alive after it was removed here, and sees it through
/// Team::shouldRemove().
// /////////////////////////////////////////////////////////////////////////////
class Scoreboard final : public ITeamStore, public core::NonMovable<Scoreboard>
{
public:
    Scoreboard();
    ~Scoreboard() override;

    /// @brief Creates a new objective.
    /// @return The objective, or kAlreadyExists / kInvalidArgument.
    [[nodiscard]] core::Expected<std::shared_ptr<Objective>> registerObjective(
        const std::string& id, std::string displayName);

    /// @brief Forgets an objective.
    [[nodiscard]] core::Expected<void> removeObjective(const std::string& id);

    /// @brief Finds an objective by id, or nullptr.
    [[nodiscard]] std::shared_ptr<Objective> objective(const std::string& id) const;

    /// @brief Creates a new team.
    /// @return The team, or kAlreadyExists / kInvalidArgument.
    [[nodiscard]] core::Expected<std::shared_ptr<Team>> registerTeam(const std::string& name);

    /// @brief Flags a team for removal and forgets it.
    [[nodiscard]] core::Expected<void> removeTeam(const std::string& name);

    /// @brief Finds a team by name, or nullptr.
    [[nodiscard]] std::shared_ptr<Team> team(const std::string& name) const;

    /// @brief First team (by name) listing @p entity that is not being removed.
    [[nodiscard]] std::shared_ptr<Team> teamFor(const std::string& entity) const override;

    [[nodiscard]] core::u64 nextScoreId() override;

    [[nodiscard]] core::u32 objectiveCount() const;
    [[nodiscard]] core::u32 teamCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sbr::scoreboard
