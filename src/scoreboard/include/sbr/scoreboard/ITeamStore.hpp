// /////////////////////////////////////////////////////////////////////////////
/// @file ITeamStore.hpp
/// @brief Team lookup and score identity allocation used by display slots.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/scoreboard/Team.hpp>
#include <sbr/core/Types.hpp>

#include <memory>
#include <string>

namespace sbr::scoreboard {

// /////////////////////////////////////////////////////////////////////////////
/// @class ITeamStore
/// @brief Per-session scoreboard services a display slot depends on.
// /////////////////////////////////////////////////////////////////////////////
class ITeamStore
{
public:
    virtual ~ITeamStore() = default;

    /// @brief Team currently listing @p entity, or nullptr.
    [[nodiscard]] virtual std::shared_ptr<Team> teamFor(const std::string& entity) const = 0;

    /// @brief Allocates a never-reused identity for a displayed score.
    [[nodiscard]] virtual core::u64 nextScoreId() = 0;
};

} // namespace sbr::scoreboard
