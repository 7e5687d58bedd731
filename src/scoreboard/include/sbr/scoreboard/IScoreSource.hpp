// /////////////////////////////////////////////////////////////////////////////
/// @file IScoreSource.hpp
/// @brief Read side of an objective, as consumed by display slots.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/scoreboard/ScoreEntry.hpp>

#include <string>
#include <vector>

namespace sbr::scoreboard {

// /////////////////////////////////////////////////////////////////////////////
/// @class IScoreSource
/// @brief Snapshot access to the scores of one objective.
///
/// Concrete implementations:
///   - @c Objective: the in-process scoreboard store.
// /////////////////////////////////////////////////////////////////////////////
class IScoreSource
{
public:
    virtual ~IScoreSource() = default;

    /// @brief Returns a consistent copy of every score, hidden ones included.
    [[nodiscard]] virtual std::vector<ScoreEntry> listScores() const = 0;

    /// @brief Identifier of the objective on the wire.
    [[nodiscard]] virtual std::string objectiveId() const = 0;

    /// @brief Title shown above the sidebar.
    [[nodiscard]] virtual std::string displayName() const = 0;
};

} // namespace sbr::scoreboard
