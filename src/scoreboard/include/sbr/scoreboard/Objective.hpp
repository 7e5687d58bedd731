// /////////////////////////////////////////////////////////////////////////////
/// @file Objective.hpp
/// @brief Named scoring category and its score rows.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/scoreboard/IScoreSource.hpp>
#include <sbr/core/Types.hpp>
#include <sbr/core/Expected.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sbr::scoreboard {

// /////////////////////////////////////////////////////////////////////////////
/// @class Objective
/// @brief Thread-safe score store for one objective.
///
/// Rows are keyed by entity name, so a name appears at most once.  Writers
/// (packet handlers) and the render thread may run concurrently; readers
/// always get a copy taken under the lock.
// /////////////////////////////////////////////////////////////////////////////
class Objective final : public IScoreSource, public core::NonMovable<Objective>
{
public:
    /// @brief Constructs an empty objective.
    /// @param id          Wire identifier.
    /// @param displayName Sidebar title.
    Objective(std::string id, std::string displayName);
    ~Objective() override;

    [[nodiscard]] std::string objectiveId() const override;
    [[nodiscard]] std::string displayName() const override;
    void setDisplayName(std::string displayName);

    /// @brief Creates or overwrites the score of @p name.
    /// @return kInvalidArgument for an empty name.
    [[nodiscard]] core::Expected<void> setScore(const std::string& name, core::i64 score);

    /// @brief Shows or hides an existing row without touching its value.
    /// @return kNotFound if @p name has no score.
    [[nodiscard]] core::Expected<void> setHidden(const std::string& name, bool hidden);

    /// @brief Deletes the row of @p name.
    /// @return kNotFound if @p name has no score.
    [[nodiscard]] core::Expected<void> resetScore(const std::string& name);

    /// @brief Returns the row of @p name, if any.
    [[nodiscard]] std::optional<ScoreEntry> score(const std::string& name) const;

    [[nodiscard]] std::vector<ScoreEntry> listScores() const override;

    [[nodiscard]] core::u32 size() const;

private:
    const std::string                 id_;
    mutable std::mutex                mutex_;
    std::string                       displayName_;
    std::map<std::string, ScoreEntry> scores_;
};

} // namespace sbr::scoreboard
