// /////////////////////////////////////////////////////////////////////////////
/// @file Team.hpp
/// @brief Team membership and name decoration.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/core/Types.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <atomic>
#include <initializer_list>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>

namespace sbr::scoreboard {

// /////////////////////////////////////////////////////////////////////////////
/// @class Team
/// @brief Named set of entities sharing a prefix/suffix.
///
/// Mutated by the scoreboard owner while sidebar renders read it from
/// another thread, so every accessor is internally synchronised.  The
/// removal flag is raised before the scoreboard forgets the team so rows
/// still holding a reference notice on their next render.
// /////////////////////////////////////////////////////////////////////////////
class Team final : public core::NonMovable<Team>
{
public:
    explicit Team(std::string name);
    ~Team();

    [[nodiscard]] const std::string& name() const noexcept;

    /// @brief Adds entity names; returns how many were not yet members.
    core::u32 addEntities(std::span<const std::string> entities);
    core::u32 addEntities(std::initializer_list<std::string> entities);

    /// @brief Removes entity names; returns how many were members.
    core::u32 removeEntities(std::span<const std::string> entities);
    core::u32 removeEntities(std::initializer_list<std::string> entities);

    [[nodiscard]] bool hasEntity(const std::string& entity) const;
    [[nodiscard]] std::unordered_set<std::string> entities() const;

    void setPrefix(std::string prefix);
    void setSuffix(std::string suffix);

    /// @brief @p entity wrapped in the team prefix and suffix.
    [[nodiscard]] std::string displayName(std::string_view entity) const;

    /// @brief Bumped whenever the decoration changes.
    [[nodiscard]] core::u64 revision() const noexcept;

    void flagForRemoval() noexcept;
    [[nodiscard]] bool shouldRemove() const noexcept;

private:
    const std::string               name_;
    mutable std::mutex              mutex_;
    std::unordered_set<std::string> entities_;
    std::string                     prefix_;
    std::string                     suffix_;
    std::atomic<core::u64>          revision_{0};
    std::atomic<bool>               remove_{false};
};

} // namespace sbr::scoreboard
