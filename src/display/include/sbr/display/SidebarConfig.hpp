// /////////////////////////////////////////////////////////////////////////////
/// @file SidebarConfig.hpp
/// @brief Sidebar slot configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <sbr/core/Types.hpp>
#include <sbr/core/Constants.hpp>
#include <sbr/core/Expected.hpp>

#include <string_view>

namespace sbr::display {

/// @brief Client display slot an objective is shown in.
enum class ScoreboardPosition : core::u8
{
    kPlayerList,
    kSidebar,
    kBelowName
};

/// @brief Client-side ordering of rows by value.
enum class SortOrder : core::u8
{
    kAscending  = 0,
    kDescending = 1
};

/// @brief Wire name of @p position ("list", "sidebar", "belowname").
[[nodiscard]] std::string_view slotName(ScoreboardPosition position) noexcept;

/// @brief Immutable sidebar configuration.
class SidebarConfig
{
public:
    /// @brief Fluent builder for SidebarConfig.
    class Builder
    {
    public:
        Builder& displayLimit(core::u32 rows) noexcept;
        Builder& reorderWorkaround(bool enabled) noexcept;
        Builder& position(ScoreboardPosition position) noexcept;
        Builder& sortOrder(SortOrder order) noexcept;

        /// @return kInvalidArgument when the row limit is zero or exceeds
        ///         the order marker palette.
        [[nodiscard]] core::Expected<SidebarConfig> build() const;

    private:
        core::u32          displayLimit_{core::kSidebarDisplayLimit};
        bool               reorderWorkaround_{true};
        ScoreboardPosition position_{ScoreboardPosition::kSidebar};
        SortOrder          sortOrder_{SortOrder::kDescending};
    };

    /// @brief Default configuration (15 rows, work-around on, sidebar).
    SidebarConfig() = default;

    [[nodiscard]] core::u32          displayLimit()      const noexcept { return displayLimit_; }
    [[nodiscard]] bool               reorderWorkaround() const noexcept { return reorderWorkaround_; }
    [[nodiscard]] ScoreboardPosition position()          const noexcept { return position_; }
    [[nodiscard]] SortOrder          sortOrder()         const noexcept { return sortOrder_; }

private:
    friend class Builder;

    core::u32          displayLimit_{core::kSidebarDisplayLimit};
    bool               reorderWorkaround_{true};
    ScoreboardPosition position_{ScoreboardPosition::kSidebar};
    SortOrder          sortOrder_{SortOrder::kDescending};
};

} // namespace sbr::display
