// /////////////////////////////////////////////////////////////////////////////
/// @file SidebarConfig.cpp
/// @brief SidebarConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/display/SidebarConfig.hpp>
#include <sbr/display/OrderMarker.hpp>
#include <sbr/core/Assert.hpp>

#include <string>

namespace sbr::display {

std::string_view slotName(ScoreboardPosition position) noexcept
{
    switch (position)
    {
    case ScoreboardPosition::kPlayerList: return "list";
    case ScoreboardPosition::kSidebar:    return "sidebar";
    case ScoreboardPosition::kBelowName:  return "belowname";
    }
    SBR_UNREACHABLE();
}

SidebarConfig::Builder& SidebarConfig::Builder::displayLimit(core::u32 rows) noexcept
{
    displayLimit_ = rows;
    return *this;
}

SidebarConfig::Builder& SidebarConfig::Builder::reorderWorkaround(bool enabled) noexcept
{
    reorderWorkaround_ = enabled;
    return *this;
}

SidebarConfig::Builder& SidebarConfig::Builder::position(ScoreboardPosition position) noexcept
{
    position_ = position;
    return *this;
}

SidebarConfig::Builder& SidebarConfig::Builder::sortOrder(SortOrder order) noexcept
{
    sortOrder_ = order;
    return *this;
}

core::Expected<SidebarConfig> SidebarConfig::Builder::build() const
{
    if (displayLimit_ == 0 || displayLimit_ > OrderMarker::kPaletteSize)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "displayLimit must be within [1, "
                               + std::to_string(OrderMarker::kPaletteSize) + "]");
    }

    SidebarConfig cfg;
    cfg.displayLimit_      = displayLimit_;
    cfg.reorderWorkaround_ = reorderWorkaround_;
    cfg.position_          = position_;
    cfg.sortOrder_         = sortOrder_;
    return cfg;
}

} // namespace sbr::display
