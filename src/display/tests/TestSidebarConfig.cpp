/**
 * @file TestSidebarConfig.cpp
 * @brief Unit tests for SidebarConfig::Builder and marker palette.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include "sbr/display/OrderMarker.hpp"
#include "sbr/display/SidebarConfig.hpp"

#include <set>
#include <string>

namespace sbr::display {

TEST_CASE("SidebarConfig defaults", "[display][config]")
{
    SidebarConfig cfg;
    CHECK(cfg.displayLimit() == 15);
    CHECK(cfg.reorderWorkaround());
    CHECK(cfg.position() == ScoreboardPosition::kSidebar);
    CHECK(cfg.sortOrder() == SortOrder::kDescending);
}

TEST_CASE("SidebarConfig builder keeps every field", "[display][config]")
{
    auto cfg = SidebarConfig::Builder{}
        .displayLimit(8)
        .reorderWorkaround(false)
        .position(ScoreboardPosition::kBelowName)
        .sortOrder(SortOrder::kAscending)
        .build();

    REQUIRE(cfg.has_value());
    CHECK(cfg->displayLimit() == 8);
    CHECK_FALSE(cfg->reorderWorkaround());
    CHECK(cfg->position() == ScoreboardPosition::kBelowName);
    CHECK(cfg->sortOrder() == SortOrder::kAscending);
}

TEST_CASE("SidebarConfig rejects limits the palette can not mark", "[display][config]")
{
    auto zero = SidebarConfig::Builder{}.displayLimit(0).build();
    REQUIRE_FALSE(zero.has_value());
    CHECK(zero.error().code() == core::ErrorCode::kInvalidArgument);

    auto tooMany = SidebarConfig::Builder{}.displayLimit(17).build();
    REQUIRE_FALSE(tooMany.has_value());
    CHECK(tooMany.error().code() == core::ErrorCode::kInvalidArgument);

    CHECK(SidebarConfig::Builder{}.displayLimit(16).build().has_value());
}

TEST_CASE("slotName matches the client slot identifiers", "[display][config]")
{
    CHECK(slotName(ScoreboardPosition::kPlayerList) == "list");
    CHECK(slotName(ScoreboardPosition::kSidebar) == "sidebar");
    CHECK(slotName(ScoreboardPosition::kBelowName) == "belowname");
}

TEST_CASE("OrderMarker palette is ordered and distinct", "[display][marker]")
{
    std::set<std::string> seen;
    for (core::u32 i = 0; i < OrderMarker::kPaletteSize; ++i)
    {
        const std::string marker{OrderMarker::forIndex(i)};
        REQUIRE(marker.size() == 3);
        CHECK(marker.substr(0, 2) == "\xC2\xA7");
        if (i > 0)
            CHECK(std::string{OrderMarker::forIndex(i - 1)} < marker);
        seen.insert(marker);
    }
    CHECK(seen.size() == OrderMarker::kPaletteSize);
    CHECK(OrderMarker::forIndex(0) == "\xC2\xA7" "0");
    CHECK(OrderMarker::forIndex(15) == "\xC2\xA7" "f");
    CHECK(OrderMarker::kReset == "\xC2\xA7" "r");
}

} // namespace sbr::display
