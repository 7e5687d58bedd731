/**
 * @file TestSidebarSlot.cpp
 * @brief Unit tests for SidebarSlot reconciliation.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include "SidebarFixtures.hpp"

#include "sbr/display/SidebarSlot.hpp"
#include "sbr/scoreboard/Scoreboard.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sbr::display::test {

using scoreboard::UpdateType;

namespace {

SidebarConfig makeConfig(bool workaround = true, core::u32 limit = 15)
{
    auto config = SidebarConfig::Builder{}.displayLimit(limit).reorderWorkaround(workaround).build();
    REQUIRE(config.has_value());
    return *config;
}

} // namespace

TEST_CASE("SidebarSlot first render adds every row in display order", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("C", 5);
    source.set("B", 10);
    source.set("A", 10);

    auto result = slot.render(source, UpdateType::kNothing);

    auto rows = slot.displayScores();
    REQUIRE(namesOf(*rows) == std::vector<std::string>{"A", "B", "C"});
    CHECK((*rows)[0]->order() == 0u);
    CHECK((*rows)[1]->order() == 1u);
    CHECK_FALSE((*rows)[2]->order().has_value());

    REQUIRE(result.add.size() == 3);
    CHECK(result.remove.empty());
    CHECK(result.add[0].name == marked(0, "A"));
    CHECK(result.add[1].name == marked(1, "B"));
    CHECK(result.add[2].name == "C");
    CHECK(result.add[0].objectiveId == "kills");
    CHECK(result.add[0].score == 10);
    CHECK(sink.events.empty());
}

TEST_CASE("SidebarSlot second identical render is a no-op", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 10);
    source.set("C", 5);

    (void) slot.render(source, UpdateType::kNothing);
    auto result = slot.render(source, UpdateType::kNothing);

    CHECK(result.empty());
}

TEST_CASE("SidebarSlot hiding a row outside a tie only removes it", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 10);
    source.set("C", 5);
    (void) slot.render(source, UpdateType::kNothing);
    const auto cId = rowNamed(*slot.displayScores(), "C").id();

    source.hide("C");
    auto result = slot.render(source, UpdateType::kNothing);

    CHECK(namesOf(*slot.displayScores()) == std::vector<std::string>{"A", "B"});
    CHECK(idsOf(result.remove) == std::vector<core::u64>{cId});
    CHECK(result.add.empty());
}

TEST_CASE("SidebarSlot breaking a tie clears the survivor's marker", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 10);
    source.set("C", 5);
    (void) slot.render(source, UpdateType::kNothing);
    const auto before = slot.displayScores();
    const auto aId = rowNamed(*before, "A").id();
    const auto bId = rowNamed(*before, "B").id();

    source.hide("B");
    auto result = slot.render(source, UpdateType::kNothing);

    const auto rows = slot.displayScores();
    REQUIRE(namesOf(*rows) == std::vector<std::string>{"A", "C"});
    CHECK_FALSE((*rows)[0]->order().has_value());

    // the departed row first, then the re-marked row so it can be placed again
    REQUIRE(idsOf(result.remove) == std::vector<core::u64>{bId, aId});
    REQUIRE(result.add.size() == 1);
    CHECK(result.add[0].scoreboardId == aId);
    CHECK(result.add[0].name == "A");
}

TEST_CASE("SidebarSlot orders by value then by name ignoring case", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("Bob", 5);
    source.set("alice", 5);
    source.set("carol", 7);
    source.set("Dave", -1);

    (void) slot.render(source, UpdateType::kNothing);

    CHECK(namesOf(*slot.displayScores()) == std::vector<std::string>{"carol", "alice", "Bob", "Dave"});
}

TEST_CASE("SidebarSlot ignores case beyond ASCII when breaking ties", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    const std::string upperEb = "\xC3\x89" "b"; // Éb
    const std::string lowerEa = "\xC3\xA9" "a"; // éa

    FakeScoreSource source;
    source.set(upperEb, 5);
    source.set(lowerEa, 5);

    (void) slot.render(source, UpdateType::kNothing);

    CHECK(namesOf(*slot.displayScores()) == std::vector<std::string>{lowerEa, upperEb});
    CHECK(rowNamed(*slot.displayScores(), lowerEa).order() == std::optional<core::u32>{0});
}

TEST_CASE("SidebarSlot caps the sidebar and evicts the lowest rows", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    for (int i = 0; i < 40; ++i)
        source.set("p" + std::to_string(i), (i * 7) % 13);

    auto result = slot.render(source, UpdateType::kNothing);
    const auto rows = slot.displayScores();

    REQUIRE(rows->size() == 15);
    CHECK(result.add.size() == 15);

    for (core::usize i = 1; i < rows->size(); ++i)
        CHECK((*rows)[i - 1]->score() >= (*rows)[i]->score());

    // inside every run of equal values the markers count up from zero
    core::usize runStart = 0;
    for (core::usize i = 1; i <= rows->size(); ++i)
    {
        if (i < rows->size() && (*rows)[i]->score() == (*rows)[runStart]->score())
            continue;
        const auto length = i - runStart;
        for (core::usize j = runStart; j < i; ++j)
        {
            if (length > 1)
                CHECK((*rows)[j]->order() == static_cast<core::u32>(j - runStart));
            else
                CHECK_FALSE((*rows)[j]->order().has_value());
        }
        runStart = i;
    }
}

TEST_CASE("SidebarSlot honours a smaller display limit", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(true, 2), board, sink};

    FakeScoreSource source;
    source.set("A", 3);
    source.set("B", 2);
    source.set("C", 1);
    (void) slot.render(source, UpdateType::kNothing);
    CHECK(namesOf(*slot.displayScores()) == std::vector<std::string>{"A", "B"});

    // C climbs above B: B leaves, C is created
    const auto bId = rowNamed(*slot.displayScores(), "B").id();
    source.set("C", 5);
    auto result = slot.render(source, UpdateType::kNothing);

    CHECK(namesOf(*slot.displayScores()) == std::vector<std::string>{"C", "A"});
    CHECK(idsOf(result.remove) == std::vector<core::u64>{bId});
    REQUIRE(result.add.size() == 1);
    CHECK(result.add[0].name == "C");
}

TEST_CASE("SidebarSlot keeps identities stable and reissues after eviction", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 1);
    source.set("B", 2);
    (void) slot.render(source, UpdateType::kNothing);
    const auto aId = rowNamed(*slot.displayScores(), "A").id();
    const auto bId = rowNamed(*slot.displayScores(), "B").id();
    CHECK(aId != bId);

    source.set("A", 9);
    (void) slot.render(source, UpdateType::kNothing);
    CHECK(rowNamed(*slot.displayScores(), "A").id() == aId);
    CHECK(rowNamed(*slot.displayScores(), "B").id() == bId);

    source.hide("A");
    (void) slot.render(source, UpdateType::kNothing);
    source.hide("A", false);
    auto result = slot.render(source, UpdateType::kNothing);

    const auto newId = rowNamed(*slot.displayScores(), "A").id();
    CHECK(newId != aId);
    CHECK(newId != bId);
    CHECK(containsId(result.add, newId));
    CHECK_FALSE(containsId(result.remove, newId));
}

TEST_CASE("SidebarSlot sends a pure value change as an add only", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 5);
    (void) slot.render(source, UpdateType::kNothing);

    source.set("B", 12);
    auto result = slot.render(source, UpdateType::kNothing);

    CHECK(namesOf(*slot.displayScores()) == std::vector<std::string>{"B", "A"});
    REQUIRE(result.add.size() == 1);
    CHECK(result.add[0].name == "B");
    CHECK(result.add[0].score == 12);
    CHECK(result.remove.empty());
}

TEST_CASE("SidebarSlot re-adds a row whose team changed", "[display][sidebar][team]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;

    SECTION("with the reorder work-around")
    {
        SidebarSlot slot{makeConfig(true), board, sink};
        FakeScoreSource source;
        source.set("A", 10);
        source.set("B", 5);
        (void) slot.render(source, UpdateType::kNothing);

        auto red = board.registerTeam("red");
        REQUIRE(red.has_value());
        (*red)->setPrefix("[R]");
        (*red)->addEntities({"A"});
        slot.setTeamFor(*red, {"A"});

        auto result = slot.render(source, UpdateType::kNothing);

        REQUIRE(result.add.size() == 1);
        CHECK(result.add[0].name == "[R]A");
        REQUIRE(result.remove.size() == 1);
        CHECK(result.remove[0].scoreboardId == result.add[0].scoreboardId);
    }

    SECTION("without the reorder work-around")
    {
        SidebarSlot slot{makeConfig(false), board, sink};
        FakeScoreSource source;
        source.set("A", 10);
        (void) slot.render(source, UpdateType::kNothing);

        auto red = board.registerTeam("red");
        REQUIRE(red.has_value());
        (*red)->setSuffix("!");
        (*red)->addEntities({"A"});
        slot.setTeamFor(*red, {"A"});

        auto result = slot.render(source, UpdateType::kNothing);

        REQUIRE(result.add.size() == 1);
        CHECK(result.add[0].name == "A!");
        CHECK(result.remove.empty());
    }
}

TEST_CASE("SidebarSlot resolves a team when a row is created", "[display][sidebar][team]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    auto blue = board.registerTeam("blue");
    REQUIRE(blue.has_value());
    (*blue)->setPrefix("b:");
    (*blue)->addEntities({"A"});

    FakeScoreSource source;
    source.set("A", 1);
    auto result = slot.render(source, UpdateType::kNothing);

    REQUIRE(result.add.size() == 1);
    CHECK(result.add[0].name == "b:A");
    CHECK(rowNamed(*slot.displayScores(), "A").team() == *blue);
}

TEST_CASE("SidebarSlot drops a stale team", "[display][sidebar][team]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    auto red = board.registerTeam("red");
    REQUIRE(red.has_value());
    (*red)->setPrefix("[R]");
    (*red)->addEntities({"A"});

    FakeScoreSource source;
    source.set("A", 10);
    (void) slot.render(source, UpdateType::kNothing);
    REQUIRE(rowNamed(*slot.displayScores(), "A").team() != nullptr);

    SECTION("entity left the team")
    {
        (*red)->removeEntities({"A"});
    }

    SECTION("team was removed")
    {
        REQUIRE(board.removeTeam("red").has_value());
    }

    auto result = slot.render(source, UpdateType::kNothing);

    CHECK(rowNamed(*slot.displayScores(), "A").team() == nullptr);
    REQUIRE(result.add.size() == 1);
    CHECK(result.add[0].name == "A");
    CHECK(idsOf(result.remove) == idsOf(result.add));
}

TEST_CASE("SidebarSlot notices a team prefix change", "[display][sidebar][team]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    auto red = board.registerTeam("red");
    REQUIRE(red.has_value());
    (*red)->addEntities({"A"});

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 3);
    (void) slot.render(source, UpdateType::kNothing);

    (*red)->setPrefix("*");
    auto result = slot.render(source, UpdateType::kNothing);

    REQUIRE(result.add.size() == 1);
    CHECK(result.add[0].name == "*A");
    CHECK(idsOf(result.remove) == idsOf(result.add));

    CHECK(slot.render(source, UpdateType::kNothing).empty());
}

TEST_CASE("SidebarSlot setTeamFor ignores names not on the sidebar", "[display][sidebar][team]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 5);
    (void) slot.render(source, UpdateType::kNothing);

    auto red = board.registerTeam("red");
    REQUIRE(red.has_value());
    (*red)->addEntities({"Z"});
    slot.setTeamFor(*red, {"Z"});

    for (const auto &row : *slot.displayScores())
        CHECK(row->team() == nullptr);
    CHECK(slot.render(source, UpdateType::kNothing).empty());
}

TEST_CASE("SidebarSlot duplicate names reuse rows in list order", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.rows = {{"A", 5, false}, {"A", 5, false}};
    auto first = slot.render(source, UpdateType::kNothing);
    REQUIRE(first.add.size() == 2);

    const auto rows = slot.displayScores();
    const auto firstId  = (*rows)[0]->id();
    const auto secondId = (*rows)[1]->id();
    CHECK(firstId != secondId);

    // the higher entry now sorts first and claims the first matching row
    source.rows = {{"A", 5, false}, {"A", 7, false}};
    auto second = slot.render(source, UpdateType::kNothing);

    const auto after = slot.displayScores();
    REQUIRE(after->size() == 2);
    CHECK((*after)[0]->id() == firstId);
    CHECK((*after)[0]->score() == 7);
    CHECK((*after)[1]->id() == secondId);
    CHECK(second.add.size() == 2);
}

TEST_CASE("SidebarSlot emits objective directives", "[display][sidebar][objective]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 5);

    SECTION("add shows the objective and sends every row")
    {
        auto result = slot.render(source, UpdateType::kAdd);
        CHECK(sink.events == std::vector<std::string>{"create:kills:Kills"});
        CHECK(result.add.size() == 2);
        CHECK(result.remove.empty());
    }

    SECTION("update destroys and recreates without row removals")
    {
        (void) slot.render(source, UpdateType::kAdd);
        sink.events.clear();

        source.title = "Top";
        source.set("B", 11);
        auto result = slot.render(source, UpdateType::kUpdate);

        CHECK(sink.events == std::vector<std::string>{"destroy:kills", "create:kills:Top"});
        CHECK(result.add.size() == 2);
        CHECK(result.remove.empty());
    }

    SECTION("update still removes rows that left")
    {
        (void) slot.render(source, UpdateType::kAdd);
        const auto bId = rowNamed(*slot.displayScores(), "B").id();

        source.hide("B");
        auto result = slot.render(source, UpdateType::kUpdate);

        CHECK(idsOf(result.remove) == std::vector<core::u64>{bId});
        CHECK(result.add.size() == 1);
    }

    SECTION("remove destroys and forgets every row")
    {
        (void) slot.render(source, UpdateType::kAdd);
        const auto aId = rowNamed(*slot.displayScores(), "A").id();
        sink.events.clear();

        auto result = slot.render(source, UpdateType::kRemove);
        CHECK(sink.events == std::vector<std::string>{"destroy:kills"});
        CHECK(result.empty());
        CHECK(slot.displayScores()->empty());

        auto again = slot.render(source, UpdateType::kAdd);
        CHECK(again.add.size() == 2);
        CHECK(rowNamed(*slot.displayScores(), "A").id() != aId);
    }
}

TEST_CASE("SidebarSlot empties the sidebar when every score is hidden", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 5);
    (void) slot.render(source, UpdateType::kNothing);

    source.hide("A");
    source.hide("B");
    auto result = slot.render(source, UpdateType::kNothing);

    CHECK(slot.displayScores()->empty());
    CHECK(result.remove.size() == 2);
    CHECK(result.add.empty());
}

TEST_CASE("SidebarSlot published list is a stable snapshot", "[display][sidebar]")
{
    scoreboard::Scoreboard board;
    RecordingSink sink;
    SidebarSlot slot{makeConfig(), board, sink};

    FakeScoreSource source;
    source.set("A", 10);
    source.set("B", 5);
    (void) slot.render(source, UpdateType::kNothing);
    const auto held = slot.displayScores();

    source.hide("A");
    (void) slot.render(source, UpdateType::kNothing);

    CHECK(namesOf(*held) == std::vector<std::string>{"A", "B"});
    CHECK(namesOf(*slot.displayScores()) == std::vector<std::string>{"B"});
}

} // namespace sbr::display::test
