/**
 * @file SidebarFixtures.hpp
 * @brief In-memory score source and directive recorder shared by the
 *        sidebar tests.
 */

#pragma once

#include "sbr/display/ISidebarSink.hpp"
#include "sbr/display/ScoreInfo.hpp"
#include "sbr/display/SidebarSlot.hpp"
#include "sbr/scoreboard/IScoreSource.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace sbr::display::test {

/// Score source that keeps rows in insertion order and allows duplicates.
class FakeScoreSource final : public scoreboard::IScoreSource {
public:
    std::vector<scoreboard::ScoreEntry> rows;
    std::string id    = "kills";
    std::string title = "Kills";

    [[nodiscard]] std::vector<scoreboard::ScoreEntry> listScores() const override { return rows; }
    [[nodiscard]] std::string objectiveId() const override { return id; }
    [[nodiscard]] std::string displayName() const override { return title; }

    void set(const std::string &name, core::i64 score)
    {
        auto it = std::ranges::find(rows, name, &scoreboard::ScoreEntry::name);
        if (it == rows.end())
            rows.push_back({name, score, false});
        else
            it->score = score;
    }

    void hide(const std::string &name, bool hidden = true)
    {
        auto it = std::ranges::find(rows, name, &scoreboard::ScoreEntry::name);
        if (it != rows.end())
            it->hidden = hidden;
    }
};

/// Records directives as "destroy:<id>" / "create:<id>:<title>".
class RecordingSink final : public ISidebarSink {
public:
    std::vector<std::string> events;

    void emitDestroySidebar(const std::string &objectiveId) override
    {
        events.push_back("destroy:" + objectiveId);
    }

    void emitCreateOrShowSidebar(const std::string &objectiveId, const std::string &title,
                                 ScoreboardPosition, SortOrder) override
    {
        events.push_back("create:" + objectiveId + ":" + title);
    }
};

[[nodiscard]] inline std::vector<std::string> namesOf(const DisplayList &rows)
{
    std::vector<std::string> out;
    for (const auto &row : rows)
        out.push_back(row->name());
    return out;
}

[[nodiscard]] inline std::vector<core::u64> idsOf(const std::vector<ScoreInfo> &batch)
{
    std::vector<core::u64> out;
    for (const auto &info : batch)
        out.push_back(info.scoreboardId);
    return out;
}

[[nodiscard]] inline bool containsId(const std::vector<ScoreInfo> &batch, core::u64 id)
{
    return std::ranges::any_of(batch, [id](const ScoreInfo &info) { return info.scoreboardId == id; });
}

[[nodiscard]] inline const SidebarDisplayScore &rowNamed(const DisplayList &rows, const std::string &name)
{
    auto it = std::ranges::find_if(rows, [&](const auto &row) { return row->name() == name; });
    return **it;
}

[[nodiscard]] inline std::string marked(core::u32 rank, const std::string &text)
{
    return "\xC2\xA7" + std::string(1, "0123456789abcdef"[rank]) + "\xC2\xA7" "r" + text;
}

} // namespace sbr::display::test
