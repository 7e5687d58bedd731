// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief ScoreBridge sidebar demo entry-point.
///
/// Drives one session's sidebar at a fixed tick rate while a second thread
/// shuffles team membership, then prints the packets that would have been
/// sent to the client.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/display/SidebarConfig.hpp>
#include <sbr/display/SidebarSlot.hpp>
#include <sbr/net/PacketQueue.hpp>
#include <sbr/net/protocol/ScorePackets.hpp>
#include <sbr/net/session/SidebarChannel.hpp>
#include <sbr/scoreboard/Scoreboard.hpp>
#include <sbr/core/Constants.hpp>
#include <sbr/core/Expected.hpp>
#include <sbr/core/Log.hpp>
#include <sbr/core/Types.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace {

constexpr sbr::core::u32 kTicks = 40;

const std::vector<std::string> kPlayers = {
    "Alex", "bob", "Charlie", "dana", "Eve", "frank", "Grace", "heidi",
    "Ivan", "judy", "Mallory", "niaj", "Olivia", "peggy", "Rupert", "sybil",
    "Trent", "victor",
};

void logPacket(const sbr::net::QueuedPacket& packet)
{
    using namespace sbr::net::protocol;

    std::string line = "seq=" + std::to_string(packet.header.sequence) + " ";
    switch (packet.header.type)
    {
    case PacketType::RemoveObjective:
        line += "RemoveObjective";
        break;
    case PacketType::SetDisplayObjective:
    {
        auto decoded = decodeSetDisplayObjective(packet.payload);
        line += decoded ? "SetDisplayObjective slot=" + decoded->slot + " title=" + decoded->displayName
                        : "SetDisplayObjective <" + decoded.error().describe() + ">";
        break;
    }
    case PacketType::SetScore:
    {
        auto decoded = decodeSetScore(packet.payload);
        if (!decoded)
        {
            line += "SetScore <" + decoded.error().describe() + ">";
            break;
        }
        line += decoded->action == ScoreAction::kSet ? "SetScore set" : "SetScore remove";
        line += " rows=" + std::to_string(decoded->entries.size());
        break;
    }
    }
    sbr::core::Log::info("demo", line);
}

} // anonymous namespace

int main(int /*argc*/, char* /*argv*/[])
{
    using namespace sbr;

    core::Log::info("demo", "=== ScoreBridge Sidebar Demo ===");

    scoreboard::Scoreboard board;

    auto objective = board.registerObjective("kills", "Top Fraggers");
    auto red       = board.registerTeam("red");
    auto blue      = board.registerTeam("blue");
    if (!objective || !red || !blue)
    {
        core::Log::error("demo", "Scoreboard setup failed");
        return 1;
    }
    (*red)->setPrefix("\xC2\xA7" "c");
    (*blue)->setPrefix("\xC2\xA7" "9");

    auto config = display::SidebarConfig::Builder{}
        .displayLimit(core::kSidebarDisplayLimit)
        .reorderWorkaround(true)
        .build();
    if (!core::succeededOrLog(config, "demo", core::LogLevel::kError))
    {
        return 1;
    }

    net::PacketQueue              queue;
    net::session::SidebarChannel  channel{queue};
    display::SidebarSlot          slot{*config, board, channel};

    for (core::usize i = 0; i < kPlayers.size(); ++i)
    {
        if (!core::succeededOrLog((*objective)->setScore(kPlayers[i], static_cast<core::i64>(i % 5)),
                                  "demo", core::LogLevel::kError))
        {
            return 1;
        }
    }

    std::atomic<bool> running{true};
    std::thread teamShuffler{[&] {
        core::u32 round = 0;
        while (running.load(std::memory_order_acquire))
        {
            const auto& team = (round % 2 == 0) ? *red : *blue;
            const std::unordered_set<std::string> members{kPlayers[round % kPlayers.size()],
                                                          kPlayers[(round + 7) % kPlayers.size()]};
            const std::vector<std::string> memberList{members.begin(), members.end()};
            team->addEntities(memberList);
            slot.setTeamFor(team, members);
            ++round;
            std::this_thread::sleep_for(std::chrono::milliseconds{7});
        }
    }};

    const auto tick = std::chrono::milliseconds{1000 / core::kDemoTickRate};
    auto updateType = scoreboard::UpdateType::kAdd;

    for (core::u32 t = 0; t < kTicks; ++t)
    {
        const auto& player = kPlayers[(t * 5) % kPlayers.size()];
        core::succeededOrLog((*objective)->setScore(player, static_cast<core::i64>(t % 7)), "demo");
        if (t % 11 == 10)
        {
            core::succeededOrLog((*objective)->setHidden(kPlayers[t % kPlayers.size()], true), "demo");
        }
        if (t == kTicks / 2)
        {
            (*objective)->setDisplayName("Top Fraggers (half time)");
            updateType = scoreboard::UpdateType::kUpdate;
        }

        const auto result = slot.render(**objective, updateType);
        updateType = scoreboard::UpdateType::kNothing;
        channel.transmit(result);

        for (const auto& packet : queue.drain())
        {
            logPacket(packet);
        }

        std::this_thread::sleep_for(tick);
    }

    running.store(false, std::memory_order_release);
    teamShuffler.join();

    const auto result = slot.render(**objective, scoreboard::UpdateType::kRemove);
    channel.transmit(result);
    for (const auto& packet : queue.drain())
    {
        logPacket(packet);
    }

    core::Log::info("demo", "Demo exited cleanly");
    return 0;
}
