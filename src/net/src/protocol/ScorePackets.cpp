// /////////////////////////////////////////////////////////////////////////////
/// @file ScorePackets.cpp
/// @brief Scoreboard packet codec.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/net/protocol/ScorePackets.hpp>
#include <sbr/net/protocol/Bitstream.hpp>

namespace sbr::net::protocol {

std::vector<core::byte> encodeSetScore(ScoreAction action,
                                       std::span<const display::ScoreInfo> entries)
{
    Bitstream stream;
    stream.writeU8(static_cast<core::u8>(action));
    stream.writeU32(static_cast<core::u32>(entries.size()));

    for (const auto& entry : entries)
    {
        stream.writeU64(entry.scoreboardId);
        if (action == ScoreAction::kRemove)
        {
            continue;
        }
        stream.writeString(entry.objectiveId);
        stream.writeI64(entry.score);
        stream.writeU8(static_cast<core::u8>(IdentityType::kFake));
        stream.writeString(entry.name);
    }

    return stream.release();
}

std::vector<core::byte> encodeSetDisplayObjective(const SetDisplayObjectivePacket& packet)
{
    Bitstream stream;
    stream.writeString(packet.slot);
    stream.writeString(packet.objectiveId);
    stream.writeString(packet.displayName);
    stream.writeString(packet.criteria);
    stream.writeU8(static_cast<core::u8>(packet.sortOrder));
    return stream.release();
}

std::vector<core::byte> encodeRemoveObjective(const RemoveObjectivePacket& packet)
{
    Bitstream stream;
    stream.writeString(packet.objectiveId);
    return stream.release();
}

core::Expected<SetScorePacket> decodeSetScore(std::span<const core::byte> payload)
{
    Bitstream stream{payload};
    SetScorePacket packet;

    const core::u8 action = SBR_TRY(stream.readU8());
    if (action > static_cast<core::u8>(ScoreAction::kRemove))
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "Unknown SetScore action " + std::to_string(action));
    }
    packet.action = static_cast<ScoreAction>(action);

    const core::u32 count = SBR_TRY(stream.readU32());
    for (core::u32 i = 0; i < count; ++i)
    {
        display::ScoreInfo entry;
        entry.scoreboardId = SBR_TRY(stream.readU64());

        if (packet.action == ScoreAction::kSet)
        {
            entry.objectiveId = SBR_TRY(stream.readString());
            entry.score       = SBR_TRY(stream.readI64());

            const core::u8 type = SBR_TRY(stream.readU8());
            if (type != static_cast<core::u8>(IdentityType::kFake))
            {
                return core::makeError(core::ErrorCode::kProtocolViolation,
                                       "Sidebar rows must be fake players");
            }
            entry.name = SBR_TRY(stream.readString());
        }

        packet.entries.push_back(std::move(entry));
    }

    return packet;
}

core::Expected<SetDisplayObjectivePacket> decodeSetDisplayObjective(std::span<const core::byte> payload)
{
    Bitstream stream{payload};
    SetDisplayObjectivePacket packet;

    packet.slot        = SBR_TRY(stream.readString());
    packet.objectiveId = SBR_TRY(stream.readString());
    packet.displayName = SBR_TRY(stream.readString());
    packet.criteria    = SBR_TRY(stream.readString());

    const core::u8 order = SBR_TRY(stream.readU8());
    if (order > static_cast<core::u8>(display::SortOrder::kDescending))
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "Unknown sort order");
    }
    packet.sortOrder = static_cast<display::SortOrder>(order);

    return packet;
}

core::Expected<RemoveObjectivePacket> decodeRemoveObjective(std::span<const core::byte> payload)
{
    Bitstream stream{payload};
    RemoveObjectivePacket packet;
    packet.objectiveId = SBR_TRY(stream.readString());
    return packet;
}

} // namespace sbr::net::protocol
