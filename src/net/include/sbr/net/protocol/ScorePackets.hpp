// /////////////////////////////////////////////////////////////////////////////
/// @file ScorePackets.hpp
/// @brief Encoding and decoding of the three scoreboard packets.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/net/protocol/Protocol.hpp>
#include <sbr/display/ScoreInfo.hpp>
#include <sbr/display/SidebarConfig.hpp>
#include <sbr/core/Types.hpp>
#include <sbr/core/Expected.hpp>

#include <span>
#include <string>
#include <vector>

namespace sbr::net::protocol {

/// @brief Decoded SetScore packet.
struct SetScorePacket
{
    ScoreAction                     action{ScoreAction::kSet};
    std::vector<display::ScoreInfo> entries;
};

/// @brief Decoded SetDisplayObjective packet.
struct SetDisplayObjectivePacket
{
    std::string        slot;
    std::string        objectiveId;
    std::string        displayName;
    std::string        criteria;
    display::SortOrder sortOrder{display::SortOrder::kDescending};
};

/// @brief Decoded RemoveObjective packet.
struct RemoveObjectivePacket
{
    std::string objectiveId;
};

/// @brief Criteria sent for every sidebar objective.
inline constexpr const char* kDummyCriteria = "dummy";

/// @brief Encodes a SetScore payload.
///
/// kSet rows carry objective id, value, identity type and text; kRemove
/// rows carry only their id, which is all the client needs to drop them.
[[nodiscard]] std::vector<core::byte> encodeSetScore(ScoreAction action,
                                                     std::span<const display::ScoreInfo> entries);

[[nodiscard]] std::vector<core::byte> encodeSetDisplayObjective(const SetDisplayObjectivePacket& packet);

[[nodiscard]] std::vector<core::byte> encodeRemoveObjective(const RemoveObjectivePacket& packet);

/// @return kCorruptedData on truncation, kProtocolViolation on an unknown
///         action or identity type.
[[nodiscard]] core::Expected<SetScorePacket> decodeSetScore(std::span<const core::byte> payload);

[[nodiscard]] core::Expected<SetDisplayObjectivePacket> decodeSetDisplayObjective(
    std::span<const core::byte> payload);

[[nodiscard]] core::Expected<RemoveObjectivePacket> decodeRemoveObjective(
    std::span<const core::byte> payload);

} // namespace sbr::net::protocol
