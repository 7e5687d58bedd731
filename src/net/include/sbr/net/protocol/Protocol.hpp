/**
 * @file Protocol.hpp
 * @brief Packet ids and header layout of the scoreboard packets sent to
 *        the client.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef SBR_NET_PROTOCOL_PROTOCOL_HPP
    #define SBR_NET_PROTOCOL_PROTOCOL_HPP

#include <sbr/core/Types.hpp>

namespace sbr::net::protocol {

/**
 * @brief Magic bytes identifying ScoreBridge frames ("SBR\0").
 */
static constexpr core::u32 kProtocolMagic = 0x53425200;

/** @brief Current framing version. */
static constexpr core::u8 kProtocolVersion = 1;

/**
 * @enum PacketType
 * @brief Client packet ids of the scoreboard packets.
 */
enum class PacketType : core::u8
{
    RemoveObjective     = 0x6A,
    SetDisplayObjective = 0x6B,
    SetScore            = 0x6C
};

/**
 * @enum ScoreAction
 * @brief First field of a SetScore payload.
 */
enum class ScoreAction : core::u8
{
    kSet    = 0,
    kRemove = 1
};

/**
 * @enum IdentityType
 * @brief What a score row refers to; sidebar rows are always fake players.
 */
enum class IdentityType : core::u8
{
    kPlayer = 1,
    kEntity = 2,
    kFake   = 3
};

/**
 * @struct PacketHeader
 * @brief Fixed-size header prepended to every packet.
 *
 * Layout (16 bytes):
 *   [magic:4][version:1][type:1][flags:1][pad:1][seq:4][payloadSize:4]
 */
struct PacketHeader
{
    core::u32  magic{kProtocolMagic};
    core::u8   version{kProtocolVersion};
    PacketType type{PacketType::SetScore};
    core::u8   flags{0};
    core::u8   padding{0};
    core::u32  sequence{0};
    core::u32  payloadSize{0};
};

static_assert(sizeof(PacketHeader) == 16, "PacketHeader must be 16 bytes");

} // namespace sbr::net::protocol

#endif // SBR_NET_PROTOCOL_PROTOCOL_HPP
