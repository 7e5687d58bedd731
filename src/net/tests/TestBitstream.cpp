/**
 * @file TestBitstream.cpp
 * @brief Unit tests for Bitstream.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include "sbr/net/protocol/Bitstream.hpp"

#include <string>
#include <vector>

namespace sbr::net::protocol {

TEST_CASE("Bitstream packs fields big-endian without padding", "[net][bitstream]")
{
    Bitstream writer;
    writer.writeBool(true);
    writer.writeBits(0b101, 3);
    writer.writeU8(0xAB);
    writer.writeI64(-2);
    writer.writeString("\xC2\xA7" "0hi");

    CHECK(writer.bitsWritten() == 1 + 3 + 8 + 64 + 16 + 5 * 8);
    CHECK(static_cast<core::u8>(writer.data()[0]) == 0xDA);

    Bitstream reader{writer.data(), writer.bitsWritten()};
    CHECK(reader.readBool().value());
    CHECK(reader.readBits(3).value() == 0b101);
    CHECK(reader.readU8().value() == 0xAB);
    CHECK(reader.readI64().value() == -2);
    CHECK(reader.readString().value() == "\xC2\xA7" "0hi");
    CHECK(reader.bitsRemaining() == 0);
}

TEST_CASE("Bitstream reports underflow as corrupted data", "[net][bitstream]")
{
    Bitstream writer;
    writer.writeU16(7);
    const auto bytes = writer.release();
    CHECK(writer.bitsWritten() == 0);

    Bitstream reader{bytes};
    auto value = reader.readU32();
    REQUIRE_FALSE(value.has_value());
    CHECK(value.error().code() == core::ErrorCode::kCorruptedData);
}

TEST_CASE("Bitstream rejects a string longer than the payload", "[net][bitstream]")
{
    Bitstream writer;
    writer.writeU16(40);
    writer.writeU8('x');
    const auto bytes = writer.release();

    Bitstream reader{bytes};
    auto text = reader.readString();
    REQUIRE_FALSE(text.has_value());
    CHECK(text.error().code() == core::ErrorCode::kCorruptedData);
}

} // namespace sbr::net::protocol
