// /////////////////////////////////////////////////////////////////////////////
/// @file Bitstream.cpp
/// @brief Bitstream implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/net/protocol/Bitstream.hpp>
#include <sbr/core/Assert.hpp>
#include <sbr/core/Constants.hpp>

#include <utility>

namespace sbr::net::protocol {

Bitstream::Bitstream() noexcept = default;

Bitstream::Bitstream(std::span<const core::byte> data, core::u32 bitCount)
    : buffer_{data.begin(), data.end()}
    , writeBit_{bitCount}
    , totalBits_{bitCount}
    , readOnly_{true}
{
    SBR_ASSERT(bitCount <= data.size() * 8);
}

Bitstream::Bitstream(std::span<const core::byte> data)
    : Bitstream(data, static_cast<core::u32>(data.size() * 8))
{}

Bitstream::~Bitstream() = default;

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void Bitstream::writeBits(core::u32 value, core::u32 bitCount)
{
    SBR_ASSERT(!readOnly_);
    SBR_ASSERT(bitCount > 0 && bitCount <= 32);

    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const core::u32 byteIdx = writeBit_ >> 3;
        const core::u32 bitIdx  = writeBit_ & 7;

        if (byteIdx >= static_cast<core::u32>(buffer_.size()))
        {
            buffer_.push_back(core::byte{0});
        }

        const core::u32 bit = (value >> (bitCount - 1 - i)) & 1u;
        auto& b = buffer_[byteIdx];
        b = static_cast<core::byte>(
            (static_cast<core::u8>(b) & ~(1u << (7 - bitIdx))) |
            (bit << (7 - bitIdx)));

        ++writeBit_;
    }

    totalBits_ = writeBit_;
}

void Bitstream::writeBool(bool value)     { writeBits(value ? 1u : 0u, 1); }
void Bitstream::writeU8(core::u8 value)   { writeBits(value, 8); }
void Bitstream::writeU16(core::u16 value) { writeBits(value, 16); }
void Bitstream::writeU32(core::u32 value) { writeBits(value, 32); }

void Bitstream::writeU64(core::u64 value)
{
    writeU32(static_cast<core::u32>(value >> 32));
    writeU32(static_cast<core::u32>(value & 0xFFFF'FFFFu));
}

void Bitstream::writeI64(core::i64 value) { writeU64(static_cast<core::u64>(value)); }

void Bitstream::writeString(std::string_view value)
{
    SBR_VERIFY(value.size() <= core::kMaxStringLength);

    writeU16(static_cast<core::u16>(value.size()));
    for (char c : value)
    {
        writeU8(static_cast<core::u8>(c));
    }
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

core::Expected<core::u32> Bitstream::readBits(core::u32 bitCount)
{
    SBR_ASSERT(bitCount > 0 && bitCount <= 32);

    if (readBit_ + bitCount > totalBits_)
    {
        return core::makeError(core::ErrorCode::kCorruptedData, "Bitstream underflow");
    }

    core::u32 result = 0;
    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const core::u32 byteIdx = readBit_ >> 3;
        const core::u32 bitIdx  = readBit_ & 7;
        const core::u32 bit = (static_cast<core::u8>(buffer_[byteIdx]) >> (7 - bitIdx)) & 1u;
        result = (result << 1) | bit;
        ++readBit_;
    }

    return result;
}

core::Expected<bool> Bitstream::readBool()
{
    const core::u32 bit = SBR_TRY(readBits(1));
    return bit != 0;
}

core::Expected<core::u8> Bitstream::readU8()
{
    const core::u32 value = SBR_TRY(readBits(8));
    return static_cast<core::u8>(value);
}

core::Expected<core::u16> Bitstream::readU16()
{
    const core::u32 value = SBR_TRY(readBits(16));
    return static_cast<core::u16>(value);
}

core::Expected<core::u32> Bitstream::readU32()
{
    return readBits(32);
}

core::Expected<core::u64> Bitstream::readU64()
{
    const core::u64 high = SBR_TRY(readU32());
    const core::u64 low  = SBR_TRY(readU32());
    return (high << 32) | low;
}

core::Expected<core::i64> Bitstream::readI64()
{
    const core::u64 value = SBR_TRY(readU64());
    return static_cast<core::i64>(value);
}

core::Expected<std::string> Bitstream::readString()
{
    const core::u16 length = SBR_TRY(readU16());
    if (static_cast<core::u32>(length) * 8 > bitsRemaining())
    {
        return core::makeError(core::ErrorCode::kCorruptedData,
                               "String length exceeds remaining payload");
    }

    std::string out;
    out.reserve(length);
    for (core::u16 i = 0; i < length; ++i)
    {
        const core::u8 c = SBR_TRY(readU8());
        out.push_back(static_cast<char>(c));
    }
    return out;
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::u32 Bitstream::bitsWritten() const noexcept { return writeBit_; }

core::u32 Bitstream::bitsRemaining() const noexcept
{
    return (totalBits_ > readBit_) ? totalBits_ - readBit_ : 0;
}

std::span<const core::byte> Bitstream::data() const noexcept { return buffer_; }

std::vector<core::byte> Bitstream::release() noexcept
{
    writeBit_  = 0;
    readBit_   = 0;
    totalBits_ = 0;
    return std::exchange(buffer_, {});
}

} // namespace sbr::net::protocol
