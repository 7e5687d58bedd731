// /////////////////////////////////////////////////////////////////////////////
/// @file Bitstream.hpp
/// @brief Bit-level serialization stream for scoreboard packets.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/core/Types.hpp>
#include <sbr/core/Expected.hpp>
#include <sbr/core/NonCopyable.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sbr::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class Bitstream
/// @brief Compact bit-level read/write stream.
///
/// Values are stored most significant bit first.  Strings are written as a
/// 16-bit byte length followed by their bytes.  Reads past the end fail with
/// kCorruptedData instead of touching memory.
// /////////////////////////////////////////////////////////////////////////////
class Bitstream final : public core::NonCopyable<Bitstream>
{
public:
    /// @brief Constructs an empty writable bitstream.
    Bitstream() noexcept;

    /// @brief Constructs a read-only bitstream over a copy of @p data.
    /// @param data     Raw bytes.
    /// @param bitCount Number of valid bits in @p data.
    Bitstream(std::span<const core::byte> data, core::u32 bitCount);

    /// @brief Read-only bitstream over every bit of @p data.
    explicit Bitstream(std::span<const core::byte> data);

    ~Bitstream();

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Writes the lower @p bitCount bits (1-32) of @p value.
    void writeBits(core::u32 value, core::u32 bitCount);

    void writeBool(bool value);
    void writeU8(core::u8 value);
    void writeU16(core::u16 value);
    void writeU32(core::u32 value);
    void writeU64(core::u64 value);

    /// @brief Writes a signed value in two's complement.
    void writeI64(core::i64 value);

    /// @brief Writes a length-prefixed string.
    /// @pre @p value is at most core::kMaxStringLength bytes.
    void writeString(std::string_view value);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<core::u32> readBits(core::u32 bitCount);
    [[nodiscard]] core::Expected<bool> readBool();
    [[nodiscard]] core::Expected<core::u8> readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::u64> readU64();
    [[nodiscard]] core::Expected<core::i64> readI64();
    [[nodiscard]] core::Expected<std::string> readString();

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::u32 bitsWritten() const noexcept;
    [[nodiscard]] core::u32 bitsRemaining() const noexcept;

    /// @brief Returns the underlying byte buffer.
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /// @brief Moves the written bytes out, leaving the stream empty.
    [[nodiscard]] std::vector<core::byte> release() noexcept;

private:
    std::vector<core::byte> buffer_;
    core::u32               writeBit_{0};
    core::u32               readBit_{0};
    core::u32               totalBits_{0};
    bool                    readOnly_{false};
};

} // namespace sbr::net::protocol
