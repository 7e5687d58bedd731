/**
 * @file CaseInsensitive.cpp
 * @brief UTF-8 to UTF-16 decoding and simple case mapping tables.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "sbr/core/CaseInsensitive.hpp"

namespace sbr::core {

namespace {

constexpr char16_t kReplacement = 0xFFFD;

[[nodiscard]] constexpr bool inRange(char16_t c, char16_t lo, char16_t hi) noexcept
{
    return c >= lo && c <= hi;
}

// blocks where upper and lower case alternate: even = upper when evenUpper
[[nodiscard]] constexpr char16_t pairedUpper(char16_t c, bool evenUpper) noexcept
{
    const bool isEven = (c % 2) == 0;
    return (isEven == evenUpper) ? c : static_cast<char16_t>(c - 1);
}

[[nodiscard]] constexpr char16_t pairedLower(char16_t c, bool evenUpper) noexcept
{
    const bool isEven = (c % 2) == 0;
    return (isEven == evenUpper) ? static_cast<char16_t>(c + 1) : c;
}

[[nodiscard]] constexpr char16_t shift(char16_t c, int delta) noexcept
{
    return static_cast<char16_t>(static_cast<int>(c) + delta);
}

/**
 * @brief Streams a UTF-8 string as UTF-16 code units.
 */
class Utf16Reader final {
public:
    explicit Utf16Reader(std::string_view text) noexcept : _text(text) {}

    bool next(char16_t &out) noexcept
    {
        if (_pendingLow != 0)
        {
            out = _pendingLow;
            _pendingLow = 0;
            return true;
        }
        if (_pos >= _text.size())
            return false;

        const auto lead = static_cast<u8>(_text[_pos]);
        u32 codePoint = 0;
        usize length = 0;
        if (lead < 0x80)                { codePoint = lead;        length = 1; }
        else if ((lead & 0xE0) == 0xC0) { codePoint = lead & 0x1F; length = 2; }
        else if ((lead & 0xF0) == 0xE0) { codePoint = lead & 0x0F; length = 3; }
        else if ((lead & 0xF8) == 0xF0) { codePoint = lead & 0x07; length = 4; }
        else
            return replace(out);

        if (_pos + length > _text.size())
            return replace(out);

        for (usize i = 1; i < length; ++i)
        {
            const auto cont = static_cast<u8>(_text[_pos + i]);
            if ((cont & 0xC0) != 0x80)
                return replace(out);
            codePoint = (codePoint << 6) | (cont & 0x3F);
        }
        _pos += length;

        static constexpr u32 kShortest[] = {0, 0, 0x80, 0x800, 0x10000};
        if (codePoint < kShortest[length] || codePoint > 0x10FFFF
            || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
        {
            out = kReplacement;
            return true;
        }

        if (codePoint >= 0x10000)
        {
            codePoint -= 0x10000;
            out         = static_cast<char16_t>(0xD800 + (codePoint >> 10));
            _pendingLow = static_cast<char16_t>(0xDC00 + (codePoint & 0x3FF));
            return true;
        }

        out = static_cast<char16_t>(codePoint);
        return true;
    }

private:
    // skips the offending lead byte only
    bool replace(char16_t &out) noexcept
    {
        ++_pos;
        out = kReplacement;
        return true;
    }

    std::string_view _text;
    usize            _pos{0};
    char16_t         _pendingLow{0};
};

} // anonymous namespace

char16_t toUpperCase(char16_t c) noexcept
{
    if (c < 0x80)
        return inRange(c, u'a', u'z') ? shift(c, -0x20) : c;

    // Latin-1
    if (c == 0xB5)                           return 0x39C;
    if (inRange(c, 0xE0, 0xFE) && c != 0xF7) return shift(c, -0x20);
    if (c == 0xFF)                           return 0x178;

    // Latin Extended-A
    if (inRange(c, 0x100, 0x17F))
    {
        if (c == 0x131) return u'I';
        if (c == 0x17F) return u'S';
        if (c == 0x130 || c == 0x138 || c == 0x149 || c == 0x178)
            return c;
        if (inRange(c, 0x139, 0x148) || inRange(c, 0x179, 0x17E))
            return pairedUpper(c, false);
        return pairedUpper(c, true);
    }

    // Greek
    if (inRange(c, 0x3B1, 0x3C9)) return c == 0x3C2 ? char16_t{0x3A3} : shift(c, -0x20);
    if (c == 0x3AC)               return 0x386;
    if (inRange(c, 0x3AD, 0x3AF)) return shift(c, -0x25);
    if (c == 0x3CC)               return 0x38C;
    if (inRange(c, 0x3CD, 0x3CE)) return shift(c, -0x3F);

    // Cyrillic
    if (inRange(c, 0x430, 0x44F)) return shift(c, -0x20);
    if (inRange(c, 0x450, 0x45F)) return shift(c, -0x50);
    if (inRange(c, 0x460, 0x481) || inRange(c, 0x48A, 0x4BF) || inRange(c, 0x4D0, 0x52F))
        return pairedUpper(c, true);
    if (c == 0x4CF)               return 0x4C0;
    if (inRange(c, 0x4C1, 0x4CE)) return pairedUpper(c, false);

    // Latin Extended Additional
    if (inRange(c, 0x1E00, 0x1E95) || inRange(c, 0x1EA0, 0x1EFF))
        return pairedUpper(c, true);

    // fullwidth Latin
    if (inRange(c, 0xFF41, 0xFF5A)) return shift(c, -0x20);

    return c;
}

char16_t toLowerCase(char16_t c) noexcept
{
    if (c < 0x80)
        return inRange(c, u'A', u'Z') ? shift(c, 0x20) : c;

    if (inRange(c, 0xC0, 0xDE) && c != 0xD7) return shift(c, 0x20);

    if (inRange(c, 0x100, 0x17F))
    {
        if (c == 0x130) return u'i';
        if (c == 0x178) return 0xFF;
        if (c == 0x131 || c == 0x138 || c == 0x149 || c == 0x17F)
            return c;
        if (inRange(c, 0x139, 0x148) || inRange(c, 0x179, 0x17E))
            return pairedLower(c, false);
        return pairedLower(c, true);
    }

    if (inRange(c, 0x391, 0x3A9) && c != 0x3A2) return shift(c, 0x20);
    if (c == 0x386)               return 0x3AC;
    if (inRange(c, 0x388, 0x38A)) return shift(c, 0x25);
    if (c == 0x38C)               return 0x3CC;
    if (inRange(c, 0x38E, 0x38F)) return shift(c, 0x3F);

    if (inRange(c, 0x410, 0x42F)) return shift(c, 0x20);
    if (inRange(c, 0x400, 0x40F)) return shift(c, 0x50);
    if (inRange(c, 0x460, 0x481) || inRange(c, 0x48A, 0x4BF) || inRange(c, 0x4D0, 0x52F))
        return pairedLower(c, true);
    if (c == 0x4C0)               return 0x4CF;
    if (inRange(c, 0x4C1, 0x4CE)) return pairedLower(c, false);

    if (inRange(c, 0x1E00, 0x1E95) || inRange(c, 0x1EA0, 0x1EFF))
        return pairedLower(c, true);

    if (inRange(c, 0xFF21, 0xFF3A)) return shift(c, 0x20);

    return c;
}

int compareIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
{
    Utf16Reader left{lhs};
    Utf16Reader right{rhs};

    for (;;)
    {
        char16_t a = 0;
        char16_t b = 0;
        const bool hasLeft  = left.next(a);
        const bool hasRight = right.next(b);
        if (!hasLeft || !hasRight)
            return static_cast<int>(hasLeft) - static_cast<int>(hasRight);

        if (a == b)
            continue;
        a = toUpperCase(a);
        b = toUpperCase(b);
        if (a == b)
            continue;
        a = toLowerCase(a);
        b = toLowerCase(b);
        if (a != b)
            return static_cast<int>(a) - static_cast<int>(b);
    }
}

} // namespace sbr::core
