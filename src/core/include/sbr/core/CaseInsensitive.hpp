/**
 * @file CaseInsensitive.hpp
 * @brief Locale-independent, case-insensitive ordering of UTF-8 names.
 *
 * Names are compared as UTF-16 code units.  Two units that differ are
 * folded to upper case and, if still different, to lower case; the first
 * pair that still differs decides.  A shorter name that is a prefix of the
 * other sorts first.
 *
 * Case mappings cover Basic Latin, Latin-1, Latin Extended-A, Latin
 * Extended Additional, Greek, Cyrillic and the fullwidth Latin letters.
 * Units outside those blocks compare as they are.  Malformed UTF-8 decodes
 * to U+FFFD.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SBR_CORE_CASEINSENSITIVE_HPP
    #define SBR_CORE_CASEINSENSITIVE_HPP

    #include "Types.hpp"

    #include <string_view>

namespace sbr::core {

[[nodiscard]] char16_t toUpperCase(char16_t unit) noexcept;
[[nodiscard]] char16_t toLowerCase(char16_t unit) noexcept;

/// @return Negative, zero or positive as @p lhs sorts before, equal to or
///         after @p rhs.
[[nodiscard]] int compareIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept;

[[nodiscard]] inline bool lessIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
{
    return compareIgnoreCase(lhs, rhs) < 0;
}

} // namespace sbr::core

#endif // SBR_CORE_CASEINSENSITIVE_HPP
