/**
 * @file Constants.hpp
 * @brief Compile-time constants of the sidebar pipeline.
 *
 * Limits imposed by the target client protocol and defaults of the
 * surrounding session layer are centralised here.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SBR_CORE_CONSTANTS_HPP
    #define SBR_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace sbr::core {

inline constexpr u32 kSidebarDisplayLimit = 15;
inline constexpr u32 kOrderPaletteSize    = 16;

inline constexpr u64 kFirstScoreId        = 1;

inline constexpr u32 kDemoTickRate        = 20;
inline constexpr u32 kMaxStringLength     = 0xFFFF;

static_assert(kSidebarDisplayLimit <= kOrderPaletteSize,
              "every displayed row must be able to carry a distinct order marker");

} // namespace sbr::core

#endif // SBR_CORE_CONSTANTS_HPP
