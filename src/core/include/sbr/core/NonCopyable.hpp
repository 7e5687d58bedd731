/**
 * @file NonCopyable.hpp
 * @brief CRTP bases that delete copy (and optionally move) operations.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SBR_CORE_NON_COPYABLE_HPP
    #define SBR_CORE_NON_COPYABLE_HPP

namespace sbr::core {

/**
 * @brief Inherit to disable copy construction and assignment while keeping
 *        the derived type movable.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

/**
 * @brief Inherit to pin an object in place: no copy, no move.
 *
 * Used by types whose address is handed out to other threads (display
 * scores guarded by a spin-lock, slots publishing an atomic list).
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonMovable {
protected:
    NonMovable()  = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &)  = delete;
    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)       = delete;
};

} // namespace sbr::core

#endif // SBR_CORE_NON_COPYABLE_HPP
