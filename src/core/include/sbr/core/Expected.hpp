/**
 * @file Expected.hpp
 * @brief Fallible results: Expected<T>, early-return macros and a logging
 *        helper for call sites that cannot propagate.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SBR_CORE_EXPECTED_HPP
    #define SBR_CORE_EXPECTED_HPP

    #include "Error.hpp"
    #include "Log.hpp"

    #include <expected>
    #include <string_view>

namespace sbr::core {

template <typename T>
using Expected = std::expected<T, Error>;

using ExpectedVoid = Expected<void>;

/**
 * @brief Logs the error held by @p result, if any.
 *
 * For top-level drivers and callbacks that have nowhere to return the
 * error to.
 *
 * @return @c true when @p result holds a value.
 */
template <typename T>
bool succeededOrLog(const Expected<T> &result, std::string_view tag,
                    LogLevel level = LogLevel::kWarn)
{
    if (result.has_value())
        return true;

    const std::string line = result.error().describe();
    switch (level)
    {
    case LogLevel::kDebug: Log::debug(tag, line); break;
    case LogLevel::kInfo:  Log::info (tag, line); break;
    case LogLevel::kWarn:  Log::warn (tag, line); break;
    case LogLevel::kError: Log::error(tag, line); break;
    case LogLevel::kFatal: Log::fatal(tag, line); break;
    }
    return false;
}

} // namespace sbr::core

/**
 * @brief Yields the value of @p expr or returns its error from the
 *        enclosing function.  @p expr is evaluated once.
 */
#define SBR_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_sbr_result = (expr);                                       \
        if (!_sbr_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_sbr_result.error()));         \
        std::move(_sbr_result.value());                                    \
    })

/// @brief SBR_TRY for ExpectedVoid expressions, used as a statement.
#define SBR_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_sbr_result = (expr);                                       \
        if (!_sbr_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_sbr_result.error()));         \
    } while (false)

#endif // SBR_CORE_EXPECTED_HPP
