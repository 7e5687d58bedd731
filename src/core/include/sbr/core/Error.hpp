/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Error codes cover the recoverable failures of the layers around the
 * reconciler: store mutation, configuration and wire decoding.  The
 * reconciler itself reports contract violations through Assert.hpp.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SBR_CORE_ERROR_HPP
    #define SBR_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace sbr::core {

/**
 * @brief Error codes shared by every module.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kInvalidState,
    kNotFound,
    kAlreadyExists,
    kOutOfRange,

    kCorruptedData,
    kProtocolViolation,

    kInternalError,
};

/**
 * @brief Returns a stable, human-readable name for @p code.
 */
[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

/**
 * @brief Failure reported through Expected<T>.
 *
 * Records where the failure was raised so a log line can point back at
 * the rejecting call without a debugger.
 */
class Error final {
public:
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /// @brief "Code: message (file:line)", ready for a log line.
    [[nodiscard]] std::string describe() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Wraps a new Error so it can be returned from any Expected<T>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace sbr::core

#endif // SBR_CORE_ERROR_HPP
