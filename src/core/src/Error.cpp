/**
 * @file Error.cpp
 * @brief ErrorCode names and the assertion failure path.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "sbr/core/Error.hpp"
#include "sbr/core/Assert.hpp"
#include "sbr/core/Log.hpp"

#include <cstdlib>
#include <string>

namespace sbr::core {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:              return "None";
    case ErrorCode::kInvalidArgument:   return "InvalidArgument";
    case ErrorCode::kInvalidState:      return "InvalidState";
    case ErrorCode::kNotFound:          return "NotFound";
    case ErrorCode::kAlreadyExists:     return "AlreadyExists";
    case ErrorCode::kOutOfRange:        return "OutOfRange";
    case ErrorCode::kCorruptedData:     return "CorruptedData";
    case ErrorCode::kProtocolViolation: return "ProtocolViolation";
    case ErrorCode::kInternalError:     return "InternalError";
    }
    return "Unknown";
}

std::string Error::describe() const
{
    std::string out{toString(_code)};
    out += ": ";
    out += _message;
    out += " (";
    out += _location.file_name();
    out += ':';
    out += std::to_string(_location.line());
    out += ')';
    return out;
}

namespace detail {

void assertFail(const char *expr, std::source_location loc)
{
    std::string msg;
    msg += loc.file_name();
    msg += ':';
    msg += std::to_string(loc.line());
    msg += " in ";
    msg += loc.function_name();
    msg += " - \"";
    msg += expr;
    msg += "\" failed";

    Log::fatal("ASSERT", msg);
    std::abort();
}

} // namespace detail

} // namespace sbr::core
