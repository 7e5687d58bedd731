// /////////////////////////////////////////////////////////////////////////////
/// @file ScoreEntry.hpp
/// @brief Authoritative score row and objective lifecycle flag.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/core/Types.hpp>

#include <string>

namespace sbr::scoreboard {

// /////////////////////////////////////////////////////////////////////////////
/// @struct ScoreEntry
/// @brief One named score of an objective, as read at render time.
// /////////////////////////////////////////////////////////////////////////////
struct ScoreEntry
{
    std::string name;
    core::i64   score{0};
    bool        hidden{false};
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum UpdateType
/// @brief What happened to the whole objective since the last render.
///
/// Passed to each render and consumed there; the owner resets its copy to
/// kNothing once the render returns.
// /////////////////////////////////////////////////////////////////////////////
enum class UpdateType : core::u8
{
    kNothing,
    kAdd,
    kUpdate,
    kRemove
};

} // namespace sbr::scoreboard
