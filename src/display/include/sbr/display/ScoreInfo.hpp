// /////////////////////////////////////////////////////////////////////////////
/// @file ScoreInfo.hpp
/// @brief Outbound record describing one sidebar row.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/core/Types.hpp>

#include <string>
#include <vector>

namespace sbr::display {

// /////////////////////////////////////////////////////////////////////////////
/// @struct ScoreInfo
/// @brief Wire-level row: the client keys rows by @c scoreboardId.
///
/// A removal only needs the id; the other fields ride along because the
/// record is cached per row and reused for both directions.
// /////////////////////////////////////////////////////////////////////////////
struct ScoreInfo
{
    core::u64   scoreboardId{0};
    std::string objectiveId;
    core::i64   score{0};
    std::string name;

    [[nodiscard]] bool operator==(const ScoreInfo&) const = default;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct RenderResult
/// @brief Batches produced by one render, in transmission order.
///
/// The caller sends @c remove before @c add.
// /////////////////////////////////////////////////////////////////////////////
struct RenderResult
{
    std::vector<ScoreInfo> add;
    std::vector<ScoreInfo> remove;

    [[nodiscard]] bool empty() const noexcept { return add.empty() && remove.empty(); }
};

} // namespace sbr::display
