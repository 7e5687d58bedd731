// /////////////////////////////////////////////////////////////////////////////
/// @file OrderMarker.hpp
/// @brief Invisible rank markers for rows sharing the same score.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <sbr/core/Types.hpp>
#include <sbr/core/Constants.hpp>

#include <string_view>

namespace sbr::display {

// /////////////////////////////////////////////////////////////////////////////
/// @class OrderMarker
/// @brief Fixed palette of formatting codes prepended to tied rows.
///
/// The client sorts rows of equal value by their text, so prefixing the
/// n-th tied row with the n-th code of a lexicographically increasing
/// palette pins their order.  The codes render as nothing.  Some legacy
/// codes are unsupported by the client, so the palette can not grow past
/// the sixteen colour codes without picking different characters.
// /////////////////////////////////////////////////////////////////////////////
class OrderMarker final
{
public:
    OrderMarker() = delete;

    static constexpr core::u32 kPaletteSize = core::kOrderPaletteSize;

    /// @brief Code that ends a marker so it never tints the name.
    static constexpr std::string_view kReset = "\xC2\xA7" "r";

    /// @brief Marker for rank @p index within a tie run.
    /// @pre @p index < kPaletteSize.
    [[nodiscard]] static std::string_view forIndex(core::u32 index);
};

} // namespace sbr::display
