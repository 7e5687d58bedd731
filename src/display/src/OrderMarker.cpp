// /////////////////////////////////////////////////////////////////////////////
/// @file OrderMarker.cpp
/// @brief OrderMarker palette.
// /////////////////////////////////////////////////////////////////////////////

#include <sbr/display/OrderMarker.hpp>
#include <sbr/core/Assert.hpp>

#include <array>

namespace sbr::display {

namespace {

// "\xA7" must end its literal, otherwise the next hex digit joins the escape
constexpr std::array<std::string_view, OrderMarker::kPaletteSize> kPalette = {
    "\xC2\xA7" "0", "\xC2\xA7" "1", "\xC2\xA7" "2", "\xC2\xA7" "3",
    "\xC2\xA7" "4", "\xC2\xA7" "5", "\xC2\xA7" "6", "\xC2\xA7" "7",
    "\xC2\xA7" "8", "\xC2\xA7" "9", "\xC2\xA7" "a", "\xC2\xA7" "b",
    "\xC2\xA7" "c", "\xC2\xA7" "d", "\xC2\xA7" "e", "\xC2\xA7" "f",
};

} // anonymous namespace

std::string_view OrderMarker::forIndex(core::u32 index)
{
    SBR_VERIFY(index < kPaletteSize);
    return kPalette[index];
}

} // namespace sbr::display
