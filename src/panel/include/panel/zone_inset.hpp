#pragma once

#include "image/image.hpp"

namespace elz::panel {

inline constexpr int32_t kDefaultInsetWidth = 400;
inline constexpr int32_t kDefaultInsetBorder = 2;

/**
 * Small zone-map thumbnail for overlaying on delivery stills.
 * The map is scaled to `width` (height by aspect) and framed with a white
 * border of `border` pixels on every side.
 * Returns an empty canvas for an empty map or non-positive width.
 */
image::Canvas make_zone_inset(const image::Frame& zone_map, int32_t width = kDefaultInsetWidth,
                              int32_t border = kDefaultInsetBorder);

} // namespace elz::panel
